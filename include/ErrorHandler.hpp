#pragma once

#include <libvirt/virterror.h>
#include <stdexcept>
#include <string>

namespace kvmrpc {

// libvirt error classification
class ErrorHandler {
public:
    // Check if error indicates the daemon connection itself is unusable
    static bool isConnectionError(int virError);

    // Check if error means the requested domain does not exist
    static bool isNotFound(int virError);

    // Get human-readable error message
    static std::string getErrorMessage(int virError);

    // Message and code of the last error raised by libvirt on this thread
    static std::string lastErrorMessage();
    static int lastErrorCode();
};

// Hypervisor-domain failure (unknown domain, invalid state, ...)
class HypervisorException : public std::runtime_error {
public:
    HypervisorException(int errorCode, const std::string& message);

    // Build from virGetLastError(), prefixed with context
    static HypervisorException fromLastError(const std::string& context);

    int errorCode() const { return m_errorCode; }
    bool isNotFound() const { return ErrorHandler::isNotFound(m_errorCode); }

private:
    int m_errorCode;
};

// Failure to open a handle to the hypervisor daemon
class ConnectionError : public std::runtime_error {
public:
    explicit ConnectionError(const std::string& message, int errorCode = VIR_ERR_NO_CONNECT);

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

}  // namespace kvmrpc
