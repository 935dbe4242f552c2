#include "ErrorHandler.hpp"

namespace kvmrpc {

bool ErrorHandler::isConnectionError(int vir_error) {
    switch (vir_error) {
        case VIR_ERR_NO_CONNECT:
        case VIR_ERR_INVALID_CONN:
        case VIR_ERR_SYSTEM_ERROR:
        case VIR_ERR_RPC:
        case VIR_ERR_AUTH_FAILED:
        case VIR_ERR_AUTH_CANCELLED:
        case VIR_ERR_AUTH_UNAVAILABLE:
            return true;
        default:
            return false;
    }
}

bool ErrorHandler::isNotFound(int vir_error) {
    switch (vir_error) {
        case VIR_ERR_NO_DOMAIN:
        case VIR_ERR_NO_NETWORK:
        case VIR_ERR_NO_STORAGE_POOL:
        case VIR_ERR_NO_STORAGE_VOL:
            return true;
        default:
            return false;
    }
}

std::string ErrorHandler::getErrorMessage(int vir_error) {
    switch (vir_error) {
        case VIR_ERR_OK:
            return "Success";
        case VIR_ERR_NO_CONNECT:
            return "Failed to connect to hypervisor";
        case VIR_ERR_INVALID_CONN:
            return "Invalid connection";
        case VIR_ERR_SYSTEM_ERROR:
            return "System error";
        case VIR_ERR_RPC:
            return "RPC error";
        case VIR_ERR_AUTH_FAILED:
            return "Authentication failed";
        case VIR_ERR_NO_DOMAIN:
            return "Domain not found";
        case VIR_ERR_OPERATION_INVALID:
            return "Operation not valid in current domain state";
        case VIR_ERR_OPERATION_FAILED:
            return "Operation failed";
        case VIR_ERR_OPERATION_TIMEOUT:
            return "Operation timed out";
        case VIR_ERR_XML_ERROR:
            return "Invalid domain XML";
        case VIR_ERR_DOM_EXIST:
            return "Domain already exists";
        default:
            return "libvirt error " + std::to_string(vir_error);
    }
}

std::string ErrorHandler::lastErrorMessage() {
    virErrorPtr err = virGetLastError();
    if (err && err->message) {
        return std::string(err->message);
    }
    return getErrorMessage(lastErrorCode());
}

int ErrorHandler::lastErrorCode() {
    virErrorPtr err = virGetLastError();
    return err ? err->code : VIR_ERR_OK;
}

HypervisorException::HypervisorException(int error_code, const std::string& message)
    : std::runtime_error(message)
    , m_errorCode(error_code) {
}

HypervisorException HypervisorException::fromLastError(const std::string& context) {
    int code = ErrorHandler::lastErrorCode();
    std::string message = ErrorHandler::lastErrorMessage();
    if (!context.empty()) {
        message = context + ": " + message;
    }
    return HypervisorException(code, message);
}

ConnectionError::ConnectionError(const std::string& message, int error_code)
    : std::runtime_error(message)
    , m_errorCode(error_code) {
}

}  // namespace kvmrpc
