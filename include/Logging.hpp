#pragma once

#include "Config.hpp"
#include <chrono>
#include <string>

namespace kvmrpc {

// Install the default "kvm-rpc" logger. stdout is left alone: it carries RPC responses.
void setupLogging(const LoggingConfig& config);

// Logs the lifetime of an operation at debug level
class OperationTimer {
public:
    explicit OperationTimer(std::string operation);
    ~OperationTimer();

    OperationTimer(const OperationTimer&) = delete;
    OperationTimer& operator=(const OperationTimer&) = delete;

    double elapsedSeconds() const;

private:
    std::string m_operation;
    std::chrono::steady_clock::time_point m_start;
};

}  // namespace kvmrpc
