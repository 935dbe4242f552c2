#include "Logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <iostream>
#include <memory>
#include <utility>
#include <vector>

namespace kvmrpc {

void setupLogging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);

    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        sinks.push_back(console_sink);

        if (!config.file.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.file, config.max_file_size, config.max_files);
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << config.file << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("kvm-rpc", sinks.begin(), sinks.end());
        logger->set_level(level);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

OperationTimer::OperationTimer(std::string operation)
    : m_operation(std::move(operation))
    , m_start(std::chrono::steady_clock::now()) {
}

OperationTimer::~OperationTimer() {
    spdlog::debug("{} took {:.4f} seconds", m_operation, elapsedSeconds());
}

double OperationTimer::elapsedSeconds() const {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - m_start;
    return elapsed.count();
}

}  // namespace kvmrpc
