#include "fpb/common/logger.hpp"
#include "fpb/common/constants.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace fpb {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogLevel level, spdlog::sink_ptr sink) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    if (logger_) {
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }

    auto spdlog_level = toSpdlogLevel(level);
    
    try {
        if (!sink) {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }
        sink->set_level(spdlog_level);
        
        logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger_->set_level(spdlog_level);
        
        spdlog::register_logger(logger_);
        initialized_ = true;
        
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Initialization failed: " << ex.what() << std::endl;
        logger_.reset();
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::warn;
    }
}

}}
