#pragma once

#include <string>
#include <chrono>

namespace fpb {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

struct RenderConfig {
    std::chrono::milliseconds min_interval;
    int fallback_width;
    int fallback_height;
    int min_terminal_width;
    int min_bar_width;
    size_t max_label_length;
    size_t truncated_label_length;
    std::string default_description;
};

struct PromptConfig {
    std::string suffix;
};

struct GlobalConfig {
    std::string wrapped_program;
    LogLevel log_level;
    RenderConfig render;
    PromptConfig prompt;
};

class Config {
public:
    static Config& instance();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
};

}}
