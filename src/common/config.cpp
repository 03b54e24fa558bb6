#include "fpb/common/config.hpp"
#include "fpb/common/constants.hpp"

namespace fpb {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.wrapped_program = WRAPPED_PROGRAM;
    config.log_level = LogLevel::WARN;
    
    config.render.min_interval = std::chrono::milliseconds(RENDER_MIN_INTERVAL_MS);
    config.render.fallback_width = RENDER_FALLBACK_WIDTH;
    config.render.fallback_height = RENDER_FALLBACK_HEIGHT;
    config.render.min_terminal_width = RENDER_MIN_TERMINAL_WIDTH;
    config.render.min_bar_width = RENDER_MIN_BAR_WIDTH;
    config.render.max_label_length = RENDER_MAX_LABEL_LENGTH;
    config.render.truncated_label_length = RENDER_TRUNCATED_LABEL_LENGTH;
    config.render.default_description = RENDER_DEFAULT_DESCRIPTION;
    
    config.prompt.suffix = PROMPT_SUFFIX;
    
    return config;
}

}}
