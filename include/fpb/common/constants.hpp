#pragma once

#include <cstddef>

namespace fpb {
namespace constants {

namespace system {
    constexpr const char* APPLICATION_NAME = "fpb";
    constexpr const char* WRAPPED_PROGRAM = "ffmpeg";
    constexpr const char* LOGGER_NAME = "fpb";
}

namespace patterns {
    constexpr const char* DURATION = R"(Duration: (\d{2}):(\d{2}):(\d{2})\.\d{2})";
    constexpr const char* POSITION = R"(time=(\d{2}):(\d{2}):(\d{2})\.\d{2})";
    constexpr const char* SOURCE_OPEN = "from '";
    constexpr const char* SOURCE_CLOSE = "':";
    constexpr const char* FRAME_RATE = R"((\d{2}\.\d{2}|\d{2}) fps)";
    constexpr const char* PROMPT_SUFFIX = "[y/N] ";
}

namespace exit_codes {
    constexpr int SUCCESS = 0;
    constexpr int FAILURE = 1;
    constexpr int SIGNAL_BASE = 128;
}

namespace limits {
    constexpr int DEFAULT_RENDER_INTERVAL_MS = 50;
    constexpr int DEFAULT_TERMINAL_WIDTH = 80;
    constexpr int DEFAULT_TERMINAL_HEIGHT = 24;
    constexpr int MIN_TERMINAL_WIDTH = 20;
    constexpr int MIN_BAR_WIDTH = 5;
    constexpr size_t MAX_LABEL_LENGTH = 30;
    constexpr size_t TRUNCATED_LABEL_LENGTH = 27;
    constexpr size_t READ_CHUNK_SIZE = 4096;
    constexpr int SUPERVISOR_POLL_INTERVAL_MS = 50;
}

namespace config_defaults {
    constexpr const char* WRAPPED_PROGRAM = system::WRAPPED_PROGRAM;
    
    constexpr int RENDER_MIN_INTERVAL_MS = limits::DEFAULT_RENDER_INTERVAL_MS;
    constexpr int RENDER_FALLBACK_WIDTH = limits::DEFAULT_TERMINAL_WIDTH;
    constexpr int RENDER_FALLBACK_HEIGHT = limits::DEFAULT_TERMINAL_HEIGHT;
    constexpr int RENDER_MIN_TERMINAL_WIDTH = limits::MIN_TERMINAL_WIDTH;
    constexpr int RENDER_MIN_BAR_WIDTH = limits::MIN_BAR_WIDTH;
    constexpr size_t RENDER_MAX_LABEL_LENGTH = limits::MAX_LABEL_LENGTH;
    constexpr size_t RENDER_TRUNCATED_LABEL_LENGTH = limits::TRUNCATED_LABEL_LENGTH;
    constexpr const char* RENDER_DEFAULT_DESCRIPTION = "Processing";
    
    constexpr const char* PROMPT_SUFFIX = patterns::PROMPT_SUFFIX;
}

}
}
