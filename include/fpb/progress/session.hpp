#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <cstdint>

namespace fpb {
namespace progress {

enum class ProgressUnit {
    SECONDS,
    FRAMES
};

const char* unitToString(ProgressUnit unit);

// Facts learned from the diagnostic stream. Each field is set at most once;
// zero or empty means not yet known.
struct Session {
    int64_t total_duration_seconds = 0;
    std::string source_name;
    int frame_rate = 0;
    std::optional<std::chrono::steady_clock::time_point> start_time;
};

struct ProgressSample {
    int64_t current = 0;
    int64_t total = 0;
    ProgressUnit unit = ProgressUnit::SECONDS;
};

}}
