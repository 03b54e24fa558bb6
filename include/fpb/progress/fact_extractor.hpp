#pragma once

#include "session.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace fpb {
namespace progress {

// (hours * 60 + minutes) * 60 + seconds
int64_t toSeconds(int64_t hours, int64_t minutes, int64_t seconds);

class FactExtractor {
public:
    FactExtractor() = default;
    
    // Learns missing session facts from the line and returns the playback
    // position in seconds when the line carries one.
    std::optional<int64_t> apply(const std::string& line, Session& session) const;
    
    std::optional<int64_t> matchDuration(const std::string& line) const;
    std::optional<std::string> matchSource(const std::string& line) const;
    std::optional<int> matchFrameRate(const std::string& line) const;
    std::optional<int64_t> matchPosition(const std::string& line) const;
};

}}
