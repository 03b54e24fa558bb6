#include "fpb/progress/fact_extractor.hpp"
#include "fpb/common/constants.hpp"
#include "fpb/common/logger.hpp"
#include <regex>
#include <filesystem>
#include <stdexcept>

namespace fpb {
namespace progress {

namespace {

struct Patterns {
    std::regex duration{constants::patterns::DURATION};
    std::regex position{constants::patterns::POSITION};
    std::regex frame_rate{constants::patterns::FRAME_RATE};
};

const Patterns& patterns() {
    static const Patterns instance;
    return instance;
}

std::optional<int64_t> matchTimestamp(const std::regex& pattern, const std::string& line) {
    std::smatch match;
    if (!std::regex_search(line, match, pattern) || match.size() < 4) {
        return std::nullopt;
    }
    
    try {
        return toSeconds(std::stoll(match[1].str()),
                         std::stoll(match[2].str()),
                         std::stoll(match[3].str()));
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::string baseName(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return std::filesystem::path(path).filename().string();
}

}

int64_t toSeconds(int64_t hours, int64_t minutes, int64_t seconds) {
    return (hours * 60 + minutes) * 60 + seconds;
}

std::optional<int64_t> FactExtractor::apply(const std::string& line, Session& session) const {
    auto& logger = common::Logger::instance();
    
    if (session.total_duration_seconds == 0) {
        if (auto duration = matchDuration(line)) {
            session.total_duration_seconds = *duration;
            if (*duration > 0) {
                logger.debug("[Facts] Duration learned | seconds={}", *duration);
            }
        }
    }
    
    if (session.source_name.empty()) {
        if (auto source = matchSource(line)) {
            session.source_name = *source;
            logger.debug("[Facts] Source learned | name={}", *source);
        }
    }
    
    if (session.frame_rate == 0) {
        if (auto fps = matchFrameRate(line)) {
            session.frame_rate = *fps;
            if (*fps > 0) {
                logger.debug("[Facts] Frame rate learned | fps={}", *fps);
            }
        }
    }
    
    return matchPosition(line);
}

std::optional<int64_t> FactExtractor::matchDuration(const std::string& line) const {
    return matchTimestamp(patterns().duration, line);
}

std::optional<int64_t> FactExtractor::matchPosition(const std::string& line) const {
    return matchTimestamp(patterns().position, line);
}

std::optional<std::string> FactExtractor::matchSource(const std::string& line) const {
    // The quoted path may itself contain "':", the last one closes it.
    auto open = line.find(constants::patterns::SOURCE_OPEN);
    if (open == std::string::npos) {
        return std::nullopt;
    }
    auto start = open + std::char_traits<char>::length(constants::patterns::SOURCE_OPEN);
    auto close = line.rfind(constants::patterns::SOURCE_CLOSE);
    if (close == std::string::npos || close < start) {
        return std::nullopt;
    }
    
    std::string name = baseName(line.substr(start, close - start));
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::optional<int> FactExtractor::matchFrameRate(const std::string& line) const {
    std::smatch match;
    if (!std::regex_search(line, match, patterns().frame_rate) || match.size() < 2) {
        return std::nullopt;
    }
    
    try {
        return static_cast<int>(std::stod(match[1].str()));
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}}
