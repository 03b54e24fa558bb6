#pragma once

#include "session.hpp"
#include "../common/config.hpp"
#include "../common/text_style.hpp"
#include <string>
#include <chrono>
#include <ostream>
#include <memory>
#include <functional>
#include <optional>
#include <cstdint>

namespace fpb {
namespace progress {

namespace glyphs {
    constexpr const char* FILLED = "━";
    constexpr const char* EDGE = "╸";
    constexpr const char* SEPARATOR = "•";
}

using WidthProvider = std::function<int()>;
using Clock = std::function<std::chrono::steady_clock::time_point()>;

struct RendererOptions {
    common::RenderConfig config;
    WidthProvider width_provider;
    Clock clock;
};

class ProgressBarRenderer {
public:
    ProgressBarRenderer(const std::string& description, int64_t total, ProgressUnit unit,
                        std::shared_ptr<const common::TextStyle> style,
                        std::ostream& out, RendererOptions options);
    
    // Drops the redraw when the previous one is younger than min_interval.
    void update(int64_t current);
    void finish();
    
    void render();
    std::string composeLine() const;
    
    int64_t current() const { return current_; }
    int64_t total() const { return total_; }
    ProgressUnit unit() const { return unit_; }
    const std::string& description() const { return description_; }
    std::chrono::steady_clock::time_point startTime() const { return start_time_; }
    double percentage() const;
    
    static std::string truncateLabel(const std::string& description, const common::RenderConfig& config);
    static std::string formatEta(std::chrono::nanoseconds remaining);
    static int computeBarWidth(int terminal_width, size_t label_length, size_t info_length,
                               const common::RenderConfig& config);
    static std::string buildBar(int filled, int width, const common::TextStyle& style);

private:
    std::string description_;
    int64_t total_;
    int64_t current_;
    ProgressUnit unit_;
    
    std::shared_ptr<const common::TextStyle> style_;
    std::ostream& out_;
    RendererOptions options_;
    
    std::chrono::steady_clock::time_point start_time_;
    std::optional<std::chrono::steady_clock::time_point> last_render_;
    
    std::string formatInfo(double percentage, std::chrono::steady_clock::time_point now) const;
    const char* rateSuffix() const;
};

}}
