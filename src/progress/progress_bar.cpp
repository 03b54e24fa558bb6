#include "fpb/progress/progress_bar.hpp"
#include "fpb/common/terminal.hpp"
#include "fpb/common/text_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <unistd.h>

namespace fpb {
namespace progress {

ProgressBarRenderer::ProgressBarRenderer(const std::string& description, int64_t total, ProgressUnit unit,
                                         std::shared_ptr<const common::TextStyle> style,
                                         std::ostream& out, RendererOptions options)
    : description_(description),
      total_(total),
      current_(0),
      unit_(unit),
      style_(style ? std::move(style) : common::makeTextStyle(false)),
      out_(out),
      options_(std::move(options)) {
    if (!options_.width_provider) {
        common::TerminalSize fallback{options_.config.fallback_width, options_.config.fallback_height};
        options_.width_provider = [fallback]() { return common::getTerminalSize(STDOUT_FILENO, fallback).width; };
    }
    if (!options_.clock) {
        options_.clock = []() { return std::chrono::steady_clock::now(); };
    }
    start_time_ = options_.clock();
}

void ProgressBarRenderer::update(int64_t current) {
    current_ = current;
    
    auto now = options_.clock();
    if (last_render_ && now - *last_render_ < options_.config.min_interval) {
        return;
    }
    last_render_ = now;
    
    render();
}

void ProgressBarRenderer::finish() {
    current_ = total_;
    render();
    out_ << "\n" << std::flush;
}

void ProgressBarRenderer::render() {
    out_ << common::ansi::CLEAR_LINE << composeLine() << std::flush;
}

double ProgressBarRenderer::percentage() const {
    if (total_ <= 0) {
        return 0.0;
    }
    return static_cast<double>(current_) / static_cast<double>(total_) * 100.0;
}

std::string ProgressBarRenderer::composeLine() const {
    int terminal_width = options_.width_provider();
    double percent = percentage();
    
    std::string info = formatInfo(percent, options_.clock());
    std::string label = truncateLabel(description_, options_.config);
    
    int bar_width = computeBarWidth(terminal_width, common::displayLength(label),
                                    common::displayLength(info), options_.config);
    
    int filled = static_cast<int>(bar_width * percent / 100.0);
    std::string bar = buildBar(filled, bar_width, *style_);
    
    return label + " " + bar + info;
}

std::string ProgressBarRenderer::formatInfo(double percent, std::chrono::steady_clock::time_point now) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_time_);
    
    std::chrono::nanoseconds remaining{0};
    if (current_ > 0 && total_ > 0) {
        double scaled = static_cast<double>(elapsed.count()) *
                        static_cast<double>(total_ - current_) / static_cast<double>(current_);
        remaining = std::chrono::nanoseconds(static_cast<int64_t>(scaled));
    }
    
    double elapsed_seconds = std::chrono::duration<double>(elapsed).count();
    double rate = elapsed_seconds > 0.0 ? static_cast<double>(current_) / elapsed_seconds : 0.0;
    
    return fmt::format(" {} {} {}/{} {} {} {} ETA {}",
                       style_->paint(common::Tone::PERCENTAGE, fmt::format("{:.1f}%", percent)),
                       glyphs::SEPARATOR,
                       current_, total_,
                       glyphs::SEPARATOR,
                       style_->paint(common::Tone::RATE, fmt::format("{:.0f}{}", rate, rateSuffix())),
                       glyphs::SEPARATOR,
                       style_->paint(common::Tone::ETA, formatEta(remaining)));
}

const char* ProgressBarRenderer::rateSuffix() const {
    return unit_ == ProgressUnit::FRAMES ? "fps" : "s/s";
}

std::string ProgressBarRenderer::truncateLabel(const std::string& description, const common::RenderConfig& config) {
    if (common::utf8Length(description) > config.max_label_length) {
        return common::utf8Prefix(description, config.truncated_label_length) + "...";
    }
    return description;
}

std::string ProgressBarRenderer::formatEta(std::chrono::nanoseconds remaining) {
    if (remaining.count() < 0) {
        return "00:00";
    }
    
    auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(remaining).count();
    return fmt::format("{:02d}:{:02d}", total_seconds / 60, total_seconds % 60);
}

int ProgressBarRenderer::computeBarWidth(int terminal_width, size_t label_length, size_t info_length,
                                         const common::RenderConfig& config) {
    int reserved = static_cast<int>(label_length) + 1 + static_cast<int>(info_length);
    int space = terminal_width - reserved;
    
    if (space < config.min_bar_width || terminal_width < config.min_terminal_width) {
        space = config.fallback_width - reserved;
        space = std::max(space, config.min_bar_width);
    }
    
    return space;
}

std::string ProgressBarRenderer::buildBar(int filled, int width, const common::TextStyle& style) {
    if (width <= 0) {
        return "";
    }
    
    filled = std::clamp(filled, 0, width);
    
    std::string bar = style.paint(common::Tone::BAR, common::repeatString(glyphs::FILLED, filled));
    if (filled < width) {
        bar += style.paint(common::Tone::BAR, glyphs::EDGE);
        bar += common::repeatString(glyphs::FILLED, width - filled - 1);
    }
    
    return bar;
}

}}
