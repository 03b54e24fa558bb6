#include "fpb/common/text_style.hpp"

namespace fpb {
namespace common {

std::string PlainTextStyle::paint(Tone, const std::string& text) const {
    return text;
}

std::string AnsiTextStyle::paint(Tone tone, const std::string& text) const {
    if (text.empty()) {
        return text;
    }
    return codeFor(tone) + text + ansi::RESET;
}

std::string AnsiTextStyle::codeFor(Tone tone) {
    switch (tone) {
        case Tone::PERCENTAGE: return ansi::YELLOW;
        case Tone::RATE: return ansi::RED;
        case Tone::ETA: return ansi::BLUE;
        case Tone::BAR: return ansi::GREEN;
        case Tone::PROMPT: return std::string(ansi::BRIGHT_YELLOW) + ansi::BOLD;
        case Tone::ALERT: return std::string(ansi::BRIGHT_RED) + ansi::BOLD;
    }
    return ansi::RESET;
}

std::shared_ptr<const TextStyle> makeTextStyle(bool use_colors) {
    if (use_colors) {
        return std::make_shared<AnsiTextStyle>();
    }
    return std::make_shared<PlainTextStyle>();
}

}}
