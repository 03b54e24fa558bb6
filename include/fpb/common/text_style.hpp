#pragma once

#include <memory>
#include <string>

namespace fpb {
namespace common {

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* BLUE = "\033[34m";
    constexpr const char* BRIGHT_RED = "\033[91m";
    constexpr const char* BRIGHT_YELLOW = "\033[93m";
    constexpr const char* CLEAR_LINE = "\r\033[K";
}

enum class Tone {
    PERCENTAGE,
    RATE,
    ETA,
    BAR,
    PROMPT,
    ALERT
};

class TextStyle {
public:
    virtual ~TextStyle() = default;
    
    virtual std::string paint(Tone tone, const std::string& text) const = 0;
    virtual bool isDecorated() const = 0;
};

class PlainTextStyle : public TextStyle {
public:
    std::string paint(Tone tone, const std::string& text) const override;
    bool isDecorated() const override { return false; }
};

class AnsiTextStyle : public TextStyle {
public:
    std::string paint(Tone tone, const std::string& text) const override;
    bool isDecorated() const override { return true; }

private:
    static std::string codeFor(Tone tone);
};

std::shared_ptr<const TextStyle> makeTextStyle(bool use_colors);

}}
