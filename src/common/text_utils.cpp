#include "fpb/common/text_utils.hpp"
#include <regex>

namespace fpb {
namespace common {

namespace {

const std::regex& csiPattern() {
    static const std::regex pattern(R"(\x1b\[[0-9;]*[mGKHfABCDEFGJSTuhlp])");
    return pattern;
}

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}

std::string stripAnsi(const std::string& text) {
    std::string without_sequences = std::regex_replace(text, csiPattern(), "");
    
    std::string result;
    result.reserve(without_sequences.size());
    
    for (size_t i = 0; i < without_sequences.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(without_sequences[i]);
        
        if (c == 0x1B) {
            continue;
        }
        
        if (c < 0x80) {
            result += static_cast<char>(c);
            continue;
        }
        
        result += ' ';
        if (c >= 0xC0) {
            while (i + 1 < without_sequences.size() &&
                   isContinuationByte(static_cast<unsigned char>(without_sequences[i + 1]))) {
                ++i;
            }
        }
    }
    
    return result;
}

size_t displayLength(const std::string& text) {
    return stripAnsi(text).size();
}

size_t utf8Length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::string utf8Prefix(const std::string& text, size_t code_points) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!isContinuationByte(static_cast<unsigned char>(text[i]))) {
            if (seen == code_points) {
                return text.substr(0, i);
            }
            ++seen;
        }
    }
    return text;
}

std::string repeatString(const std::string& str, int count) {
    std::string result;
    if (count <= 0) return result;
    result.reserve(str.size() * static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        result += str;
    }
    return result;
}

}}
