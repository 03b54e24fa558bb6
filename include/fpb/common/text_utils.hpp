#pragma once

#include <string>
#include <cstddef>

namespace fpb {
namespace common {

// Removes CSI escape sequences and stray ESC bytes, then replaces every
// non-ASCII code point with a single space. stripAnsi(stripAnsi(s)) == stripAnsi(s).
std::string stripAnsi(const std::string& text);

size_t displayLength(const std::string& text);

size_t utf8Length(const std::string& text);

std::string utf8Prefix(const std::string& text, size_t code_points);

std::string repeatString(const std::string& str, int count);

}}
