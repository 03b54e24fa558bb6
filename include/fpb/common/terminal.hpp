#pragma once

namespace fpb {
namespace common {

struct TerminalSize {
    int width;
    int height;
};

// Returns fallback when fd is not a terminal or reports no columns.
TerminalSize getTerminalSize(int fd, const TerminalSize& fallback);

bool isTerminal(int fd);

// ANSI output is only trusted on a POSIX terminal.
bool supportsColor(int fd);

}}
