#include "fpb/common/terminal.hpp"
#include <sys/ioctl.h>
#include <unistd.h>

namespace fpb {
namespace common {

TerminalSize getTerminalSize(int fd, const TerminalSize& fallback) {
    struct winsize w;
    if (ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return {w.ws_col, w.ws_row};
    }
    return fallback;
}

bool isTerminal(int fd) {
    return isatty(fd) != 0;
}

bool supportsColor(int fd) {
#ifdef _WIN32
    (void)fd;
    return false;
#else
    return isTerminal(fd);
#endif
}

}}
