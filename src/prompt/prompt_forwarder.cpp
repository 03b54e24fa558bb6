#include "fpb/prompt/prompt_forwarder.hpp"
#include "fpb/common/logger.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fpb {
namespace prompt {

PromptForwarder::PromptForwarder(std::string suffix, int input_fd, int target_fd,
                                 std::shared_ptr<const common::TextStyle> style, std::ostream& display)
    : suffix_(std::move(suffix)),
      input_fd_(input_fd),
      target_fd_(target_fd),
      style_(style ? std::move(style) : common::makeTextStyle(false)),
      display_(display),
      state_(std::make_shared<ForwardState>()) {
}

PromptForwarder::~PromptForwarder() {
    if (!worker_.joinable()) {
        return;
    }
    
    // A reader still blocked on the terminal cannot be interrupted.
    if (state_->active.load()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

bool PromptForwarder::inspect(stream::LineAccumulator& accumulator) {
    if (suffix_.empty() || !accumulator.endsWith(suffix_)) {
        return false;
    }
    
    display_ << style_->paint(common::Tone::PROMPT, accumulator.pending()) << std::flush;
    accumulator.finalize();
    
    startForward();
    return true;
}

bool PromptForwarder::isForwarding() const {
    return state_->active.load();
}

void PromptForwarder::waitForPending() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void PromptForwarder::startForward() {
    if (state_->active.exchange(true)) {
        common::Logger::instance().debug("[Prompt] Forward already pending, reusing it");
        return;
    }
    
    if (worker_.joinable()) {
        worker_.join();
    }
    
    worker_ = std::thread(&PromptForwarder::forwardLine, input_fd_, target_fd_, state_);
}

void PromptForwarder::forwardLine(int input_fd, int target_fd, std::shared_ptr<ForwardState> state) {
    auto line = readLine(input_fd);
    
    if (!line) {
        common::Logger::instance().debug("[Prompt] No input line available, forward abandoned");
    } else if (!writeAll(target_fd, *line)) {
        common::Logger::instance().warn("[Prompt] Write to wrapped program failed | error={}", strerror(errno));
    } else {
        common::Logger::instance().debug("[Prompt] Forwarded {} bytes", line->size());
    }
    
    state->active.store(false);
}

std::optional<std::string> PromptForwarder::readLine(int fd) {
    std::string line;
    char c;
    
    while (true) {
        ssize_t n = ::read(fd, &c, 1);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::nullopt;
        }
        if (n == 0) {
            return std::nullopt;
        }
        
        line += c;
        if (c == '\n') {
            return line;
        }
    }
}

bool PromptForwarder::writeAll(int fd, const std::string& data) {
    size_t written = 0;
    
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    
    return true;
}

}}
