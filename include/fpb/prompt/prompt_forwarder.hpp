#pragma once

#include "../stream/line_accumulator.hpp"
#include "../common/text_style.hpp"
#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <optional>
#include <ostream>

namespace fpb {
namespace prompt {

class PromptForwarder {
public:
    PromptForwarder(std::string suffix, int input_fd, int target_fd,
                    std::shared_ptr<const common::TextStyle> style, std::ostream& display);
    ~PromptForwarder();
    
    PromptForwarder(const PromptForwarder&) = delete;
    PromptForwarder& operator=(const PromptForwarder&) = delete;
    
    // Echoes a pending confirmation prompt, resets the accumulator and relays
    // one line of user input to target_fd in the background.
    bool inspect(stream::LineAccumulator& accumulator);
    
    bool isForwarding() const;
    void waitForPending();
    
    static std::optional<std::string> readLine(int fd);
    static bool writeAll(int fd, const std::string& data);

private:
    struct ForwardState {
        std::atomic<bool> active{false};
    };
    
    std::string suffix_;
    int input_fd_;
    int target_fd_;
    std::shared_ptr<const common::TextStyle> style_;
    std::ostream& display_;
    
    std::shared_ptr<ForwardState> state_;
    std::thread worker_;
    
    void startForward();
    static void forwardLine(int input_fd, int target_fd, std::shared_ptr<ForwardState> state);
};

}}
