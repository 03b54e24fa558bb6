#pragma once

#include "error_codes.hpp"
#include "../common/config.hpp"
#include "../common/error_framework.hpp"
#include "../common/text_style.hpp"
#include "../progress/progress_bar.hpp"
#include "../stream/diagnostic_monitor.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <ostream>
#include <signal.h>
#include <sys/types.h>

namespace fpb {
namespace process {

struct SupervisorOptions {
    std::vector<std::string> args;
    int input_fd = 0;
    bool use_colors = false;
    progress::WidthProvider width_provider;
};

struct SupervisorOutcome {
    int exit_code = 0;
    bool interrupted = false;
    std::optional<SupervisorErrorCode> error_code;
    std::optional<std::string> error_message;
    std::optional<common::ErrorContext> error_context;
};

class ProcessSupervisor {
public:
    ProcessSupervisor(const common::GlobalConfig& config, SupervisorOptions options, std::ostream& out);
    ~ProcessSupervisor();
    
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    
    // Spawns the wrapped program and blocks until it finishes or an
    // interrupt arrives.
    SupervisorOutcome run();
    
    pid_t childPid() const { return child_pid_.load(); }
    
    static int exitCodeFromStatus(int status);

private:
    common::GlobalConfig config_;
    SupervisorOptions options_;
    std::ostream& out_;
    std::shared_ptr<const common::TextStyle> style_;
    
    std::atomic<pid_t> child_pid_{-1};
    int stderr_fd_ = -1;
    int stdin_fd_ = -1;
    
    std::unique_ptr<stream::DiagnosticMonitor> monitor_;
    std::thread reader_thread_;
    
    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool reader_done_ = false;
    int read_errno_ = 0;
    
    struct sigaction previous_sigint_{};
    struct sigaction previous_sigterm_{};
    struct sigaction previous_sigpipe_{};
    bool handlers_installed_ = false;
    
    static std::atomic<int> pending_signal_;
    
    bool spawn(SupervisorOutcome& outcome);
    void readerThreadMain();
    int awaitChild(SupervisorOutcome& outcome);
    SupervisorOutcome handleInterrupt(int signal);
    void fail(SupervisorOutcome& outcome, SupervisorErrorCode code, int error_number);
    
    void installSignalHandlers();
    void restoreSignalHandlers();
    static void signalHandlerStatic(int signal);
    
    void closeStdin();
    void closeFd(int& fd);
};

}}
