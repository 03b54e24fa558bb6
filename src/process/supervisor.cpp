#include "fpb/process/supervisor.hpp"
#include "fpb/common/constants.hpp"
#include "fpb/common/logger.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

namespace fpb {
namespace process {

std::atomic<int> ProcessSupervisor::pending_signal_{0};

ProcessSupervisor::ProcessSupervisor(const common::GlobalConfig& config, SupervisorOptions options, std::ostream& out)
    : config_(config),
      options_(std::move(options)),
      out_(out),
      style_(common::makeTextStyle(options_.use_colors)) {
}

ProcessSupervisor::~ProcessSupervisor() {
    if (reader_thread_.joinable()) {
        pid_t pid = child_pid_.load();
        if (pid > 0) {
            kill(pid, SIGKILL);
        }
        reader_thread_.join();
    }
    
    pid_t pid = child_pid_.exchange(-1);
    if (pid > 0) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }
    
    closeFd(stderr_fd_);
    closeStdin();
    restoreSignalHandlers();
}

SupervisorOutcome ProcessSupervisor::run() {
    SupervisorOutcome outcome;
    auto& logger = common::Logger::instance();
    
    pending_signal_.store(0);
    installSignalHandlers();
    
    if (!spawn(outcome)) {
        return outcome;
    }
    
    stream::MonitorOptions monitor_options{options_.input_fd, stdin_fd_, options_.width_provider, nullptr};
    monitor_ = std::make_unique<stream::DiagnosticMonitor>(config_, style_, out_, monitor_options);
    
    reader_thread_ = std::thread(&ProcessSupervisor::readerThreadMain, this);
    
    {
        std::unique_lock<std::mutex> lock(done_mutex_);
        auto poll_interval = std::chrono::milliseconds(constants::limits::SUPERVISOR_POLL_INTERVAL_MS);
        
        while (!reader_done_) {
            int signal = pending_signal_.load();
            if (signal != 0) {
                lock.unlock();
                return handleInterrupt(signal);
            }
            done_cv_.wait_for(lock, poll_interval);
        }
    }
    
    reader_thread_.join();
    
    if (read_errno_ != 0) {
        fail(outcome, SupervisorErrorCode::STREAM_READ_FAILED, read_errno_);
        kill(child_pid_.load(), SIGKILL);
        awaitChild(outcome);
        outcome.exit_code = constants::exit_codes::FAILURE;
        return outcome;
    }
    
    int status = awaitChild(outcome);
    if (outcome.error_code) {
        return outcome;
    }
    
    outcome.exit_code = exitCodeFromStatus(status);
    logger.debug("[Supervisor] Wrapped program finished | exit_code={}", outcome.exit_code);
    
    if (outcome.exit_code != constants::exit_codes::SUCCESS) {
        const auto& diagnostics = monitor_->diagnostics();
        if (!diagnostics.empty()) {
            out_ << diagnostics << std::flush;
        }
        return outcome;
    }
    
    monitor_->close();
    return outcome;
}

int ProcessSupervisor::exitCodeFromStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return constants::exit_codes::SIGNAL_BASE + WTERMSIG(status);
    }
    return constants::exit_codes::FAILURE;
}

bool ProcessSupervisor::spawn(SupervisorOutcome& outcome) {
    auto& logger = common::Logger::instance();
    
    int stderr_pipe[2];
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        fail(outcome, SupervisorErrorCode::PIPE_CREATION_FAILED, errno);
        return false;
    }
    
    int stdin_pipe[2];
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        fail(outcome, SupervisorErrorCode::PIPE_CREATION_FAILED, errno);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return false;
    }
    
    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        fail(outcome, SupervisorErrorCode::PIPE_CREATION_FAILED, errno);
        for (int fd : {stderr_pipe[0], stderr_pipe[1], stdin_pipe[0], stdin_pipe[1]}) {
            close(fd);
        }
        return false;
    }
    
    std::vector<std::string> arguments;
    arguments.reserve(options_.args.size() + 1);
    arguments.push_back(config_.wrapped_program);
    arguments.insert(arguments.end(), options_.args.begin(), options_.args.end());
    
    std::vector<char*> argv;
    for (auto& argument : arguments) {
        argv.push_back(argument.data());
    }
    argv.push_back(nullptr);
    
    pid_t pid = fork();
    
    if (pid < 0) {
        int error_number = errno;
        for (int fd : {stderr_pipe[0], stderr_pipe[1], stdin_pipe[0], stdin_pipe[1], exec_pipe[0], exec_pipe[1]}) {
            close(fd);
        }
        fail(outcome, SupervisorErrorCode::SPAWN_FAILED, error_number);
        return false;
    }
    
    if (pid == 0) {
        signal(SIGPIPE, SIG_DFL);
        
        if (dup2(stdin_pipe[0], STDIN_FILENO) < 0 || dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            int error_number = errno;
            (void)!write(exec_pipe[1], &error_number, sizeof(error_number));
            _exit(127);
        }
        
        execvp(argv[0], argv.data());
        
        int error_number = errno;
        (void)!write(exec_pipe[1], &error_number, sizeof(error_number));
        _exit(127);
    }
    
    close(stderr_pipe[1]);
    close(stdin_pipe[0]);
    close(exec_pipe[1]);
    
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);
    
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close(stderr_pipe[0]);
        close(stdin_pipe[1]);
        fail(outcome, SupervisorErrorCode::SPAWN_FAILED, exec_errno);
        return false;
    }
    
    stderr_fd_ = stderr_pipe[0];
    stdin_fd_ = stdin_pipe[1];
    child_pid_.store(pid);
    
    logger.debug("[Supervisor] Started {} | pid={} | args={}", config_.wrapped_program, pid, options_.args.size());
    return true;
}

void ProcessSupervisor::readerThreadMain() {
    char buffer[constants::limits::READ_CHUNK_SIZE];
    int error_number = 0;
    
    while (true) {
        ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            error_number = errno;
            break;
        }
        if (n == 0) {
            break;
        }
        monitor_->processBytes(buffer, static_cast<size_t>(n));
    }
    
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        reader_done_ = true;
        read_errno_ = error_number;
    }
    done_cv_.notify_all();
}

int ProcessSupervisor::awaitChild(SupervisorOutcome& outcome) {
    pid_t pid = child_pid_.load();
    int status = 0;
    
    while (waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        if (!outcome.error_code) {
            fail(outcome, SupervisorErrorCode::WAIT_FAILED, errno);
        }
        break;
    }
    
    child_pid_.store(-1);
    closeStdin();
    return status;
}

SupervisorOutcome ProcessSupervisor::handleInterrupt(int signal) {
    SupervisorOutcome outcome;
    outcome.interrupted = true;
    outcome.exit_code = constants::exit_codes::SIGNAL_BASE + signal;
    
    common::Logger::instance().debug("[Supervisor] Interrupted | signal={}", signal);
    
    pid_t pid = child_pid_.load();
    if (pid > 0) {
        kill(pid, SIGKILL);
    }
    awaitChild(outcome);
    
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }
    
    // The reader may still render while draining, so the banner goes last.
    out_ << style_->paint(common::Tone::ALERT, "Exiting.") << "\n" << std::flush;
    return outcome;
}

void ProcessSupervisor::fail(SupervisorOutcome& outcome, SupervisorErrorCode code, int error_number) {
    outcome.exit_code = constants::exit_codes::FAILURE;
    outcome.error_code = code;
    outcome.error_message = strerror(error_number);
    
    common::ErrorContext context;
    context.component = "supervisor";
    context.details["program"] = config_.wrapped_program;
    context.details["errno"] = std::to_string(error_number);
    
    common::Logger::instance().error("[Supervisor] {} | {}",
                                     SupervisorErrorCodeHelper::toString(code),
                                     common::formatContext(context));
    outcome.error_context = std::move(context);
}

void ProcessSupervisor::installSignalHandlers() {
    if (handlers_installed_) {
        return;
    }
    
    struct sigaction action{};
    action.sa_handler = &ProcessSupervisor::signalHandlerStatic;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    
    sigaction(SIGINT, &action, &previous_sigint_);
    sigaction(SIGTERM, &action, &previous_sigterm_);
    
    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, &previous_sigpipe_);
    
    handlers_installed_ = true;
}

void ProcessSupervisor::restoreSignalHandlers() {
    if (!handlers_installed_) {
        return;
    }
    
    sigaction(SIGINT, &previous_sigint_, nullptr);
    sigaction(SIGTERM, &previous_sigterm_, nullptr);
    sigaction(SIGPIPE, &previous_sigpipe_, nullptr);
    handlers_installed_ = false;
}

void ProcessSupervisor::signalHandlerStatic(int signal) {
    int expected = 0;
    pending_signal_.compare_exchange_strong(expected, signal);
}

void ProcessSupervisor::closeStdin() {
    // A forward still waiting on the terminal will write to this descriptor.
    if (monitor_ && monitor_->forwarder().isForwarding()) {
        return;
    }
    closeFd(stdin_fd_);
}

void ProcessSupervisor::closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}}
