#include <catch2/catch.hpp>

#include "../pipe_fixture.hpp"

#include <fpb/common/config.hpp>
#include <fpb/common/logger.hpp>
#include <fpb/process/supervisor.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <chrono>
#include <memory>
#include <csignal>
#include <sstream>
#include <string>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

using namespace fpb;
using namespace fpb::process;
using namespace std::chrono_literals;

namespace supervisor_tests {

struct TestSubject {
    fpb_tests::Pipe input;
    std::ostringstream out;
    common::GlobalConfig config = common::Config::createDefaultConfig();

    TestSubject() {
        config.wrapped_program = "sh";
    }

    SupervisorOptions Options(const std::string &script) const {
        SupervisorOptions options;
        options.args = {"-c", script};
        options.input_fd = input.read_fd;
        options.use_colors = false;
        options.width_provider = []() { return 80; };
        return options;
    }

    SupervisorOutcome Run(const std::string &script) {
        ProcessSupervisor supervisor(config, Options(script), out);
        return supervisor.run();
    }
};

size_t countOccurrences(const std::string &haystack, const std::string &needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

TEST_CASE("Successful run hides diagnostics and finishes the bar", "[supervisor]") {
    TestSubject test{};

    auto outcome = test.Run("printf 'Duration: 00:01:30.00\\n' >&2; "
                            "printf 'time=00:00:45.00\\r' >&2; "
                            "exit 0");

    CHECK(outcome.exit_code == 0);
    CHECK_FALSE(outcome.error_code.has_value());
    CHECK_FALSE(outcome.interrupted);

    const std::string output = test.out.str();
    CHECK(output.find("Duration") == std::string::npos);
    CHECK(output.find("100.0% • 90/90") != std::string::npos);
    CHECK(output.back() == '\n');
}

TEST_CASE("Successful run without progress prints nothing", "[supervisor]") {
    TestSubject test{};

    auto outcome = test.Run("printf 'just noise\\n' >&2");

    CHECK(outcome.exit_code == 0);
    CHECK(test.out.str().empty());
}

TEST_CASE("Failed run replays diagnostics once and keeps the exit status", "[supervisor]") {
    TestSubject test{};
    const std::string diagnostics = "Duration: 00:00:10.00, start: 0.0\nmissing.mp4: No such file or directory\n";

    auto outcome = test.Run("printf 'Duration: 00:00:10.00, start: 0.0\\n' >&2; "
                            "printf 'missing.mp4: No such file or directory\\n' >&2; "
                            "exit 1");

    CHECK(outcome.exit_code == 1);
    CHECK_FALSE(outcome.error_code.has_value());
    CHECK(test.out.str() == diagnostics);
    CHECK(countOccurrences(test.out.str(), "No such file or directory") == 1);
}

TEST_CASE("Arbitrary exit statuses are propagated", "[supervisor]") {
    TestSubject test{};

    CHECK(test.Run("exit 3").exit_code == 3);
    CHECK(test.Run("exit 0").exit_code == 0);
}

TEST_CASE("Wrapped program killed by a signal reports 128 plus the signal", "[supervisor]") {
    TestSubject test{};

    auto outcome = test.Run("printf 'about to die\\n' >&2; kill -9 $$");

    CHECK(outcome.exit_code == 128 + SIGKILL);
    CHECK(test.out.str() == "about to die\n");
}

TEST_CASE("Missing wrapped program is a setup error", "[supervisor]") {
    TestSubject test{};
    test.config.wrapped_program = "/nonexistent/fpb-wrapped-program";

    auto outcome = test.Run("exit 0");

    CHECK(outcome.exit_code == 1);
    REQUIRE(outcome.error_code.has_value());
    CHECK(*outcome.error_code == SupervisorErrorCode::SPAWN_FAILED);
    REQUIRE(outcome.error_message.has_value());
    CHECK_FALSE(outcome.error_message->empty());
    REQUIRE(outcome.error_context.has_value());
    CHECK(outcome.error_context->details.at("program") == "/nonexistent/fpb-wrapped-program");
}

TEST_CASE("Prompt answers reach the wrapped program", "[supervisor][prompt]") {
    TestSubject test{};
    REQUIRE(test.input.write("y\n"));

    auto outcome = test.Run("printf \"File 'out.mp4' already exists. Overwrite? [y/N] \" >&2; "
                            "read answer; "
                            "printf 'answer=%s\\n' \"$answer\" >&2; "
                            "exit 1");

    CHECK(outcome.exit_code == 1);
    const std::string output = test.out.str();
    CHECK(output.rfind("File 'out.mp4' already exists. Overwrite? [y/N] ", 0) == 0);
    CHECK(output.find("answer=y\n") != std::string::npos);
}

TEST_CASE("Termination signal kills the wrapped program", "[supervisor][signal]") {
    TestSubject test{};
    ProcessSupervisor supervisor(test.config, test.Options("exec sleep 30"), test.out);

    std::thread interrupter([&supervisor]() {
        for (int i = 0; i < 500 && supervisor.childPid() <= 0; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        kill(getpid(), SIGTERM);
    });

    auto started = std::chrono::steady_clock::now();
    auto outcome = supervisor.run();
    interrupter.join();

    CHECK(outcome.interrupted);
    CHECK(outcome.exit_code == 128 + SIGTERM);
    CHECK(test.out.str() == "Exiting.\n");
    CHECK(std::chrono::steady_clock::now() - started < 10s);
}

TEST_CASE("Exit banner follows any bar drawn while draining", "[supervisor][signal]") {
    TestSubject test{};
    ProcessSupervisor supervisor(test.config,
                                 test.Options("printf 'Duration: 00:10:00.00\\n' >&2; i=0; "
                                              "while :; do i=$((i + 1)); "
                                              "printf 'time=00:00:%02d.00\\r' $((i % 60)) >&2; done"),
                                 test.out);

    std::thread interrupter([&supervisor]() {
        for (int i = 0; i < 500 && supervisor.childPid() <= 0; ++i) {
            std::this_thread::sleep_for(10ms);
        }
        std::this_thread::sleep_for(300ms);
        kill(getpid(), SIGINT);
    });

    auto outcome = supervisor.run();
    interrupter.join();

    CHECK(outcome.interrupted);
    CHECK(outcome.exit_code == 128 + SIGINT);
    const std::string output = test.out.str();
    CHECK(output.find("Processing") != std::string::npos);
    REQUIRE(output.size() >= 9);
    CHECK(output.compare(output.size() - 9, 9, "Exiting.\n") == 0);
    CHECK(countOccurrences(output, "Exiting.") == 1);
}

TEST_CASE("Setup failures are logged at error level", "[supervisor][logging]") {
    std::ostringstream log;
    common::Logger::instance().initialize(common::LogLevel::WARN,
                                          std::make_shared<spdlog::sinks::ostream_sink_mt>(log));

    TestSubject test{};
    test.config.wrapped_program = "/nonexistent/fpb-wrapped-program";
    auto outcome = test.Run("exit 0");
    common::Logger::instance().shutdown();

    REQUIRE(outcome.error_code.has_value());
    const std::string logged = log.str();
    CHECK(logged.find("[error]") != std::string::npos);
    CHECK(logged.find("SPAWN_FAILED") != std::string::npos);
    CHECK(logged.find("program=/nonexistent/fpb-wrapped-program") != std::string::npos);
}

TEST_CASE("Exit codes are decoded from wait statuses", "[supervisor]") {
    pid_t pid = fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        _exit(42);
    }

    int status = 0;
    REQUIRE(waitpid(pid, &status, 0) == pid);
    CHECK(ProcessSupervisor::exitCodeFromStatus(status) == 42);
}

} // namespace supervisor_tests
