#include <catch2/catch.hpp>

#include "../pipe_fixture.hpp"

#include <fpb/prompt/prompt_forwarder.hpp>
#include <fpb/stream/line_accumulator.hpp>

#include <sstream>
#include <string>

using namespace fpb;
using namespace fpb::prompt;

namespace prompt_forwarder_tests {

struct TestSubject {
    fpb_tests::Pipe input;
    fpb_tests::Pipe target;
    std::ostringstream display;
    stream::LineAccumulator accumulator;
    PromptForwarder forwarder;

    explicit TestSubject(bool colors = false)
        : forwarder("[y/N] ", input.read_fd, target.write_fd, common::makeTextStyle(colors), display) {}

    // Returns true as soon as a byte triggers a prompt.
    bool Feed(const std::string &text) {
        bool detected = false;
        for (char c : text) {
            if (accumulator.feed(c)) {
                continue;
            }
            detected = forwarder.inspect(accumulator) || detected;
        }
        return detected;
    }

    std::string Forwarded() {
        forwarder.waitForPending();
        target.closeWrite();
        return target.drain();
    }
};

TEST_CASE("Detected prompt forwards exactly one line of input", "[prompt]") {
    TestSubject test{};

    REQUIRE(test.Feed("File 'out.mp4' already exists. Overwrite? [y/N] "));
    CHECK(test.display.str() == "File 'out.mp4' already exists. Overwrite? [y/N] ");
    CHECK(test.accumulator.pending().empty());
    CHECK(test.accumulator.history().back() == "File 'out.mp4' already exists. Overwrite? [y/N] ");

    REQUIRE(test.input.write("y\nleftover\n"));
    CHECK(test.Forwarded() == "y\n");

    test.input.closeWrite();
    CHECK(test.input.drain() == "leftover\n");
}

TEST_CASE("Prompt echo is highlighted when colors are enabled", "[prompt]") {
    TestSubject test{true};

    REQUIRE(test.Feed("Overwrite? [y/N] "));
    CHECK(test.display.str() == "\033[93m\033[1mOverwrite? [y/N] \033[0m");

    test.input.closeWrite();
    CHECK(test.Forwarded().empty());
}

TEST_CASE("Lines without the prompt suffix are not forwarded", "[prompt]") {
    TestSubject test{};

    CHECK_FALSE(test.Feed("Overwrite? [Y/n] "));
    CHECK_FALSE(test.Feed("[y/N]"));
    CHECK_FALSE(test.forwarder.isForwarding());
    CHECK(test.display.str().empty());
}

TEST_CASE("Forward is abandoned when input ends before a full line", "[prompt]") {
    TestSubject test{};

    REQUIRE(test.Feed("Overwrite? [y/N] "));
    REQUIRE(test.input.write("y"));
    test.input.closeWrite();

    CHECK(test.Forwarded().empty());
    CHECK_FALSE(test.forwarder.isForwarding());
}

TEST_CASE("A second prompt while a forward is pending reuses the pending read", "[prompt]") {
    TestSubject test{};

    REQUIRE(test.Feed("Overwrite? [y/N] "));
    REQUIRE(test.Feed("Overwrite? [y/N] "));
    CHECK(test.display.str() == "Overwrite? [y/N] Overwrite? [y/N] ");

    REQUIRE(test.input.write("y\n"));
    CHECK(test.Forwarded() == "y\n");
}

TEST_CASE("Successive prompts each forward their own answer", "[prompt]") {
    TestSubject test{};

    REQUIRE(test.Feed("First? [y/N] "));
    REQUIRE(test.input.write("y\n"));
    test.forwarder.waitForPending();

    REQUIRE(test.Feed("Second? [y/N] "));
    REQUIRE(test.input.write("n\n"));

    CHECK(test.Forwarded() == "y\nn\n");
}

} // namespace prompt_forwarder_tests
