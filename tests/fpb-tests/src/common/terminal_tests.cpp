#include <catch2/catch.hpp>

#include "../pipe_fixture.hpp"

#include <fpb/common/config.hpp>
#include <fpb/common/terminal.hpp>

using namespace fpb::common;

namespace terminal_tests {

TEST_CASE("Non-terminal descriptors fall back to the configured size", "[terminal]") {
    fpb_tests::Pipe pipe;
    REQUIRE(pipe.read_fd >= 0);

    auto size = getTerminalSize(pipe.write_fd, {132, 43});
    CHECK(size.width == 132);
    CHECK(size.height == 43);

    CHECK_FALSE(isTerminal(pipe.write_fd));
    CHECK_FALSE(supportsColor(pipe.write_fd));
}

TEST_CASE("Default render fallback is 80x24", "[terminal][config]") {
    auto config = Config::createDefaultConfig();
    fpb_tests::Pipe pipe;

    auto size = getTerminalSize(pipe.read_fd, {config.render.fallback_width, config.render.fallback_height});
    CHECK(size.width == 80);
    CHECK(size.height == 24);
}

} // namespace terminal_tests
