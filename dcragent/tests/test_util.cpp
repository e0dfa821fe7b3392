#include <doctest/doctest.h>
#include "shutdown.hpp"
#include "util.hpp"
#include <stdexcept>

using Words = std::vector<std::string>;

TEST_CASE("Command lines split like a shell would") {
    CHECK(util::split_command_line("stdbuf -oL gpsmon -a") == Words{"stdbuf", "-oL", "gpsmon", "-a"});
    CHECK(util::split_command_line("  cat   'my file'  ") == Words{"cat", "my file"});
    CHECK(util::split_command_line(R"(sh -c "echo \"hi\"")") == Words{"sh", "-c", "echo \"hi\""});
    CHECK(util::split_command_line(R"(a\ b '' c)") == Words{"a b", "", "c"});
    CHECK(util::split_command_line("").empty());
}

TEST_CASE("Broken command lines are rejected") {
    CHECK_THROWS_AS(util::split_command_line("gpsmon 'oops"), std::invalid_argument);
    CHECK_THROWS_AS(util::split_command_line("gpsmon \\"), std::invalid_argument);
}

TEST_CASE("trim and split_string") {
    CHECK(util::trim("  a b \t\n") == "a b");
    CHECK(util::trim(" \t ").empty());
    CHECK(util::split_string("a,,b,", ',') == Words{"a", "", "b", ""});
}

TEST_CASE("Shutdown signal wakes waiters") {
    ShutdownSignal shutdown;
    CHECK_FALSE(shutdown.requested());
    CHECK_FALSE(shutdown.wait_for(std::chrono::milliseconds(10)));

    shutdown.request();
    shutdown.request();
    CHECK(shutdown.requested());
    CHECK(shutdown.wait_for(std::chrono::milliseconds(10000)));
}
