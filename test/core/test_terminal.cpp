#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/core/terminal.hpp>

using namespace workflow_tracker;

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("IsStdoutTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStdoutTty();
    CHECK((result == true || result == false));
}

TEST_CASE("ShouldUseColor: forced modes ignore the TTY", "[core][terminal]") {
    CHECK(ShouldUseColor(ColorMode::Always, false));
    CHECK_FALSE(ShouldUseColor(ColorMode::Never, true));
}

TEST_CASE("ShouldUseColor: auto needs a TTY", "[core][terminal]") {
    CHECK_FALSE(ShouldUseColor(ColorMode::Auto, false));
    CHECK(ShouldUseColor(ColorMode::Auto, true) == !NoColorEnvSet());
}
