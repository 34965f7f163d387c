#include <catch2/catch_test_macros.hpp>

#include <favorite_colors/core/terminal.hpp>

#include <cstdlib>

using namespace favorite_colors;

namespace {

// Sets NO_COLOR for the lifetime of the guard, restoring "unset" afterwards.
class NoColorGuard {
public:
    explicit NoColorGuard(bool set) {
        if (set) {
            setenv("NO_COLOR", "1", 1);
        } else {
            unsetenv("NO_COLOR");
        }
    }
    ~NoColorGuard() { unsetenv("NO_COLOR"); }

    NoColorGuard(const NoColorGuard&) = delete;
    NoColorGuard& operator=(const NoColorGuard&) = delete;
};

} // anonymous namespace

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the environment", "[core][terminal]") {
    {
        NoColorGuard guard(true);
        CHECK(NoColorEnvSet());
    }
    NoColorGuard guard(false);
    CHECK_FALSE(NoColorEnvSet());
}

TEST_CASE("ResolveLogColor: --no-color wins", "[core][terminal]") {
    NoColorGuard guard(false);
    CHECK_FALSE(ResolveLogColor(true, true));
    CHECK_FALSE(ResolveLogColor(false, true));
}

TEST_CASE("ResolveLogColor: --color forces color without NO_COLOR", "[core][terminal]") {
    NoColorGuard guard(false);
    CHECK(ResolveLogColor(true, false));
}

TEST_CASE("ResolveLogColor: NO_COLOR beats --color", "[core][terminal]") {
    NoColorGuard guard(true);
    CHECK_FALSE(ResolveLogColor(true, false));
}

TEST_CASE("ResolveLogColor: default follows the terminal", "[core][terminal]") {
    NoColorGuard guard(false);
    CHECK(ResolveLogColor(false, false) == IsStderrTty());
}
