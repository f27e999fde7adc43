#include <catch2/catch_test_macros.hpp>

#include <toolbridge/core/terminal.hpp>

#include <cstdlib>
#include <optional>
#include <string>

using namespace toolbridge;

namespace {

class NoColorGuard {
public:
    NoColorGuard() {
        if (const char* v = std::getenv("NO_COLOR")) saved_ = v;
    }
    ~NoColorGuard() {
        if (saved_) setenv("NO_COLOR", saved_->c_str(), 1);
        else unsetenv("NO_COLOR");
    }
private:
    std::optional<std::string> saved_;
};

} // anonymous namespace

// ===========================================================================
// Terminal detection: basic smoke tests.
// ===========================================================================

TEST_CASE("IsStderrTty: returns bool without crashing", "[core][terminal]") {
    auto result = IsStderrTty();
    CHECK((result == true || result == false));
}

TEST_CASE("NoColorEnvSet: follows the environment", "[core][terminal]") {
    NoColorGuard guard;
    setenv("NO_COLOR", "1", 1);
    CHECK(NoColorEnvSet());
    unsetenv("NO_COLOR");
    CHECK_FALSE(NoColorEnvSet());
}

// ===========================================================================
// ShouldUseColor
// ===========================================================================

TEST_CASE("ShouldUseColor: NO_COLOR wins over force", "[core][terminal]") {
    NoColorGuard guard;
    setenv("NO_COLOR", "1", 1);
    CHECK_FALSE(ShouldUseColor(true, false));
}

TEST_CASE("ShouldUseColor: explicit flags", "[core][terminal]") {
    NoColorGuard guard;
    unsetenv("NO_COLOR");
    CHECK(ShouldUseColor(true, false));
    CHECK_FALSE(ShouldUseColor(false, true));
    CHECK(ShouldUseColor(false, false) == IsStderrTty());
}
