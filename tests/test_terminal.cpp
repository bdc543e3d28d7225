#include <gtest/gtest.h>
#include <platform/terminal.hpp>
#include <cstdlib>
#include <string>

class TerminalEnv : public ::testing::Test {
protected:
    void SetUp() override {
        const char* term = std::getenv("TERM");
        if (term) saved_ = term;
        had_term_ = term != nullptr;
    }

    void TearDown() override {
        if (had_term_) setenv("TERM", saved_.c_str(), 1);
        else unsetenv("TERM");
    }

    std::string saved_;
    bool had_term_ = false;
};

TEST_F(TerminalEnv, TermNameFromEnvironment) {
    setenv("TERM", "screen-256color", 1);
    EXPECT_EQ(platform::term_name(), "screen-256color");
}

TEST_F(TerminalEnv, TermNameFallsBackToXterm) {
    unsetenv("TERM");
    EXPECT_EQ(platform::term_name(), "xterm");
    setenv("TERM", "", 1);
    EXPECT_EQ(platform::term_name(), "xterm");
}

TEST(Terminal, DimensionsArePositive) {
    EXPECT_GT(platform::term_width(), 0);
    EXPECT_GT(platform::term_height(), 0);
}

TEST(Terminal, RawModeOnlyForTerminals) {
    platform::RawModeGuard guard;
    EXPECT_EQ(guard.active(), platform::stdin_is_terminal());
}
