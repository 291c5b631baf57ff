#include <gtest/gtest.h>
#include <string>
#include "command_channel.h"
#include "errors.h"

using plotpipe::check_guarded_line;
using plotpipe::GuardOverrides;
using plotpipe::ProtocolGuardError;

TEST(CommandGuard, plain_settings_pass) {
    EXPECT_NO_THROW(check_guarded_line("set grid"));
    EXPECT_NO_THROW(check_guarded_line("set xrange [0:10]"));
    EXPECT_NO_THROW(check_guarded_line("set key left; unset border"));
}

TEST(CommandGuard, print_is_rejected) {
    EXPECT_THROW(check_guarded_line("print 1+1"), ProtocolGuardError);
    EXPECT_THROW(check_guarded_line("  print \"x\""), ProtocolGuardError);
    EXPECT_THROW(check_guarded_line("set grid; print 1"), ProtocolGuardError);
}

TEST(CommandGuard, set_print_is_rejected) {
    try {
        check_guarded_line("set print \"somefile\"");
        FAIL() << "expected ProtocolGuardError";
    } catch (const ProtocolGuardError& e) {
        EXPECT_NE(std::string(e.what()).find("'set print'"), std::string::npos);
    }
}

TEST(CommandGuard, terminal_and_output_need_override) {
    EXPECT_THROW(check_guarded_line("set terminal png"), ProtocolGuardError);
    EXPECT_THROW(check_guarded_line("set output \"a.png\""), ProtocolGuardError);
    EXPECT_THROW(check_guarded_line("set grid;set terminal png"), ProtocolGuardError);

    GuardOverrides terminal;
    terminal.terminal = true;
    EXPECT_NO_THROW(check_guarded_line("set terminal png", terminal));
    EXPECT_THROW(check_guarded_line("set output \"a.png\"", terminal), ProtocolGuardError);

    GuardOverrides output;
    output.output = true;
    EXPECT_NO_THROW(check_guarded_line("set output \"a.png\"", output));
}

TEST(CommandGuard, overrides_never_allow_print) {
    GuardOverrides all;
    all.terminal = true;
    all.output = true;
    EXPECT_THROW(check_guarded_line("set terminal dumb; print 1", all), ProtocolGuardError);
}

TEST(CommandGuard, command_lines_skip_blank_lines) {
    const auto lines = plotpipe::command_lines("set grid\n\n   \nset key\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "set grid");
    EXPECT_EQ(lines[1], "set key");

    EXPECT_TRUE(plotpipe::command_lines("").empty());
}
