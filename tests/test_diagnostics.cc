#include <gtest/gtest.h>
#include <string>
#include "checkpoint.h"

using plotpipe::classify_diagnostics;

TEST(Diagnostics, empty_input_is_clean) {
    const auto d = classify_diagnostics("\n", false);
    EXPECT_TRUE(d.errors.empty());
    EXPECT_TRUE(d.warnings.empty());
}

TEST(Diagnostics, warnings_are_split_out) {
    const auto d = classify_diagnostics(
        "\nWarning: empty x range [1:1], adjusting to [0.99:1.01]\n"
        "Warning:   something else   \n",
        false);

    ASSERT_EQ(d.warnings.size(), 2u);
    EXPECT_EQ(d.warnings[0], "empty x range [1:1], adjusting to [0.99:1.01]");
    EXPECT_EQ(d.warnings[1], "something else");
    EXPECT_TRUE(d.errors.empty());
}

TEST(Diagnostics, errors_are_trimmed) {
    const auto d = classify_diagnostics(
        "\ngnuplot> set bogus\n             ^\n         line 0: unrecognized option\n\n", false);
    EXPECT_EQ(d.errors, "gnuplot> set bogus\n             ^\n         line 0: unrecognized option");
}

TEST(Diagnostics, placeholder_reports_dropped_only_on_request) {
    const std::string raw =
        "\ngnuplot> 10 10 \n         ^\n         line 0: invalid command\n\n"
        "\ngnuplot> e\n         ^\n         line 0: invalid command\n\n";

    EXPECT_TRUE(classify_diagnostics(raw, true).errors.empty());
    EXPECT_NE(classify_diagnostics(raw, false).errors.find("invalid command"), std::string::npos);
}

TEST(Diagnostics, other_invalid_commands_are_kept) {
    const std::string raw =
        "\ngnuplot> bogus\n         ^\n         line 0: invalid command\n\n"
        "\ngnuplot> 10 10 \n         ^\n         line 0: invalid command\n";

    const auto d = classify_diagnostics(raw, true);
    EXPECT_NE(d.errors.find("gnuplot> bogus"), std::string::npos);
    EXPECT_EQ(d.errors.find("10 10"), std::string::npos);
}
