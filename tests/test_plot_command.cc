#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "errors.h"
#include "plot_command.h"

namespace {

plotpipe::Chunk chunk_of(std::size_t tuple_size, std::size_t points, std::vector<plotpipe::CurveOptions> options) {
    plotpipe::Chunk chunk;
    chunk.tuple_size = tuple_size;
    for (std::size_t c = 0; c < options.size(); ++c) {
        chunk.curves.emplace_back(tuple_size, plotpipe::Column(points, 1.0));
    }
    chunk.options = std::move(options);
    return chunk;
}

std::vector<plotpipe::CurveOptions> one_curve() {
    return std::vector<plotpipe::CurveOptions>(1);
}

}  // namespace

TEST(PlotCommand, curve_clause_without_legend) {
    plotpipe::CurveOptions options;
    EXPECT_EQ(plotpipe::curve_clause(options, "linespoints"), "notitle with linespoints");
}

TEST(PlotCommand, curve_clause_with_legend_style_and_y2) {
    plotpipe::CurveOptions options;
    options.legend = "sin";
    options.with = "lines";
    options.y2 = true;
    EXPECT_EQ(plotpipe::curve_clause(options, "points"), "title \"sin\" with lines axes x1y2");
}

TEST(PlotCommand, empty_style_falls_back_to_global) {
    plotpipe::CurveOptions options;
    options.with = "";
    EXPECT_EQ(plotpipe::curve_clause(options, "points"), "notitle with points");
}

TEST(PlotCommand, binary_format_lists_every_column) {
    EXPECT_EQ(plotpipe::binary_format(3, 10), "binary record=10 format=\"%double%double%double\" using 1:2:3");
}

TEST(PlotCommand, text_dry_run_is_the_real_command) {
    const auto cmd = plotpipe::build_plot_command({chunk_of(2, 50, one_curve())}, false, false, "linespoints");

    EXPECT_EQ(cmd.command, "plot '-' notitle with linespoints");
    EXPECT_EQ(cmd.minimal, cmd.command);
    EXPECT_EQ(cmd.test_payload, "10 10 \ne\n");
    EXPECT_TRUE(cmd.preamble.empty());
}

TEST(PlotCommand, binary_dry_run_sends_one_record) {
    const auto cmd = plotpipe::build_plot_command({chunk_of(2, 2, one_curve())}, false, true, "linespoints");

    EXPECT_EQ(cmd.command,
              "plot '-' binary record=2 format=\"%double%double\" using 1:2 notitle with linespoints");
    EXPECT_EQ(cmd.minimal,
              "plot '-' binary record=1 format=\"%double%double\" using 1:2 notitle with linespoints");

    // a full record of " \n" pairs, twice over
    EXPECT_EQ(cmd.test_payload.size(), 2 * 2 * sizeof(double));
    EXPECT_EQ(cmd.test_payload.find_first_not_of(" \n"), std::string::npos);
}

TEST(PlotCommand, curves_are_comma_joined_across_chunks) {
    plotpipe::CurveOptions a, b;
    a.legend = "a";
    b.legend = "b";
    b.with = "points";

    const auto cmd = plotpipe::build_plot_command({chunk_of(2, 5, {a}), chunk_of(3, 7, {b})},
                                                  false, false, "lines");
    EXPECT_EQ(cmd.command, "plot '-' title \"a\" with lines, '-' title \"b\" with points");
    EXPECT_EQ(cmd.test_payload, "10 10 \ne\n10 10 10 \ne\n");
}

TEST(PlotCommand, y2_curves_need_a_preamble) {
    plotpipe::CurveOptions right;
    right.y2 = true;

    const auto cmd = plotpipe::build_plot_command({chunk_of(2, 3, {{}, right})}, false, false, "lines");
    EXPECT_EQ(cmd.preamble, "set ytics nomirror\nset y2tics\n");
    EXPECT_EQ(cmd.command, "plot '-' notitle with lines, '-' notitle with lines axes x1y2");
}

TEST(PlotCommand, three_d_uses_splot_and_rejects_y2) {
    const auto cmd = plotpipe::build_plot_command({chunk_of(3, 4, one_curve())}, true, false, "lines");
    EXPECT_EQ(cmd.command, "splot '-' notitle with lines");

    plotpipe::CurveOptions right;
    right.y2 = true;
    EXPECT_THROW(plotpipe::build_plot_command({chunk_of(3, 4, {right})}, true, false, "lines"),
                 plotpipe::OptionError);
}
