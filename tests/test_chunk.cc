#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "chunk.h"
#include "errors.h"

namespace {

plotpipe::CurveSpec spec(std::vector<plotpipe::Column> columns) {
    plotpipe::CurveSpec out;
    out.columns = std::move(columns);
    return out;
}

}  // namespace

TEST(Chunk, implicit_domain_in_2d) {
    const auto chunks = plotpipe::build_chunks(false, {spec({{5, 6, 7}})});

    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_EQ(chunks[0].tuple_size, 2u);
    EXPECT_EQ(chunks[0].curves[0][0], (plotpipe::Column{0, 1, 2}));
    EXPECT_EQ(chunks[0].curves[0][1], (plotpipe::Column{5, 6, 7}));
}

TEST(Chunk, grid_domain_in_3d) {
    plotpipe::CurveSpec z = spec({{1, 2, 3, 4, 5, 6}});
    z.grid_width = 3;
    const auto chunks = plotpipe::build_chunks(true, {z});

    ASSERT_EQ(chunks[0].tuple_size, 3u);
    EXPECT_EQ(chunks[0].curves[0][0], (plotpipe::Column{0, 1, 2, 0, 1, 2}));
    EXPECT_EQ(chunks[0].curves[0][1], (plotpipe::Column{0, 0, 0, 1, 1, 1}));

    z.grid_width = 4;
    EXPECT_THROW(plotpipe::build_chunks(true, {z}), plotpipe::OptionError);
}

TEST(Chunk, column_count_errors) {
    EXPECT_THROW(plotpipe::build_chunks(false, {spec({{1}, {2}, {3}})}), plotpipe::OptionError);

    plotpipe::CurveSpec bars = spec({{1, 2}});
    bars.options.tuplesize = 4;
    try {
        plotpipe::build_chunks(false, {bars});
        FAIL() << "expected OptionError";
    } catch (const plotpipe::OptionError& e) {
        EXPECT_EQ(std::string(e.what()), "plot() needed 4 data columns, but only got 1");
    }
}

TEST(Chunk, mismatched_and_empty_columns) {
    EXPECT_THROW(plotpipe::build_chunks(false, {spec({{1, 2}, {1, 2, 3}})}), plotpipe::OptionError);
    EXPECT_THROW(plotpipe::build_chunks(false, {spec({{}, {}})}), plotpipe::OptionError);
    EXPECT_THROW(plotpipe::build_chunks(false, {spec({})}), plotpipe::OptionError);
}

TEST(Chunk, options_carry_over_except_legend) {
    plotpipe::CurveSpec first = spec({{1, 2}, {3, 4}});
    first.options.legend = "first";
    first.options.with = "lines";
    plotpipe::CurveSpec second = spec({{1, 2}, {5, 6}});

    const auto chunks = plotpipe::build_chunks(false, {first, second});
    ASSERT_EQ(chunks.size(), 1u);
    ASSERT_EQ(chunks[0].options.size(), 2u);
    EXPECT_EQ(*chunks[0].options[1].with, "lines");
    EXPECT_FALSE(chunks[0].options[1].legend.has_value());
}

TEST(Chunk, grouping_follows_shape) {
    plotpipe::CurveSpec a = spec({{1, 2}, {3, 4}});
    plotpipe::CurveSpec b = spec({{1, 2}, {5, 6}});
    plotpipe::CurveSpec c = spec({{1, 2, 3}, {5, 6, 7}});
    plotpipe::CurveSpec d = spec({{1, 2, 3}, {5, 6, 7}, {1, 1, 1}});
    d.options.tuplesize = 3;

    const auto chunks = plotpipe::build_chunks(false, {a, b, c, d});
    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].curves.size(), 2u);
    EXPECT_EQ(chunks[1].point_count(), 3u);
    EXPECT_EQ(chunks[2].tuple_size, 3u);
    for (const auto& chunk : chunks) {
        EXPECT_NO_THROW(plotpipe::validate_chunk(chunk));
    }
}

TEST(Chunk, y2_not_allowed_in_3d) {
    plotpipe::CurveSpec s = spec({{1}, {2}, {3}});
    s.options.y2 = true;
    EXPECT_THROW(plotpipe::build_chunks(true, {s}), plotpipe::OptionError);
}

TEST(Chunk, validate_rejects_ragged_chunk) {
    plotpipe::Chunk chunk;
    chunk.tuple_size = 2;
    chunk.options.resize(1);
    chunk.curves.push_back({{1, 2}, {3}});
    EXPECT_THROW(plotpipe::validate_chunk(chunk), plotpipe::PlotError);

    chunk.curves[0] = {{1, 2}};
    EXPECT_THROW(plotpipe::validate_chunk(chunk), plotpipe::PlotError);
}

TEST(Chunk, validate_rejects_empty_chunk) {
    plotpipe::Chunk no_columns;
    no_columns.tuple_size = 0;
    no_columns.options.resize(1);
    no_columns.curves.push_back({});
    EXPECT_THROW(plotpipe::validate_chunk(no_columns), plotpipe::PlotError);

    plotpipe::Chunk no_points;
    no_points.tuple_size = 2;
    no_points.options.resize(1);
    no_points.curves.push_back({{}, {}});
    EXPECT_THROW(plotpipe::validate_chunk(no_points), plotpipe::PlotError);
}

TEST(GridWidth, follows_array_shape) {
    EXPECT_EQ(plotpipe::grid_width_of(false, {3}), 0u);
    EXPECT_EQ(plotpipe::grid_width_of(true, {3}), 0u);
    EXPECT_EQ(plotpipe::grid_width_of(true, {2, 3}), 3u);
}

TEST(GridWidth, rejects_2d_data_in_2d_plot) {
    EXPECT_THROW(plotpipe::grid_width_of(false, {2, 2}), plotpipe::OptionError);
    EXPECT_THROW(plotpipe::grid_width_of(true, {1, 2, 3}), plotpipe::OptionError);
    EXPECT_THROW(plotpipe::grid_width_of(true, {2, 0}), plotpipe::OptionError);
}

TEST(ToColumn, widens_integers_and_floats) {
    const std::vector<int16_t> shorts = {-3, 0, 7};
    EXPECT_EQ(plotpipe::to_column(shorts.data(), shorts.size(), sizeof(int16_t), false),
              (plotpipe::Column{-3, 0, 7}));

    const std::vector<float> floats = {0.5f, 1.5f};
    EXPECT_EQ(plotpipe::to_column(floats.data(), floats.size(), sizeof(float), true),
              (plotpipe::Column{0.5, 1.5}));

    const std::vector<int64_t> longs = {1LL << 40};
    EXPECT_EQ(plotpipe::to_column(longs.data(), longs.size(), sizeof(int64_t), false)[0],
              static_cast<double>(1LL << 40));

    EXPECT_THROW(plotpipe::to_column(floats.data(), floats.size(), 3, true), plotpipe::OptionError);
}
