#pragma once

#include <vector>
#include <cstddef>
#include <string>
#include "plot_options.h"

namespace plotpipe {

// One column per tuple element (x, y, size, color, ...), all the same length.
using Column = std::vector<double>;
using Tuple = std::vector<Column>;

// A run of curves with the same tuple size and point count.
struct Chunk {
    std::size_t tuple_size = 0;
    std::vector<CurveOptions> options;  // one per curve, fully resolved
    std::vector<Tuple> curves;

    std::size_t point_count() const {
        return curves.empty() || curves.front().empty() ? 0 : curves.front().front().size();
    }
};

// One curve as the caller describes it. Options only hold what changes
// relative to the previous curve.
struct CurveSpec {
    CurveOptions options;
    std::vector<Column> columns;
    std::size_t grid_width = 0;  // 3D implicit domain: points per grid row
};

// Resolves cumulative options and implicit domains and groups the curves
// into chunks. Throws OptionError.
std::vector<Chunk> build_chunks(bool is3d, const std::vector<CurveSpec>& specs);

// Throws PlotError unless every curve in the chunk has tuple_size columns of
// point_count() values.
void validate_chunk(const Chunk& chunk);

// Grid width for array data of the given shape: 0 for 1D data, the row
// length for 2D data in a 3D plot. Anything else is an OptionError.
std::size_t grid_width_of(bool is3d, const std::vector<std::size_t>& shape);

Column to_column(const void* data,
                 std::size_t num_elements,
                 std::size_t element_size_bytes,
                 bool is_float);

}  // namespace plotpipe
