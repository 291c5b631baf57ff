// chunk.cc

#include "chunk.h"
#include "errors.h"
#include <cstdint>
#include <string>

namespace plotpipe {

namespace {

// Options are cumulative except the legend, so curves don't end up named the same
CurveOptions merge(const CurveOptions& base, const CurveOptions& update) {
    CurveOptions out = base;
    out.legend = update.legend;
    if (update.y2) out.y2 = update.y2;
    if (update.with) out.with = update.with;
    if (update.tuplesize) out.tuplesize = update.tuplesize;
    return out;
}

Column sequence(std::size_t n) {
    Column out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<double>(i);
    return out;
}

template <typename T>
Column widen(const void* data, std::size_t n) {
    const T* typed = reinterpret_cast<const T*>(data);
    Column out(n);
    for (std::size_t i = 0; i < n; ++i) out[i] = static_cast<double>(typed[i]);
    return out;
}

}  // namespace

std::vector<Chunk> build_chunks(bool is3d, const std::vector<CurveSpec>& specs) {
    std::vector<Chunk> chunks;
    CurveOptions last;

    for (const auto& spec : specs) {
        CurveOptions options = merge(last, spec.options);
        last = options;
        last.legend.reset();

        if (is3d && options.y2.value_or(false)) {
            throw OptionError("3d plots don't have a y2 axis");
        }

        const std::size_t tuple_size = options.tuplesize.value_or(is3d ? 3 : 2);
        if (tuple_size == 0) {
            throw OptionError("plot() got a tuplesize of 0");
        }

        std::vector<Column> columns = spec.columns;
        if (columns.empty()) {
            throw OptionError("plot() got a curve with no data");
        }
        if (columns.size() > tuple_size) {
            throw OptionError("plot() needed " + std::to_string(tuple_size) + " data columns, but got " +
                              std::to_string(columns.size()));
        }

        if (columns.size() < tuple_size) {
            const std::size_t n = columns.front().size();

            if (!is3d && columns.size() + 1 == tuple_size) {
                // one short in 2D: the domain is 0,1,2,...
                columns.insert(columns.begin(), sequence(n));
            } else if (is3d && columns.size() + 2 == tuple_size) {
                // two short in 3D: the domain is a grid
                const std::size_t width = spec.grid_width;
                if (width == 0 || n % width != 0) {
                    throw OptionError("plot() tried to build a 2D implicit domain, but the data is not a grid "
                                      "of width " + std::to_string(width));
                }
                Column x(n), y(n);
                for (std::size_t i = 0; i < n; ++i) {
                    x[i] = static_cast<double>(i % width);
                    y[i] = static_cast<double>(i / width);
                }
                columns.insert(columns.begin(), std::move(y));
                columns.insert(columns.begin(), std::move(x));
            } else {
                throw OptionError("plot() needed " + std::to_string(tuple_size) + " data columns, but only got " +
                                  std::to_string(columns.size()));
            }
        }

        for (std::size_t i = 1; i < columns.size(); ++i) {
            if (columns[i].size() != columns[i - 1].size()) {
                throw OptionError("plot() was given mismatched tuples to plot. " +
                                  std::to_string(columns[i].size()) + " vs " +
                                  std::to_string(columns[i - 1].size()));
            }
        }
        if (columns.front().empty()) {
            throw OptionError("plot() got a curve with no data");
        }

        const bool extends_last = !chunks.empty() &&
                                  chunks.back().tuple_size == tuple_size &&
                                  chunks.back().point_count() == columns.front().size();
        if (!extends_last) {
            chunks.emplace_back();
            chunks.back().tuple_size = tuple_size;
        }
        chunks.back().options.push_back(std::move(options));
        chunks.back().curves.push_back(std::move(columns));
    }

    return chunks;
}

void validate_chunk(const Chunk& chunk) {
    if (chunk.curves.empty() || chunk.curves.size() != chunk.options.size()) {
        throw PlotError("chunk needs one option record per curve and at least one curve");
    }
    if (chunk.tuple_size == 0) {
        throw PlotError("chunk has a tuple size of 0");
    }
    const std::size_t points = chunk.point_count();
    if (points == 0) {
        throw PlotError("chunk has no data points");
    }
    for (const auto& tuple : chunk.curves) {
        if (tuple.size() != chunk.tuple_size) {
            throw PlotError("chunk curve has " + std::to_string(tuple.size()) + " columns, expected " +
                            std::to_string(chunk.tuple_size));
        }
        for (const auto& column : tuple) {
            if (column.size() != points) {
                throw PlotError("chunk columns must all hold " + std::to_string(points) + " points");
            }
        }
    }
}

std::size_t grid_width_of(bool is3d, const std::vector<std::size_t>& shape) {
    if (shape.size() == 1) return 0;
    if (shape.size() != 2) {
        throw OptionError("plot() data must be 1D or 2D arrays, got " + std::to_string(shape.size()) + "D");
    }
    // a 2D plot would flatten the rows into one curve
    if (!is3d) {
        throw OptionError("plot() got 2D data for a 2D plot; pass one array per column, or use a 3D plot for a grid");
    }
    if (shape[1] == 0) {
        throw OptionError("plot() got a grid with empty rows");
    }
    return shape[1];
}

Column to_column(const void* data,
                 std::size_t num_elements,
                 std::size_t element_size_bytes,
                 bool is_float) {
    if (is_float) {
        if (element_size_bytes == 4) return widen<float>(data, num_elements);
        if (element_size_bytes == 8) return widen<double>(data, num_elements);
        throw OptionError("Unsupported float element size: " + std::to_string(element_size_bytes));
    }

    if (element_size_bytes == 1) return widen<int8_t>(data, num_elements);
    if (element_size_bytes == 2) return widen<int16_t>(data, num_elements);
    if (element_size_bytes == 4) return widen<int32_t>(data, num_elements);
    if (element_size_bytes == 8) return widen<int64_t>(data, num_elements);
    throw OptionError("Unsupported int element size: " + std::to_string(element_size_bytes));
}

}  // namespace plotpipe
