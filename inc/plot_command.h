#pragma once

#include <string>
#include <vector>
#include "chunk.h"

namespace plotpipe {

// gnuplot prints this after a dry-run plot only if the plot command worked.
constexpr const char* PLOT_SUCCEEDED_TOKEN = "xxxxxxx Plot succeeded xxxxxxx";

struct PlotCommand {
    std::string preamble;      // y2 axis setup, may be empty
    std::string command;       // the real plot/splot line
    std::string minimal;       // same, one record per curve (binary only)
    std::string test_payload;  // placeholder data matching `minimal`
};

// "title ... with ... axes ..." for one curve. `globalwith` applies when the
// curve has no style of its own.
std::string curve_clause(const CurveOptions& options, const std::string& globalwith);

// binary record=<records> format="%double..." using 1:2:...
std::string binary_format(std::size_t tuple_size, std::size_t records);

// The plot command for `chunks` plus the dry-run variant that validates it
// cheaply. y2 curves in a 3D plot are an OptionError.
PlotCommand build_plot_command(const std::vector<Chunk>& chunks, bool is3d, bool binary,
                               const std::string& globalwith);

}  // namespace plotpipe
