#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "process_supervisor.h"

namespace plotpipe {

// Every key a session accepts. Anything else is rejected at the boundary.
enum class PlotOptionKey {
    ThreeD, Dump, Binary, Log, ExtraCmds, NoGrid, Square, SquareXY, Title,
    Hardcopy, Terminal, Output, GlobalWith,
    XLabel, XMax, XMin, Y2Label, Y2Max, Y2Min, YLabel, YMax, YMin,
    ZLabel, ZMax, ZMin, CbMin, CbMax
};

// Every key a single curve accepts.
enum class CurveOptionKey { Legend, Y2, With, TupleSize };

std::optional<PlotOptionKey> plot_option_key(const std::string& name);
std::optional<CurveOptionKey> curve_option_key(const std::string& name);

// Session-scoped settings, fixed when the session is created.
struct PlotOptions {
    bool is3d = false;
    bool dump = false;       // write to stdout instead of gnuplot
    bool binary = false;     // binary payloads instead of text
    bool log = false;        // trace the conversation on stderr
    bool nogrid = false;
    bool square = false;
    bool square_xy = false;

    std::vector<std::string> extracmds;

    std::optional<std::string> title;
    std::optional<std::string> hardcopy;
    std::optional<std::string> terminal;
    std::optional<std::string> output;
    std::optional<std::string> globalwith;

    std::optional<std::string> xlabel, ylabel, zlabel, y2label;
    std::optional<double> xmin, xmax, ymin, ymax, zmin, zmax, y2min, y2max, cbmin, cbmax;
};

// Per-curve settings. Unset fields inherit from the previous curve.
struct CurveOptions {
    std::optional<std::string> legend;
    std::optional<bool> y2;
    std::optional<std::string> with;
    std::optional<std::size_t> tuplesize;
};

using OptionMap = std::map<std::string, std::string>;

// String key/values to typed options. Throws OptionError on unknown keys or
// malformed values. Booleans take 1/0/true/false/yes/no; "extracmds" may
// hold several newline-separated commands.
PlotOptions parse_plot_options(const OptionMap& options);
CurveOptions parse_curve_options(const OptionMap& options);

// Fills defaults and checks option combinations. Non-fatal complaints
// (terminal without output, ...) go to `warn`.
PlotOptions resolve_plot_options(PlotOptions options, const GnuplotFeatures& features,
                                 const std::function<void(const std::string&)>& warn);

// The "set ..." commands a resolved option set needs at session start.
// terminal and output are not included; they are applied per plot.
std::string setup_commands(const PlotOptions& options);

// Shortest text that reads back as the same double.
std::string format_number(double value);

}  // namespace plotpipe
