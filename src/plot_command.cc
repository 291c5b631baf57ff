// plot_command.cc
#include "plot_command.h"
#include "checkpoint.h"
#include "errors.h"
#include "payload_encoder.h"

namespace plotpipe {

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i != 0) out += sep;
        out += parts[i];
    }
    return out;
}

}  // namespace

std::string curve_clause(const CurveOptions& options, const std::string& globalwith) {
    std::string cmd;

    if (options.legend) {
        cmd += "title \"" + *options.legend + "\"";
    } else {
        cmd += "notitle";
    }

    // an explicitly empty per-curve style falls back on the global one
    const std::string with = options.with && !options.with->empty() ? *options.with : globalwith;
    if (!with.empty()) cmd += " with " + with;

    if (options.y2.value_or(false)) cmd += " axes x1y2";
    return cmd;
}

std::string binary_format(std::size_t tuple_size, std::size_t records) {
    std::string format = "binary record=" + std::to_string(records) + " format=\"";
    for (std::size_t i = 0; i < tuple_size; ++i) format += "%double";
    format += "\"";

    // without an explicit "using" gnuplot applies its own implicit-tuple
    // rules, which break e.g. 'with image' in binary
    format += " using ";
    for (std::size_t i = 1; i <= tuple_size; ++i) {
        if (i != 1) format += ':';
        format += std::to_string(i);
    }
    return format;
}

PlotCommand build_plot_command(const std::vector<Chunk>& chunks, bool is3d, bool binary,
                               const std::string& globalwith) {
    PlotCommand out;

    bool any_y2 = false;
    for (const auto& chunk : chunks) {
        for (const auto& options : chunk.options) {
            any_y2 = any_y2 || options.y2.value_or(false);
        }
    }
    if (any_y2) {
        if (is3d) throw OptionError("3d plots don't have a y2 axis");
        out.preamble = "set ytics nomirror\nset y2tics\n";
    }

    const std::string verb = is3d ? "splot " : "plot ";
    std::vector<std::string> clauses;
    std::vector<std::string> minimal_clauses;

    for (const auto& chunk : chunks) {
        for (const auto& options : chunk.options) {
            const std::string clause = curve_clause(options, globalwith);

            if (binary) {
                clauses.push_back("'-' " + binary_format(chunk.tuple_size, chunk.point_count()) + " " + clause);
                minimal_clauses.push_back("'-' " + binary_format(chunk.tuple_size, 1) + " " + clause);

                // One record per curve. If the command is rejected gnuplot
                // reads these as empty commands; if it is accepted it plots
                // them. Each newline may be consumed as data too, so send a
                // full record's worth of both.
                for (std::size_t i = 0; i < chunk.tuple_size * sizeof(double); ++i) {
                    out.test_payload += " \n";
                }
            } else {
                // text mode commands don't depend on the point count
                clauses.push_back("'-' " + clause);
                for (std::size_t i = 0; i < chunk.tuple_size; ++i) out.test_payload += TEST_DATA_UNIT;
                out.test_payload += "\n";
                out.test_payload += END_OF_DATA;
                out.test_payload += "\n";
            }
        }
    }

    out.command = verb + join(clauses, ", ");
    out.minimal = binary ? verb + join(minimal_clauses, ", ") : out.command;
    return out;
}

}  // namespace plotpipe
