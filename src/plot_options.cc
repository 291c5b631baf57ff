// plot_options.cc
#include "plot_options.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace plotpipe {

namespace {

const std::vector<std::pair<const char*, PlotOptionKey>>& plot_keys() {
    static const std::vector<std::pair<const char*, PlotOptionKey>> keys = {
        {"3d", PlotOptionKey::ThreeD},         {"dump", PlotOptionKey::Dump},
        {"binary", PlotOptionKey::Binary},     {"log", PlotOptionKey::Log},
        {"extracmds", PlotOptionKey::ExtraCmds}, {"nogrid", PlotOptionKey::NoGrid},
        {"square", PlotOptionKey::Square},     {"square_xy", PlotOptionKey::SquareXY},
        {"title", PlotOptionKey::Title},       {"hardcopy", PlotOptionKey::Hardcopy},
        {"terminal", PlotOptionKey::Terminal}, {"output", PlotOptionKey::Output},
        {"globalwith", PlotOptionKey::GlobalWith},
        {"xlabel", PlotOptionKey::XLabel},     {"xmax", PlotOptionKey::XMax},
        {"xmin", PlotOptionKey::XMin},         {"y2label", PlotOptionKey::Y2Label},
        {"y2max", PlotOptionKey::Y2Max},       {"y2min", PlotOptionKey::Y2Min},
        {"ylabel", PlotOptionKey::YLabel},     {"ymax", PlotOptionKey::YMax},
        {"ymin", PlotOptionKey::YMin},         {"zlabel", PlotOptionKey::ZLabel},
        {"zmax", PlotOptionKey::ZMax},         {"zmin", PlotOptionKey::ZMin},
        {"cbmin", PlotOptionKey::CbMin},       {"cbmax", PlotOptionKey::CbMax},
    };
    return keys;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_bool(const std::string& key, const std::string& value) {
    const std::string v = lowercase(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw OptionError("option '" + key + "' expects a boolean, got \"" + value + "\"");
}

double parse_double(const std::string& key, const std::string& value) {
    double out = 0.0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, out, std::chars_format::general);
    if (ec != std::errc() || ptr != end) {
        throw OptionError("option '" + key + "' expects a number, got \"" + value + "\"");
    }
    return out;
}

std::size_t parse_count(const std::string& key, const std::string& value) {
    std::size_t out = 0;
    const char* begin = value.data();
    const char* end = begin + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, out, 10);
    if (ec != std::errc() || ptr != end) {
        throw OptionError("option '" + key + "' expects a positive integer, got \"" + value + "\"");
    }
    return out;
}

std::string join_keys(const std::vector<std::string>& keys) {
    std::string out;
    for (const auto& k : keys) {
        if (!out.empty()) out += ' ';
        out += k;
    }
    return out;
}

std::string range_command(const char* axis, const std::optional<double>& lo,
                          const std::optional<double>& hi) {
    if (!lo && !hi) return "";
    return std::string("set ") + axis + " [" + (lo ? format_number(*lo) : "") + ":" +
           (hi ? format_number(*hi) : "") + "]\n";
}

std::string quoted_command(const char* what, const std::optional<std::string>& text) {
    if (!text) return "";
    return std::string("set ") + what + " \"" + *text + "\"\n";
}

}  // namespace

std::optional<PlotOptionKey> plot_option_key(const std::string& name) {
    for (const auto& [text, key] : plot_keys()) {
        if (name == text) return key;
    }
    return std::nullopt;
}

std::optional<CurveOptionKey> curve_option_key(const std::string& name) {
    if (name == "legend") return CurveOptionKey::Legend;
    if (name == "y2") return CurveOptionKey::Y2;
    if (name == "with") return CurveOptionKey::With;
    if (name == "tuplesize") return CurveOptionKey::TupleSize;
    return std::nullopt;
}

std::string format_number(double value) {
    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    if (ec != std::errc()) {
        throw PlotError("Couldn't format number");
    }
    return std::string(buf, ptr);
}

PlotOptions parse_plot_options(const OptionMap& options) {
    std::vector<std::string> bad;
    for (const auto& kv : options) {
        if (!plot_option_key(kv.first)) bad.push_back(kv.first);
    }
    if (!bad.empty()) {
        throw OptionError("got option(s) that were NOT a plot option: (" + join_keys(bad) + ")");
    }

    PlotOptions out;
    for (const auto& [name, value] : options) {
        switch (*plot_option_key(name)) {
            case PlotOptionKey::ThreeD: out.is3d = parse_bool(name, value); break;
            case PlotOptionKey::Dump: out.dump = parse_bool(name, value); break;
            case PlotOptionKey::Binary: out.binary = parse_bool(name, value); break;
            case PlotOptionKey::Log: out.log = parse_bool(name, value); break;
            case PlotOptionKey::NoGrid: out.nogrid = parse_bool(name, value); break;
            case PlotOptionKey::Square: out.square = parse_bool(name, value); break;
            case PlotOptionKey::SquareXY: out.square_xy = parse_bool(name, value); break;
            case PlotOptionKey::ExtraCmds: {
                std::size_t start = 0;
                while (start <= value.size()) {
                    std::size_t end = value.find('\n', start);
                    if (end == std::string::npos) end = value.size();
                    if (end > start) out.extracmds.push_back(value.substr(start, end - start));
                    start = end + 1;
                }
                break;
            }
            case PlotOptionKey::Title: out.title = value; break;
            case PlotOptionKey::Hardcopy: out.hardcopy = value; break;
            case PlotOptionKey::Terminal: out.terminal = value; break;
            case PlotOptionKey::Output: out.output = value; break;
            case PlotOptionKey::GlobalWith: out.globalwith = value; break;
            case PlotOptionKey::XLabel: out.xlabel = value; break;
            case PlotOptionKey::YLabel: out.ylabel = value; break;
            case PlotOptionKey::ZLabel: out.zlabel = value; break;
            case PlotOptionKey::Y2Label: out.y2label = value; break;
            case PlotOptionKey::XMin: out.xmin = parse_double(name, value); break;
            case PlotOptionKey::XMax: out.xmax = parse_double(name, value); break;
            case PlotOptionKey::YMin: out.ymin = parse_double(name, value); break;
            case PlotOptionKey::YMax: out.ymax = parse_double(name, value); break;
            case PlotOptionKey::ZMin: out.zmin = parse_double(name, value); break;
            case PlotOptionKey::ZMax: out.zmax = parse_double(name, value); break;
            case PlotOptionKey::Y2Min: out.y2min = parse_double(name, value); break;
            case PlotOptionKey::Y2Max: out.y2max = parse_double(name, value); break;
            case PlotOptionKey::CbMin: out.cbmin = parse_double(name, value); break;
            case PlotOptionKey::CbMax: out.cbmax = parse_double(name, value); break;
        }
    }
    return out;
}

CurveOptions parse_curve_options(const OptionMap& options) {
    std::vector<std::string> bad;
    for (const auto& kv : options) {
        if (!curve_option_key(kv.first)) bad.push_back(kv.first);
    }
    if (!bad.empty()) {
        throw OptionError("plot() got some unknown curve options: (" + join_keys(bad) + ")");
    }

    CurveOptions out;
    for (const auto& [name, value] : options) {
        switch (*curve_option_key(name)) {
            case CurveOptionKey::Legend: out.legend = value; break;
            case CurveOptionKey::Y2: out.y2 = parse_bool(name, value); break;
            case CurveOptionKey::With: out.with = value; break;
            case CurveOptionKey::TupleSize: out.tuplesize = parse_count(name, value); break;
        }
    }
    return out;
}

PlotOptions resolve_plot_options(PlotOptions options, const GnuplotFeatures& features,
                                 const std::function<void(const std::string&)>& warn) {
    if (!options.globalwith) options.globalwith = "linespoints";

    if (options.is3d) {
        if (options.y2min || options.y2max) {
            throw OptionError("'3d' does not make sense with 'y2'...");
        }
        if (!features.equal_3d && (options.square || options.square_xy)) {
            warn("Your gnuplot doesn't support square aspect ratios for 3D plots, so I'm ignoring that");
            options.square = false;
            options.square_xy = false;
        }
    } else if (options.square_xy) {
        throw OptionError("'square'_xy only makes sense with '3d'");
    }

    if (options.hardcopy) {
        if (options.terminal || options.output) {
            throw OptionError(
                "The 'hardcopy' option can't coexist with either 'terminal' or 'output'. If the\n"
                "defaults are acceptable, use 'hardcopy' only, otherwise use 'terminal' and\n"
                "'output' to get more control.");
        }

        const std::string& file = *options.hardcopy;
        const std::size_t dot = file.rfind('.');
        const std::string ext = dot == std::string::npos ? "" : file.substr(dot + 1);

        static const std::map<std::string, std::string> terminals = {
            {"eps", "postscript solid color enhanced eps"},
            {"ps", "postscript solid color landscape 10"},
            {"pdf", "pdf solid color font \",10\" size 11in,8.5in"},
            {"png", "png size 1280,1024"},
        };
        auto found = terminals.find(ext);
        if (found == terminals.end()) {
            throw OptionError("Only .eps, .ps, .pdf and .png hardcopy output supported");
        }
        options.terminal = found->second;
        options.output = file;
    }

    if (options.terminal && !options.output) {
        warn("defined gnuplot terminal, but NOT an output file. Is this REALLY what you want?");
    }

    return options;
}

std::string setup_commands(const PlotOptions& options) {
    std::string cmd;

    if (!options.nogrid) cmd += "set grid\n";

    cmd += range_command("xrange", options.xmin, options.xmax);
    cmd += range_command("yrange", options.ymin, options.ymax);
    cmd += range_command("zrange", options.zmin, options.zmax);
    cmd += range_command("cbrange", options.cbmin, options.cbmax);
    cmd += range_command("y2range", options.y2min, options.y2max);

    cmd += quoted_command("xlabel", options.xlabel);
    cmd += quoted_command("ylabel", options.ylabel);
    cmd += quoted_command("zlabel", options.zlabel);
    cmd += quoted_command("y2label", options.y2label);
    cmd += quoted_command("title", options.title);

    // gnuplot squares 2D and 3D plots differently
    if (options.is3d) {
        if (options.square) {
            cmd += "set view equal xyz\n";
        } else if (options.square_xy) {
            cmd += "set view equal xy\n";
        }
    } else if (options.square) {
        cmd += "set size ratio -1\n";
    }

    for (const auto& extra : options.extracmds) {
        cmd += extra + "\n";
    }
    return cmd;
}

}  // namespace plotpipe
