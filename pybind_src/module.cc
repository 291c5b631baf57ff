#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include "errors.h"
#include "plot.h"

namespace py = pybind11;

namespace {

bool is_numpy_float(const py::dtype& dt) {
    return dt.kind() == 'f';  // float32 or float64
}

bool is_numpy_integer(const py::dtype& dt) {
    return dt.kind() == 'i';  // int8 .. int64
}

// Option values arrive as Python objects; the option parser wants text.
std::string option_text(const py::handle& value) {
    if (py::isinstance<py::bool_>(value)) {
        return value.cast<bool>() ? "1" : "0";
    }
    if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
        std::string joined;
        for (const auto& item : value) {
            if (!joined.empty()) joined += "\n";
            joined += py::str(item).cast<std::string>();
        }
        return joined;
    }
    return py::str(value).cast<std::string>();
}

plotpipe::OptionMap to_option_map(const py::dict& kwargs) {
    plotpipe::OptionMap out;
    for (const auto& item : kwargs) {
        out[item.first.cast<std::string>()] = option_text(item.second);
    }
    return out;
}

// Keys of the closed plot option set go to the session, everything else is
// treated as a curve option.
void split_options(const py::dict& kwargs, plotpipe::OptionMap& plot_opts, plotpipe::OptionMap& curve_opts) {
    for (const auto& item : kwargs) {
        const std::string key = item.first.cast<std::string>();
        if (plotpipe::plot_option_key(key)) {
            plot_opts[key] = option_text(item.second);
        } else {
            curve_opts[key] = option_text(item.second);
        }
    }
}

// A 1D array is one column. In a 3D plot a 2D array is a grid whose rows
// become the implicit domain.
plotpipe::Column array_column(const py::handle& obj, bool is3d, std::size_t& grid_width) {
    py::array data = py::array::ensure(obj);
    if (!data) {
        throw plotpipe::OptionError("plot() data must be numeric arrays");
    }
    if (!(data.flags() & py::array::c_style)) {
        throw plotpipe::OptionError("Input array must be C-contiguous");
    }

    py::dtype dtype = data.dtype();
    if (!is_numpy_float(dtype) && !is_numpy_integer(dtype)) {
        throw plotpipe::OptionError("Unsupported array dtype kind '" + std::string(1, dtype.kind()) + "'");
    }
    std::vector<std::size_t> shape;
    for (py::ssize_t d = 0; d < data.ndim(); ++d) {
        shape.push_back(static_cast<std::size_t>(data.shape(d)));
    }
    const std::size_t width = plotpipe::grid_width_of(is3d, shape);
    if (width != 0) grid_width = width;

    py::buffer_info info = data.request();
    return plotpipe::to_column(info.ptr, static_cast<std::size_t>(info.size),
                               static_cast<std::size_t>(info.itemsize), is_numpy_float(dtype));
}

plotpipe::CurveSpec make_curve(const py::args& arrays, const plotpipe::OptionMap& curve_opts, bool is3d) {
    plotpipe::CurveSpec spec;
    spec.options = plotpipe::parse_curve_options(curve_opts);
    for (const auto& array : arrays) {
        spec.columns.push_back(array_column(array, is3d, spec.grid_width));
    }
    return spec;
}

// [{"data": [x, y], "with": "lines", ...}, ...]
std::vector<plotpipe::CurveSpec> make_curves(const py::list& curves, bool is3d) {
    std::vector<plotpipe::CurveSpec> out;
    for (const auto& entry : curves) {
        py::dict curve = entry.cast<py::dict>();
        if (!curve.contains("data")) {
            throw plotpipe::OptionError("each curve needs a 'data' entry");
        }

        plotpipe::OptionMap curve_opts;
        for (const auto& item : curve) {
            const std::string key = item.first.cast<std::string>();
            if (key != "data") curve_opts[key] = option_text(item.second);
        }

        plotpipe::CurveSpec spec;
        spec.options = plotpipe::parse_curve_options(curve_opts);
        for (const auto& column : curve["data"]) {
            spec.columns.push_back(array_column(column, is3d, spec.grid_width));
        }
        out.push_back(std::move(spec));
    }
    return out;
}

void module_plot(const py::args& arrays, const py::kwargs& kwargs, const char* force_key, const char* force_value) {
    plotpipe::OptionMap plot_opts, curve_opts;
    split_options(kwargs, plot_opts, curve_opts);
    if (force_key) plot_opts[force_key] = force_value;

    if (arrays.size() == 0) {
        throw plotpipe::OptionError("plot() was not given any data");
    }
    const plotpipe::PlotOptions options = plotpipe::parse_plot_options(plot_opts);
    std::vector<plotpipe::CurveSpec> curves{make_curve(arrays, curve_opts, options.is3d)};
    plotpipe::plot(options, curves);
}

}  // namespace

PYBIND11_MODULE(plotpipe_py, m) {
    m.doc() = "Python bindings for plotpipe, a gnuplot process driver";

    auto& base = py::register_exception<plotpipe::PlotError>(m, "PlotError", PyExc_RuntimeError);
    py::register_exception<plotpipe::SpawnError>(m, "SpawnError", base.ptr());
    py::register_exception<plotpipe::ProtocolGuardError>(m, "ProtocolGuardError", base.ptr());
    py::register_exception<plotpipe::CommandRejected>(m, "CommandRejected", base.ptr());
    py::register_exception<plotpipe::HangTimeout>(m, "HangTimeout", base.ptr());
    py::register_exception<plotpipe::OptionError>(m, "OptionError", base.ptr());

    py::class_<plotpipe::PlotSession>(m, "Session")
        .def(py::init([](const py::kwargs& kwargs) {
            return std::make_unique<plotpipe::PlotSession>(plotpipe::parse_plot_options(to_option_map(kwargs)));
        }), R"pbdoc(
            Start a gnuplot process. Keyword arguments are plot options
            (title, xmin, terminal, output, binary, ...).
        )pbdoc")
        .def("plot", [](plotpipe::PlotSession& self, const py::args& arrays, const py::kwargs& kwargs) {
            if (arrays.size() == 0) {
                throw plotpipe::OptionError("plot() was not given any data");
            }
            self.plot({make_curve(arrays, to_option_map(kwargs), self.options().is3d)});
        }, R"pbdoc(
            Plot one curve. Positional arguments are the data columns,
            keyword arguments curve options (legend, with, y2, tuplesize).
        )pbdoc")
        .def("plot_curves", [](plotpipe::PlotSession& self, const py::list& curves) {
            self.plot(make_curves(curves, self.options().is3d));
        }, py::arg("curves"))
        .def("close", &plotpipe::PlotSession::close)
        .def_property_readonly("stuck", &plotpipe::PlotSession::stuck)
        .def_property_readonly("closed", &plotpipe::PlotSession::closed);

    m.def("plot", [](const py::args& a, const py::kwargs& k) { module_plot(a, k, nullptr, nullptr); });
    m.def("plot3d", [](const py::args& a, const py::kwargs& k) { module_plot(a, k, "3d", "1"); });
    m.def("plotlines", [](const py::args& a, const py::kwargs& k) { module_plot(a, k, "globalwith", "lines"); });
    m.def("plotpoints", [](const py::args& a, const py::kwargs& k) { module_plot(a, k, "globalwith", "points"); });
    m.def("close", &plotpipe::close_default_session, "Close the shared gnuplot session");
}
