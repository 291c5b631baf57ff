#include "plot.h"
#include "errors.h"
#include <cmath>
#include <iostream>
#include <vector>

namespace {

using plotpipe::Column;
using plotpipe::CurveSpec;

Column linspace(double from, double to, std::size_t n) {
    Column out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = from + (to - from) * static_cast<double>(i) / static_cast<double>(n - 1);
    }
    return out;
}

CurveSpec curve(std::vector<Column> columns, const char* legend = nullptr, const char* with = nullptr) {
    CurveSpec spec;
    spec.columns = std::move(columns);
    if (legend) spec.options.legend = legend;
    if (with) spec.options.with = with;
    return spec;
}

}  // namespace

int main() {
    constexpr std::size_t N = 200;
    const Column x = linspace(-10, 10, N);

    Column sine(N), cosine(N), parabola(N);
    for (std::size_t i = 0; i < N; ++i) {
        sine[i] = std::sin(x[i]);
        cosine[i] = std::cos(x[i]);
        parabola[i] = x[i] * x[i];
    }

    try {
        // implicit domain: one column plots against 0..N-1
        plotpipe::plot({curve({sine}, "sin, implicit domain")});

        // several curves, one window
        plotpipe::PlotOptions options;
        options.title = "Multiple curves";
        options.xlabel = "x";
        plotpipe::plot(options, {curve({x, sine}, "sin(x)"), curve({x, cosine}, "cos(x)", "lines")});

        // binary transfer, right axis, error bars
        options = {};
        options.binary = true;
        options.title = "Binary, y2 and error bars";
        Column err(N, 0.2);
        CurveSpec bars = curve({x, sine, err}, "sin(x) with error", "yerrorbars");
        bars.options.tuplesize = 3;
        CurveSpec right = curve({x, parabola}, "x^2 on y2", "lines");
        right.options.y2 = true;
        plotpipe::plot(options, {bars, right});

        // variable point size
        Column size(N);
        for (std::size_t i = 0; i < N; ++i) size[i] = 0.5 + std::fabs(sine[i]) * 2;
        CurveSpec sized = curve({x, cosine, size}, "point size", "points pointsize variable pointtype 7");
        sized.options.tuplesize = 3;
        plotpipe::plotpoints({sized});

        // 3D sphere
        constexpr std::size_t th_n = 30, ph_n = 15;
        Column sx, sy, sz;
        for (std::size_t j = 0; j < ph_n; ++j) {
            for (std::size_t i = 0; i < th_n; ++i) {
                const double th = 2 * M_PI * static_cast<double>(i) / (th_n - 1);
                const double ph = M_PI * static_cast<double>(j) / (ph_n - 1);
                sx.push_back(std::cos(th) * std::sin(ph));
                sy.push_back(std::sin(th) * std::sin(ph));
                sz.push_back(std::cos(ph));
            }
        }
        plotpipe::PlotOptions sphere;
        sphere.square = true;
        sphere.title = "Sphere";
        plotpipe::plot3d({curve({sx, sy, sz}, "sphere", "lines")}, sphere);

        std::cout << "Press Enter to exit" << std::endl;
        std::cin.get();
        plotpipe::close_default_session();
    } catch (const plotpipe::PlotError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
