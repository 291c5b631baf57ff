// plot.cc
#include "plot.h"
#include "errors.h"
#include <memory>
#include <mutex>

namespace plotpipe {

namespace {

std::mutex default_mutex;
std::unique_ptr<PlotSession> default_instance;

}  // namespace

PlotSession& default_session() {
    std::lock_guard<std::mutex> lock(default_mutex);
    if (!default_instance || default_instance->closed() || default_instance->stuck()) {
        default_instance.reset();
        default_instance = std::make_unique<PlotSession>();
    }
    return *default_instance;
}

PlotSession& reset_default_session(const PlotOptions& options, SessionConfig config) {
    std::lock_guard<std::mutex> lock(default_mutex);
    // the old gnuplot goes away before the new one starts
    default_instance.reset();
    default_instance = std::make_unique<PlotSession>(options, std::move(config));
    return *default_instance;
}

void close_default_session() {
    std::lock_guard<std::mutex> lock(default_mutex);
    default_instance.reset();
}

void plot(const PlotOptions& options, const std::vector<CurveSpec>& curves) {
    if (curves.empty()) throw OptionError("plot() was not given any data");
    reset_default_session(options).plot(curves);
}

void plot(const std::vector<CurveSpec>& curves) {
    if (curves.empty()) throw OptionError("plot() was not given any data");
    default_session().plot(curves);
}

void plot3d(const std::vector<CurveSpec>& curves, PlotOptions options) {
    options.is3d = true;
    plot(options, curves);
}

void plotlines(const std::vector<CurveSpec>& curves, PlotOptions options) {
    options.globalwith = "lines";
    plot(options, curves);
}

void plotpoints(const std::vector<CurveSpec>& curves, PlotOptions options) {
    options.globalwith = "points";
    plot(options, curves);
}

}  // namespace plotpipe
