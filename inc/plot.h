#pragma once

#include <vector>
#include "chunk.h"
#include "plot_options.h"
#include "plot_session.h"

namespace plotpipe {

// Process-wide session behind the free functions. Created on first use and
// recreated when it was closed or got stuck.
PlotSession& default_session();

// Replaces the default session with one built from `options`.
PlotSession& reset_default_session(const PlotOptions& options = {}, SessionConfig config = {});

void close_default_session();

// With options: a fresh default session using them. Without: the current one.
void plot(const PlotOptions& options, const std::vector<CurveSpec>& curves);
void plot(const std::vector<CurveSpec>& curves);

// Same as plot() with the named option forced.
void plot3d(const std::vector<CurveSpec>& curves, PlotOptions options = {});
void plotlines(const std::vector<CurveSpec>& curves, PlotOptions options = {});
void plotpoints(const std::vector<CurveSpec>& curves, PlotOptions options = {});

}  // namespace plotpipe
