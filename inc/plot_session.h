// plot_session.h
#pragma once

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>
#include "checkpoint.h"
#include "chunk.h"
#include "command_channel.h"
#include "event_log.h"
#include "plot_command.h"
#include "plot_options.h"
#include "process_supervisor.h"

namespace plotpipe {

// How to run gnuplot and where diagnostics go. Unlike PlotOptions this is
// not part of the plotting vocabulary.
struct SessionConfig {
    std::string executable = "gnuplot";
    std::chrono::milliseconds checkpoint_timeout = DEFAULT_CHECKPOINT_TIMEOUT;
    WarningSink warning_sink;            // default: "Gnuplot warning: ..." on std::cerr
    WarningSink option_warning_sink;     // our own complaints; default: "plotpipe warning: ..."
    std::ostream* log_stream = nullptr;  // default: std::cerr
};

// One gnuplot process and the plot settings it was started with. Calls are
// synchronous and must not overlap.
class PlotSession {
public:
    // Starts gnuplot and applies the session options. Throws SpawnError,
    // OptionError or CommandRejected.
    explicit PlotSession(const PlotOptions& options = {}, SessionConfig config = {});
    ~PlotSession();

    PlotSession(const PlotSession&) = delete;
    PlotSession& operator=(const PlotSession&) = delete;

    // Validates the plot command with a one-record dry run, then sends it
    // with the full data.
    void draw(const std::vector<Chunk>& chunks);

    // build_chunks() with this session's 2D/3D mode, then draw().
    void plot(const std::vector<CurveSpec>& curves);

    std::string checkpoint(const CheckpointMode& mode = {});
    void send_guarded(const std::string& text, const GuardOverrides& overrides = {});

    // Unguarded single line. The caller owns the consequences.
    void send(const std::string& line);

    void close();

    bool stuck() const { return supervisor_.stuck(); }
    bool closed() const { return closed_; }
    const PlotOptions& options() const { return options_; }
    SyncState sync_state() const { return sync_.state(); }
    std::size_t bytes_written() const { return supervisor_.bytes_written(); }
    pid_t pid() const { return supervisor_.pid(); }

private:
    void ensure_usable() const;
    void test_plot_command(const PlotCommand& cmd);
    void warn(const std::string& message) const;

    SessionConfig config_;
    EventLog log_;
    ProcessSupervisor supervisor_;
    CommandChannel channel_;
    SyncProtocol sync_;
    PlotOptions options_;
    bool closed_ = false;
};

}  // namespace plotpipe
