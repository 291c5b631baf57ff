// plot_session.cc
#include "plot_session.h"
#include "errors.h"
#include "payload_encoder.h"
#include <iostream>

namespace plotpipe {

namespace {

SessionConfig with_defaults(SessionConfig config) {
    if (!config.warning_sink) {
        config.warning_sink = [](const std::string& warning) {
            std::cerr << "Gnuplot warning: " << warning << std::endl;
        };
    }
    if (!config.option_warning_sink) {
        config.option_warning_sink = [](const std::string& warning) {
            std::cerr << "plotpipe warning: " << warning << std::endl;
        };
    }
    return config;
}

bool has_line_starting_with(const std::string& text, const std::string& prefix) {
    std::size_t start = 0;
    while (start < text.size()) {
        if (text.compare(start, prefix.size(), prefix) == 0) return true;
        std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return false;
}

void erase_all(std::string& text, const std::string& what) {
    for (std::size_t pos = text.find(what); pos != std::string::npos; pos = text.find(what, pos)) {
        text.erase(pos, what.size());
    }
}

}  // namespace

PlotSession::PlotSession(const PlotOptions& options, SessionConfig config)
    : config_(with_defaults(std::move(config))),
      log_(options.log, config_.log_stream),
      supervisor_(log_),
      channel_(supervisor_, log_),
      sync_(supervisor_, channel_, log_, config_.checkpoint_timeout, config_.warning_sink) {
    // nothing to query when dumping; assume a current gnuplot
    GnuplotFeatures dump_features;
    dump_features.equal_3d = true;
    const GnuplotFeatures& features = options.dump ? dump_features : gnuplot_features(config_.executable);

    options_ = resolve_plot_options(options, features, [this](const std::string& w) { warn(w); });

    supervisor_.start(config_.executable, options_.dump);
    log_.event("startGnuplot() finished");

    // plot options hold for every plot of this session, so set them now
    channel_.send_guarded(setup_commands(options_), sync_);
}

PlotSession::~PlotSession() {
    close();
}

void PlotSession::warn(const std::string& message) const {
    config_.option_warning_sink(message);
}

void PlotSession::ensure_usable() const {
    if (closed_) {
        throw PlotError("plot session is closed");
    }
    if (supervisor_.stuck()) {
        throw HangTimeout(HANG_MESSAGE);
    }
}

void PlotSession::draw(const std::vector<Chunk>& chunks) {
    ensure_usable();

    if (chunks.empty()) {
        throw OptionError("plot() was not given any data");
    }
    for (const auto& chunk : chunks) {
        validate_chunk(chunk);
    }

    const PlotCommand cmd = build_plot_command(chunks, options_.is3d, options_.binary,
                                               options_.globalwith.value_or(""));
    if (!cmd.preamble.empty()) {
        channel_.send_guarded(cmd.preamble, sync_);
    }

    // Whether gnuplot accepts the command is only known by running it, and a
    // bad command followed by a full data transfer can leave gnuplot reading
    // data as commands. Try a one-record version first.
    test_plot_command(cmd);

    // the dry run cleared the output; put the real target back
    if (options_.terminal) {
        GuardOverrides overrides;
        overrides.terminal = true;
        channel_.send_guarded("set terminal " + *options_.terminal, sync_, overrides);
    }
    if (options_.output) {
        GuardOverrides overrides;
        overrides.output = true;
        channel_.send_guarded("set output \"" + *options_.output + "\"", sync_, overrides);
    }

    channel_.send(cmd.command);
    for (const auto& chunk : chunks) {
        channel_.send_raw(encode_chunk(chunk, options_.binary));
    }

    CheckpointMode mode;
    mode.forward_warnings = true;
    std::string error = sync_.checkpoint(mode);
    if (!error.empty()) {
        throw CommandRejected("Gnuplot error: \"\n" + error + "\n\" while plotting", error);
    }
}

void PlotSession::test_plot_command(const PlotCommand& cmd) {
    channel_.send("set terminal push");
    channel_.send("set output");
    channel_.send("set terminal dumb");

    // gnuplot runs ';'-chained commands only while they succeed, so the
    // print shows up only if the plot worked
    const std::string print_success = std::string("; print \"") + PLOT_SUCCEEDED_TOKEN + "\"";
    channel_.send(cmd.minimal + print_success);
    channel_.send_raw(cmd.test_payload);

    CheckpointMode mode;
    mode.forward_warnings = true;
    mode.ignore_invalid_command = true;
    std::string message = sync_.checkpoint(mode);

    const bool rejected = supervisor_.has_diagnostic_channel() &&
                          !has_line_starting_with(message, PLOT_SUCCEEDED_TOKEN);

    channel_.send("set terminal pop");

    if (rejected) {
        erase_all(message, print_success);
        log_.event("test plot command failed");
        throw CommandRejected("Gnuplot error: \"\n" + message + "\n\" while sending plotcmd \"" + cmd.minimal + "\"",
                              message);
    }
}

void PlotSession::plot(const std::vector<CurveSpec>& curves) {
    ensure_usable();
    draw(build_chunks(options_.is3d, curves));
}

std::string PlotSession::checkpoint(const CheckpointMode& mode) {
    ensure_usable();
    return sync_.checkpoint(mode);
}

void PlotSession::send_guarded(const std::string& text, const GuardOverrides& overrides) {
    ensure_usable();
    channel_.send_guarded(text, sync_, overrides);
}

void PlotSession::send(const std::string& line) {
    ensure_usable();
    channel_.send(line);
}

void PlotSession::close() {
    if (closed_) return;
    closed_ = true;
    supervisor_.terminate();
    log_.event("session closed after " + std::to_string(supervisor_.bytes_written()) + " bytes");
}

}  // namespace plotpipe
