#pragma once

#include <chrono>
#include <cstddef>
#include <set>
#include <string>
#include <vector>
#include <poll.h>
#include <sys/types.h>
#include "event_log.h"

namespace plotpipe {

// Command line switches and optional behaviours of one gnuplot binary.
struct GnuplotFeatures {
    std::set<std::string> switches;  // "persist", "default-settings", ...
    bool equal_3d = false;           // accepts "set view equal"

    bool has(const std::string& name) const { return switches.count(name) != 0; }
};

// Queries `executable` once per process lifetime; later calls return the
// cached result. Throws SpawnError when the binary cannot be run.
const GnuplotFeatures& gnuplot_features(const std::string& executable);

struct CaptureResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs argv[0] to completion feeding `input` on stdin. Throws SpawnError.
CaptureResult run_capture(const std::vector<std::string>& argv, const std::string& input);

struct ChildProcess {
    pid_t pid = -1;
    int in_fd = -1;            // gnuplot stdin, or our stdout when dumping
    int err_fd = -1;           // gnuplot stderr; -1 when dumping
    pollfd err_poll{-1, POLLIN, 0};
    bool owns_input = false;
    bool stuck = false;
    std::size_t bytes_written = 0;
};

// Owns the gnuplot child and its two pipes.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(EventLog& log);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Spawns `executable` with stdin/stderr piped, or attaches to our own
    // stdout when `dump` is set.
    void start(const std::string& executable, bool dump);

    // `exit` normally, SIGTERM when stuck. Always reaps.
    void terminate();

    void write(const char* data, std::size_t size);
    void write(const std::string& data) { write(data.data(), data.size()); }

    // Waits up to `timeout` for diagnostic bytes. false on timeout.
    bool wait_readable(std::chrono::milliseconds timeout);

    // Appends whatever is available on the diagnostic pipe. 0 means EOF.
    std::size_t read_available(std::string& into);

    bool running() const { return child_.in_fd >= 0; }
    bool has_diagnostic_channel() const { return child_.err_fd >= 0; }
    bool stuck() const { return child_.stuck; }
    void mark_stuck() { child_.stuck = true; }
    pid_t pid() const { return child_.pid; }
    std::size_t bytes_written() const { return child_.bytes_written; }

private:
    EventLog& log_;
    ChildProcess child_;
};

}  // namespace plotpipe
