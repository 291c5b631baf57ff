#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <sys/types.h>

namespace plotpipe {

// Timestamped trace of everything a session does with its child. Silent
// unless enabled with the `log` plot option.
class EventLog {
public:
    explicit EventLog(bool enabled = false, std::ostream* out = nullptr);

    void set_enabled(bool enabled) { enabled_ = enabled; }
    bool enabled() const { return enabled_; }
    void set_pid(pid_t pid) { pid_ = pid; }

    void event(const std::string& what) const;

    // Mirrors bytes written to the child, binary payloads included.
    void sent(const char* data, std::size_t size) const;

    // Seconds since the log (and its session) was created.
    double elapsed() const;

private:
    bool enabled_;
    std::ostream* out_;
    pid_t pid_ = -1;
    std::chrono::steady_clock::time_point t0_;
};

}  // namespace plotpipe
