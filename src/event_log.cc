// event_log.cc
#include "event_log.h"
#include <cstdio>
#include <iostream>

namespace plotpipe {

EventLog::EventLog(bool enabled, std::ostream* out)
    : enabled_(enabled), out_(out ? out : &std::cerr), t0_(std::chrono::steady_clock::now()) {}

double EventLog::elapsed() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t0_).count();
}

void EventLog::event(const std::string& what) const {
    if (!enabled_) return;

    // `what` may contain '%', so only the prefix goes through printf
    char prefix[96];
    std::snprintf(prefix, sizeof(prefix), "==== plotpipe PID %d at t=%.4f:",
                  static_cast<int>(pid_), elapsed());
    *out_ << prefix << " " << what << std::endl;
}

void EventLog::sent(const char* data, std::size_t size) const {
    if (!enabled_) return;

    event("Sent to child process " + std::to_string(size) + " bytes ==========");
    out_->write(data, static_cast<std::streamsize>(size));
    *out_ << "\n=========================" << std::endl;
}

}  // namespace plotpipe
