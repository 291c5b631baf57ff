#pragma once

#include <stdexcept>
#include <string>

namespace plotpipe {

constexpr const char* HANG_MESSAGE =
    "Gnuplot process no longer responding. This is likely a bug in plotpipe\n"
    "and/or gnuplot itself. Please report this as a plotpipe bug.";

// Base of everything the library throws.
class PlotError : public std::runtime_error {
public:
    explicit PlotError(const std::string& message) : std::runtime_error(message) {}
};

// gnuplot could not be launched. Thrown from session construction only.
class SpawnError : public PlotError {
public:
    explicit SpawnError(const std::string& message) : PlotError(message) {}
};

// A command would break the stderr synchronization; nothing was written.
class ProtocolGuardError : public PlotError {
public:
    explicit ProtocolGuardError(const std::string& message) : PlotError(message) {}
};

// gnuplot itself refused a command. diagnostic() is its stderr text verbatim.
class CommandRejected : public PlotError {
public:
    CommandRejected(const std::string& message, const std::string& diagnostic)
        : PlotError(message), diagnostic_(diagnostic) {}

    const std::string& diagnostic() const { return diagnostic_; }

private:
    std::string diagnostic_;
};

// The child stopped answering checkpoints. The session is unusable afterwards.
class HangTimeout : public PlotError {
public:
    explicit HangTimeout(const std::string& message) : PlotError(message) {}
};

// Bad plot/curve option key, value or combination.
class OptionError : public PlotError {
public:
    explicit OptionError(const std::string& message) : PlotError(message) {}
};

}  // namespace plotpipe
