#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "command_channel.h"
#include "event_log.h"
#include "process_supervisor.h"

namespace plotpipe {

// gnuplot prints this on stderr once it has consumed everything sent before.
constexpr const char* CHECKPOINT_TOKEN = "xxxxxxx Synchronizing gnuplot i/o xxxxxxx";

// One column of a text-mode dry-run placeholder row.
constexpr const char* TEST_DATA_UNIT = "10 ";

constexpr std::chrono::milliseconds DEFAULT_CHECKPOINT_TIMEOUT{5000};

using WarningSink = std::function<void(const std::string&)>;

struct CheckpointMode {
    bool forward_warnings = false;
    // drop the "invalid command" reports caused by dry-run placeholder data
    bool ignore_invalid_command = false;
};

enum class SyncState { Idle, AwaitingToken, TokenFound, TimedOut };

struct Diagnostics {
    std::vector<std::string> warnings;
    std::string errors;  // trimmed
};

// Splits stderr text captured before a checkpoint token into warnings and
// whatever is left.
Diagnostics classify_diagnostics(const std::string& raw, bool ignore_invalid_command);

// Request/response emulation over gnuplot's stdin and stderr. A checkpoint
// asks gnuplot to print CHECKPOINT_TOKEN and reads stderr until it arrives;
// everything before the token belongs to the commands sent since the last
// checkpoint.
class SyncProtocol {
public:
    SyncProtocol(ProcessSupervisor& supervisor, CommandChannel& channel, EventLog& log,
                 std::chrono::milliseconds timeout, WarningSink warnings);

    // Error text gnuplot produced since the previous checkpoint, warnings
    // removed. Empty when there is no stderr to read. HangTimeout when nothing
    // arrives in time; the supervisor then stays stuck.
    std::string checkpoint(const CheckpointMode& mode = {});

    SyncState state() const { return state_; }
    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    bool take_through_token(std::string& before);

    ProcessSupervisor& supervisor_;
    CommandChannel& channel_;
    EventLog& log_;
    std::chrono::milliseconds timeout_;
    WarningSink warnings_;

    SyncState state_ = SyncState::Idle;
    std::string pending_;       // stderr bytes read but not yet consumed
    std::size_t scanned_ = 0;   // prefix of pending_ known to hold no token
};

}  // namespace plotpipe
