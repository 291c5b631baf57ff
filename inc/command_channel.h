#pragma once

#include <string>
#include <vector>
#include "event_log.h"
#include "process_supervisor.h"

namespace plotpipe {

class SyncProtocol;

// Lines that may only be sent on behalf of the matching plot option.
struct GuardOverrides {
    bool terminal = false;
    bool output = false;
};

// Throws ProtocolGuardError if `line` could disable or confuse the stderr
// back channel: "set print", "print", and "set terminal"/"set output" unless
// overridden. Each may follow a ';'.
void check_guarded_line(const std::string& line, const GuardOverrides& overrides = {});

// Non-blank lines of `text`, in order.
std::vector<std::string> command_lines(const std::string& text);

// Writes commands and payloads to gnuplot's stdin.
class CommandChannel {
public:
    CommandChannel(ProcessSupervisor& supervisor, EventLog& log);

    // One line, newline appended. Throws HangTimeout once the child is stuck.
    void send(const std::string& line);

    // Payload bytes as they are.
    void send_raw(const std::string& bytes);

    // Sends each non-blank line of `text`, checkpointing after every one.
    // All lines are guard-checked before anything is written.
    void send_guarded(const std::string& text, SyncProtocol& sync,
                      const GuardOverrides& overrides = {});

private:
    ProcessSupervisor& supervisor_;
    EventLog& log_;
};

}  // namespace plotpipe
