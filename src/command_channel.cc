// command_channel.cc
#include "command_channel.h"
#include "checkpoint.h"
#include "errors.h"
#include <regex>

namespace plotpipe {

namespace {

// "^(.*;)? <command>" : the command may be chained after a ';'
const std::regex& set_print_re() {
    static const std::regex re(R"(^(?:.*;)?\s*set\s+print\b)");
    return re;
}

const std::regex& print_re() {
    static const std::regex re(R"(^(?:.*;)?\s*print\b)");
    return re;
}

const std::regex& set_terminal_re() {
    static const std::regex re(R"(^(?:.*;)?\s*set\s+terminal\b)");
    return re;
}

const std::regex& set_output_re() {
    static const std::regex re(R"(^(?:.*;)?\s*set\s+output\b)");
    return re;
}

}  // namespace

void check_guarded_line(const std::string& line, const GuardOverrides& overrides) {
    if (std::regex_search(line, set_print_re())) {
        throw ProtocolGuardError("Please don't 'set print' since I use gnuplot's STDERR for error detection");
    }
    if (std::regex_search(line, print_re())) {
        throw ProtocolGuardError("Please don't ask gnuplot to 'print' anything since this can confuse my error detection");
    }
    if (!overrides.terminal && std::regex_search(line, set_terminal_re())) {
        throw ProtocolGuardError("Please do not 'set terminal' manually. Use the 'terminal' plot option instead");
    }
    if (!overrides.output && std::regex_search(line, set_output_re())) {
        throw ProtocolGuardError("Please do not 'set output' manually. Use the 'output' plot option instead");
    }
}

std::vector<std::string> command_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();

        std::string line = text.substr(start, end - start);
        if (line.find_first_not_of(" \t\r") != std::string::npos) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }
    return lines;
}

CommandChannel::CommandChannel(ProcessSupervisor& supervisor, EventLog& log)
    : supervisor_(supervisor), log_(log) {}

void CommandChannel::send(const std::string& line) {
    send_raw(line + "\n");
}

void CommandChannel::send_raw(const std::string& bytes) {
    if (supervisor_.stuck()) {
        throw HangTimeout(HANG_MESSAGE);
    }
    supervisor_.write(bytes);
}

void CommandChannel::send_guarded(const std::string& text, SyncProtocol& sync,
                                  const GuardOverrides& overrides) {
    const std::vector<std::string> lines = command_lines(text);
    for (const auto& line : lines) {
        check_guarded_line(line, overrides);
    }

    for (const auto& line : lines) {
        send(line);

        CheckpointMode mode;
        mode.forward_warnings = true;
        std::string error = sync.checkpoint(mode);
        if (!error.empty()) {
            log_.event("gnuplot rejected \"" + line + "\"");
            throw CommandRejected("Gnuplot error: \"\n" + error + "\n\" while sending line \"" + line + "\"",
                                  error);
        }
    }
}

}  // namespace plotpipe
