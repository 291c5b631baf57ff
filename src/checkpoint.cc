// checkpoint.cc
#include "checkpoint.h"
#include "errors.h"
#include <cstring>
#include <regex>

namespace plotpipe {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    std::size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    std::size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        std::size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
}

}  // namespace

Diagnostics classify_diagnostics(const std::string& raw, bool ignore_invalid_command) {
    static const std::regex warning_re(R"(^Warning:\s*(.*?)\s*$)");
    // gnuplot's three-line report of a placeholder line it took as a command:
    //   gnuplot> 10 10
    //            ^
    //            line 0: invalid command
    static const std::regex echo_re(std::string(R"(^gnuplot>\s*(?:)") + TEST_DATA_UNIT + R"(|e\b))");
    static const std::regex caret_re(R"(^\s+\^\s*$)");
    static const std::regex invalid_re(R"(invalid\s+command)");

    Diagnostics out;
    const std::vector<std::string> lines = split_lines(raw);
    std::string kept;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const std::string& line = lines[i];

        if (ignore_invalid_command && i + 2 < lines.size() &&
            std::regex_search(line, echo_re) &&
            std::regex_search(lines[i + 1], caret_re) &&
            std::regex_search(lines[i + 2], invalid_re)) {
            i += 2;
            continue;
        }

        std::smatch m;
        if (std::regex_match(line, m, warning_re)) {
            out.warnings.push_back(m[1].str());
            continue;
        }

        kept += line;
        kept += '\n';
    }

    out.errors = trim(kept);
    return out;
}

SyncProtocol::SyncProtocol(ProcessSupervisor& supervisor, CommandChannel& channel, EventLog& log,
                           std::chrono::milliseconds timeout, WarningSink warnings)
    : supervisor_(supervisor), channel_(channel), log_(log),
      timeout_(timeout), warnings_(std::move(warnings)) {}

bool SyncProtocol::take_through_token(std::string& before) {
    const std::size_t token_len = std::strlen(CHECKPOINT_TOKEN);

    std::size_t pos = pending_.find(CHECKPOINT_TOKEN, scanned_);
    if (pos == std::string::npos) {
        // the token may straddle the next read
        scanned_ = pending_.size() >= token_len ? pending_.size() - token_len + 1 : 0;
        return false;
    }

    before = pending_.substr(0, pos);
    pending_.erase(0, pos + token_len);
    scanned_ = 0;
    return true;
}

std::string SyncProtocol::checkpoint(const CheckpointMode& mode) {
    channel_.send(std::string("print \"") + CHECKPOINT_TOKEN + "\"");

    // nothing to read back when dumping to stdout
    if (!supervisor_.has_diagnostic_channel()) {
        state_ = SyncState::Idle;
        return "";
    }

    state_ = SyncState::AwaitingToken;
    std::string raw;
    while (!take_through_token(raw)) {
        log_.event("Trying to read from gnuplot");

        if (!supervisor_.wait_readable(timeout_)) {
            log_.event("Gnuplot read timed out");
            state_ = SyncState::TimedOut;
            supervisor_.mark_stuck();
            throw HangTimeout(HANG_MESSAGE);
        }

        std::size_t n = supervisor_.read_available(pending_);
        if (n == 0) {
            log_.event("gnuplot closed its stderr");
            state_ = SyncState::TimedOut;
            supervisor_.mark_stuck();
            throw HangTimeout("Gnuplot process exited unexpectedly. Its last output was:\n" + trim(pending_));
        }
        log_.event("Read " + std::to_string(n) + " bytes from gnuplot child process");
    }
    state_ = SyncState::TokenFound;

    Diagnostics diagnostics = classify_diagnostics(raw, mode.ignore_invalid_command);
    if (mode.forward_warnings && warnings_) {
        for (const auto& warning : diagnostics.warnings) {
            warnings_(warning);
        }
    }
    return diagnostics.errors;
}

}  // namespace plotpipe
