// process_supervisor.cc
#include "process_supervisor.h"
#include "errors.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <map>
#include <mutex>
#include <regex>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace plotpipe {

namespace {

constexpr std::size_t READ_CHUNK = 4096;

// A dead child must show up as EPIPE on write, not kill us.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

std::string errno_text() {
    return std::strerror(errno);
}

// Both ends are close-on-exec; spawn_child dup2()s the child's end into place.
class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) == -1) {
            fds_[0] = fds_[1] = -1;
            throw SpawnError("Failed to create pipe: " + errno_text());
        }
    }
    ~Pipe() {
        if (fds_[0] >= 0) ::close(fds_[0]);
        if (fds_[1] >= 0) ::close(fds_[1]);
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    int release_read() { return release(0); }
    int release_write() { return release(1); }

private:
    int release(int end) {
        int fd = fds_[end];
        fds_[end] = -1;
        return fd;
    }

    int fds_[2] = {-1, -1};
};

// stdout_fd < 0 sends the child's stdout to /dev/null.
pid_t spawn_child(const std::vector<std::string>& args, int stdin_fd, int stdout_fd, int stderr_fd) {
    std::vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    posix_spawn_file_actions_t file_actions;
    posix_spawnattr_t attr;
    posix_spawn_file_actions_init(&file_actions);
    posix_spawnattr_init(&attr);

    // we ignore SIGPIPE; the child should not inherit that
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    posix_spawn_file_actions_adddup2(&file_actions, stdin_fd, STDIN_FILENO);
    if (stdout_fd >= 0) {
        posix_spawn_file_actions_adddup2(&file_actions, stdout_fd, STDOUT_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&file_actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }
    posix_spawn_file_actions_adddup2(&file_actions, stderr_fd, STDERR_FILENO);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, argv[0], &file_actions, &attr, argv.data(), environ);

    posix_spawn_file_actions_destroy(&file_actions);
    posix_spawnattr_destroy(&attr);

    if (rc != 0) {
        throw SpawnError("Couldn't run the '" + args[0] + "' backend: " + std::strerror(rc));
    }
    return pid;
}

int reap(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) return -1;
    }
    return status;
}

}  // namespace

CaptureResult run_capture(const std::vector<std::string>& argv, const std::string& input) {
    ignore_sigpipe();

    Pipe in, out, err;
    pid_t pid = spawn_child(argv, in.read_end(), out.write_end(), err.write_end());

    // keep only our ends, so EOF arrives when the child exits
    ::close(in.release_read());
    ::close(out.release_write());
    ::close(err.release_write());

    int in_fd = in.release_write();
    std::size_t done = 0;
    while (done < input.size()) {
        ssize_t n = ::write(in_fd, input.data() + done, input.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;  // child exited early; whatever it printed is still read below
        }
        done += static_cast<std::size_t>(n);
    }
    ::close(in_fd);

    CaptureResult result;
    pollfd fds[2] = {{out.read_end(), POLLIN, 0}, {err.read_end(), POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    bool is_open[2] = {true, true};
    char buf[READ_CHUNK];

    while (is_open[0] || is_open[1]) {
        pollfd active[2];
        int owner[2];
        int nfds = 0;
        for (int i = 0; i < 2; ++i) {
            if (!is_open[i]) continue;
            active[nfds] = fds[i];
            owner[nfds++] = i;
        }
        int ready = ::poll(active, nfds, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int j = 0; j < nfds; ++j) {
            if (!(active[j].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t r = ::read(active[j].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[owner[j]]->append(buf, static_cast<std::size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                is_open[owner[j]] = false;
            }
        }
    }

    int status = reap(pid);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

const GnuplotFeatures& gnuplot_features(const std::string& executable) {
    static std::mutex mutex;
    static std::map<std::string, GnuplotFeatures> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto found = cache.find(executable);
    if (found != cache.end()) return found->second;

    GnuplotFeatures features;

    // every --switch mentioned by --help is a feature
    {
        CaptureResult help = run_capture({executable, "--help"}, "");
        static const std::regex switch_re("--([a-zA-Z0-9_]+)");
        const std::string text = help.out + "\n" + help.err + "\n";
        for (std::sregex_iterator it(text.begin(), text.end(), switch_re), end; it != end; ++it) {
            features.switches.insert((*it)[1].str());
        }
    }

    // silent on success, complains otherwise
    {
        CaptureResult view_check = run_capture({executable}, "set view equal\nexit\n");
        features.equal_3d = view_check.out.empty() && view_check.err.empty();
    }

    return cache.emplace(executable, std::move(features)).first->second;
}

ProcessSupervisor::ProcessSupervisor(EventLog& log) : log_(log) {}

ProcessSupervisor::~ProcessSupervisor() {
    if (running()) terminate();
}

void ProcessSupervisor::start(const std::string& executable, bool dump) {
    ignore_sigpipe();
    child_ = ChildProcess{};

    if (dump) {
        child_.in_fd = STDOUT_FILENO;
        log_.event("dumping gnuplot commands to stdout");
        return;
    }

    const GnuplotFeatures& features = gnuplot_features(executable);
    std::vector<std::string> argv{executable};
    if (features.has("persist")) argv.push_back("--persist");

    Pipe in, err;
    child_.pid = spawn_child(argv, in.read_end(), -1, err.write_end());
    child_.in_fd = in.release_write();
    child_.err_fd = err.release_read();
    child_.err_poll = pollfd{child_.err_fd, POLLIN, 0};
    child_.owns_input = true;

    log_.set_pid(child_.pid);
    log_.event("started " + executable);
}

void ProcessSupervisor::terminate() {
    if (child_.pid <= 0) {
        child_.in_fd = -1;
        return;
    }

    // a wedged gnuplot never reads "exit"
    if (child_.stuck) {
        log_.event("killing stuck gnuplot");
        if (::kill(child_.pid, SIGTERM) == -1) {
            log_.event("kill() failed: " + errno_text());
        }
    } else {
        try {
            write("exit\n");
        } catch (const PlotError& e) {
            log_.event(std::string("couldn't send exit: ") + e.what());
        }
    }

    if (child_.owns_input) ::close(child_.in_fd);
    child_.in_fd = -1;

    int status = reap(child_.pid);
    if (status == -1) {
        log_.event("waitpid() failed: " + errno_text());
    } else if (WIFEXITED(status)) {
        log_.event("gnuplot exited with code " + std::to_string(WEXITSTATUS(status)));
    } else if (WIFSIGNALED(status)) {
        log_.event("gnuplot killed by signal " + std::to_string(WTERMSIG(status)));
    }

    ::close(child_.err_fd);
    child_.err_fd = -1;
    child_.err_poll.fd = -1;
    child_.pid = -1;
}

void ProcessSupervisor::write(const char* data, std::size_t size) {
    if (child_.in_fd < 0) {
        throw PlotError("gnuplot is not running");
    }

    log_.sent(data, size);

    std::size_t done = 0;
    while (done < size) {
        ssize_t n = ::write(child_.in_fd, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw PlotError("Couldn't write to gnuplot: " + errno_text());
        }
        done += static_cast<std::size_t>(n);
    }
    child_.bytes_written += size;
}

bool ProcessSupervisor::wait_readable(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        int ready = ::poll(&child_.err_poll, 1, static_cast<int>(left.count()));
        if (ready > 0) return true;
        if (ready == 0) return false;
        if (errno != EINTR) {
            throw PlotError("poll() on gnuplot stderr failed: " + errno_text());
        }
    }
}

std::size_t ProcessSupervisor::read_available(std::string& into) {
    char buf[READ_CHUNK];
    while (true) {
        ssize_t n = ::read(child_.err_fd, buf, sizeof(buf));
        if (n >= 0) {
            into.append(buf, static_cast<std::size_t>(n));
            return static_cast<std::size_t>(n);
        }
        if (errno != EINTR) {
            throw PlotError("Couldn't read gnuplot stderr: " + errno_text());
        }
    }
}

}  // namespace plotpipe
