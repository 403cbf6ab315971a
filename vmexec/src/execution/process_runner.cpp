#include "vmexec/execution/process_runner.h"
#include "vmexec/utils/logger.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace vmexec {

namespace {

Logger& runner_logger() {
    return LoggerFactory::get_logger("vmexec.process");
}

std::string errno_text(int err) {
    return std::strerror(err);
}

ExecutionError spawn_error(const std::string& what, int err) {
    return ExecutionError{ExecutionError::Kind::SPAWN_FAILURE, what + ": " + errno_text(err)};
}

ExecutionError io_error(const std::string& what, int err) {
    return ExecutionError{ExecutionError::Kind::IO_FAILURE, what + ": " + errno_text(err)};
}

class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    ~UniqueFd() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }
    [[nodiscard]] int release() noexcept { return std::exchange(fd_, -1); }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

std::expected<Pipe, ExecutionError> make_pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(spawn_error("pipe2 failed", errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

// posix_spawn attribute and file action objects with their destroy calls
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;
    bool actions_ready = false;
    bool attr_ready = false;

    ~SpawnSetup() {
        if (actions_ready) posix_spawn_file_actions_destroy(&actions);
        if (attr_ready) posix_spawnattr_destroy(&attr);
    }
};

int build_spawn_setup(SpawnSetup& setup, int stdout_fd, int stderr_fd) {
    int rc = posix_spawn_file_actions_init(&setup.actions);
    if (rc != 0) return rc;
    setup.actions_ready = true;

    if ((rc = posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0)) != 0) return rc;
    if ((rc = posix_spawn_file_actions_adddup2(&setup.actions, stdout_fd, STDOUT_FILENO)) != 0) return rc;
    if ((rc = posix_spawn_file_actions_adddup2(&setup.actions, stderr_fd, STDERR_FILENO)) != 0) return rc;

    rc = posix_spawnattr_init(&setup.attr);
    if (rc != 0) return rc;
    setup.attr_ready = true;

    sigset_t all_signals;
    sigset_t no_signals;
    sigfillset(&all_signals);
    sigemptyset(&no_signals);

    if ((rc = posix_spawnattr_setpgroup(&setup.attr, 0)) != 0) return rc;
    if ((rc = posix_spawnattr_setsigdefault(&setup.attr, &all_signals)) != 0) return rc;
    if ((rc = posix_spawnattr_setsigmask(&setup.attr, &no_signals)) != 0) return rc;

    short flags = POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK;
    return posix_spawnattr_setflags(&setup.attr, flags);
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return 1;
}

// Kills the child's process group and reaps it
void kill_and_reap(pid_t pid, int& status) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) == -1 && errno == EINTR) {
    }
}

// Reads whatever is available; returns false once the pipe reached EOF
bool drain(int fd, std::string& into) {
    std::array<char, 8192> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            into.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) {
            return false;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return true;
        }
        runner_logger().warn("Reading child output failed: " + errno_text(errno));
        return false;
    }
}

} // namespace

std::expected<ProcessOutput, ExecutionError> run_process(const ProcessOptions& options) {
    if (options.argv.empty()) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::SPAWN_FAILURE, "empty command line"});
    }

    auto out_pipe = make_pipe();
    if (!out_pipe) return std::unexpected(out_pipe.error());
    auto err_pipe = make_pipe();
    if (!err_pipe) return std::unexpected(err_pipe.error());

    SpawnSetup setup;
    if (int rc = build_spawn_setup(setup, out_pipe->write_end.get(), err_pipe->write_end.get()); rc != 0) {
        return std::unexpected(spawn_error("posix_spawn setup failed", rc));
    }

    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, argv[0], &setup.actions, &setup.attr, argv.data(), environ);
    if (rc != 0) {
        return std::unexpected(spawn_error("Failed to start " + options.argv[0], rc));
    }

    out_pipe->write_end.reset();
    err_pipe->write_end.reset();

    for (int fd : {out_pipe->read_end.get(), err_pipe->read_end.get()}) {
        int flags = ::fcntl(fd, F_GETFL);
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    ProcessOutput output;
    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    bool stdout_open = true;
    bool stderr_open = true;
    bool exited = false;
    int status = 0;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            output.timed_out = true;
            break;
        }
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);

        if (stdout_open || stderr_open) {
            std::array<pollfd, 2> fds{};
            nfds_t count = 0;
            if (stdout_open) fds[count++] = pollfd{out_pipe->read_end.get(), POLLIN, 0};
            if (stderr_open) fds[count++] = pollfd{err_pipe->read_end.get(), POLLIN, 0};

            int ready = ::poll(fds.data(), count, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
            if (ready < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                kill_and_reap(pid, status);
                return std::unexpected(spawn_error("poll failed", err));
            }

            for (nfds_t i = 0; i < count; ++i) {
                if (fds[i].revents == 0) continue;
                if (fds[i].fd == out_pipe->read_end.get()) {
                    stdout_open = drain(fds[i].fd, output.stdout_text);
                } else {
                    stderr_open = drain(fds[i].fd, output.stderr_text);
                }
            }
            continue;
        }

        pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            exited = true;
            break;
        }
        if (reaped == -1 && errno != EINTR) {
            int err = errno;
            kill_and_reap(pid, status);
            return std::unexpected(spawn_error("waitpid failed", err));
        }
        std::this_thread::sleep_for(std::min<std::chrono::milliseconds>(remaining, std::chrono::milliseconds(10)));
    }

    if (!exited) {
        runner_logger().warn("Child " + std::to_string(pid) + " exceeded " +
                             std::to_string(options.timeout.count()) + "ms, killing its process group");
        kill_and_reap(pid, status);
        output.exit_code = -SIGKILL;
        return output;
    }

    output.exit_code = decode_wait_status(status);
    return output;
}

std::expected<void, ExecutionError> prepare_scratch_dir(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(ExecutionError{ExecutionError::Kind::IO_FAILURE,
                                              "cannot create " + dir.string() + ": " + ec.message()});
    }

    std::filesystem::permissions(dir, std::filesystem::perms::all | std::filesystem::perms::sticky_bit,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        runner_logger().debug("Leaving mode of " + dir.string() + " unchanged: " + ec.message());
    }
    return {};
}

std::expected<TempScriptFile, ExecutionError> TempScriptFile::create(
    const std::filesystem::path& dir, std::string_view contents) {
    std::string pattern = (dir / (std::string(NAME_PREFIX) + "XXXXXX" + NAME_SUFFIX)).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    UniqueFd fd(::mkstemps(name.data(), static_cast<int>(std::strlen(NAME_SUFFIX))));
    if (!fd.valid()) {
        return std::unexpected(io_error("mkstemps in " + dir.string(), errno));
    }

    // From here on the destructor removes the file on every error path
    TempScriptFile file{std::filesystem::path(name.data())};

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = ::write(fd.get(), contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(io_error("write " + file.path().string(), errno));
        }
        written += static_cast<size_t>(n);
    }

    if (::fchmod(fd.get(), 0644) != 0) {
        return std::unexpected(io_error("fchmod " + file.path().string(), errno));
    }

    if (::close(fd.release()) != 0) {
        return std::unexpected(io_error("close " + file.path().string(), errno));
    }
    return file;
}

TempScriptFile::TempScriptFile(TempScriptFile&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TempScriptFile& TempScriptFile::operator=(TempScriptFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TempScriptFile::~TempScriptFile() {
    remove();
}

bool TempScriptFile::remove() noexcept {
    if (path_.empty()) {
        return true;
    }
    bool removed = ::unlink(path_.c_str()) == 0 || errno == ENOENT;
    if (!removed) {
        try {
            runner_logger().error("Failed to remove " + path_.string() + ": " + errno_text(errno));
        } catch (const std::exception&) {
            // logging must not escape a destructor
        }
    }
    path_.clear();
    return removed;
}

} // namespace vmexec
