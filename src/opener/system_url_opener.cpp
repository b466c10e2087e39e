#include "opener/system_url_opener.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

#include <format>

extern char** environ;

namespace urlrelay {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);

// Owns a raw descriptor
struct FdGuard {
    int fd;
    explicit FdGuard(int f) : fd(f) {}
    ~FdGuard() { if (fd >= 0) ::close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

// RAII for the posix_spawn attribute/file-action objects
struct SpawnSetup {
    posix_spawn_file_actions_t actions;
    posix_spawnattr_t attr;

    SpawnSetup() {
        posix_spawn_file_actions_init(&actions);
        posix_spawnattr_init(&attr);
    }
    ~SpawnSetup() {
        posix_spawn_file_actions_destroy(&actions);
        posix_spawnattr_destroy(&attr);
    }
    SpawnSetup(const SpawnSetup&) = delete;
    SpawnSetup& operator=(const SpawnSetup&) = delete;
};

/**
 * @brief Unlinked temp file for the launcher's stderr
 *
 * Close-on-exec from creation: launchers spawned concurrently must not
 * inherit each other's capture files (a browser can live for hours).
 * posix_spawn's dup2 onto fd 2 clears the flag on the child's copy.
 */
int create_capture_file() {
    std::string path = std::string(P_tmpdir) + "/url-relay-stderr-XXXXXX";
    const int fd = ::mkostemp(path.data(), O_CLOEXEC);
    if (fd >= 0) {
        ::unlink(path.c_str());
    }
    return fd;
}

std::string read_captured(int fd, size_t max_bytes) {
    std::string out(max_bytes, '\0');
    const ssize_t n = ::pread(fd, out.data(), out.size(), 0);
    if (n <= 0) return "";
    out.resize(static_cast<size_t>(n));
    return utils::trim(out);
}

// Reap a launcher we stopped waiting for, so it never lingers as a zombie
void reap_in_background(pid_t pid) {
    std::thread([pid] {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    }).detach();
}

} // anonymous namespace

SystemUrlOpener::SystemUrlOpener(Config config)
    : config_(std::move(config)),
      command_(config_.command.empty() ? default_command(config_.browser) : config_.command) {}

std::vector<std::string> SystemUrlOpener::default_command(const std::string& browser) {
#ifdef __APPLE__
    if (browser.empty()) return {"/usr/bin/open"};
    return {"/usr/bin/open", "-a", browser};
#else
    if (browser.empty()) return {"xdg-open"};
    return {browser};
#endif
}

std::string SystemUrlOpener::name() const {
    return utils::join(command_, " ");
}

std::vector<std::string> SystemUrlOpener::build_argv(const std::string& url) const {
    std::vector<std::string> args = command_;
    args.push_back(url);
    return args;
}

OpenOutcome SystemUrlOpener::open(const std::string& url) {
    utils::Timer timer;
    const auto args = build_argv(url);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // stderr goes to an unlinked temp file: a browser that inherits it can
    // keep writing after we stop reading without hitting a closed pipe
    const FdGuard err_file(create_capture_file());
    if (err_file.fd < 0) {
        return OpenOutcome::failure(
            std::format("failed to create stderr capture: {}", std::strerror(errno)),
            timer.elapsed_ms());
    }

    SpawnSetup setup;
    posix_spawn_file_actions_addopen(&setup.actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&setup.actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_adddup2(&setup.actions, err_file.fd, STDERR_FILENO);

    // The listener blocks SIGINT/SIGTERM for sigwait(); the launcher must not inherit that
    sigset_t empty_mask;
    sigemptyset(&empty_mask);
    posix_spawnattr_setsigmask(&setup.attr, &empty_mask);
    posix_spawnattr_setflags(&setup.attr, POSIX_SPAWN_SETSIGMASK);

    pid_t pid = 0;
    const int spawn_res = posix_spawnp(&pid, argv[0], &setup.actions, &setup.attr,
                                       argv.data(), environ);
    if (spawn_res != 0) {
        return OpenOutcome::failure(
            std::format("failed to launch '{}': {}", args[0], std::strerror(spawn_res)),
            timer.elapsed_ms());
    }

    const auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    while (true) {
        int status = 0;
        const pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            const auto elapsed = timer.elapsed_ms();
            if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
                return OpenOutcome::ok(elapsed);
            }
            auto detail = read_captured(err_file.fd, config_.max_stderr_bytes);
            if (detail.empty()) {
                detail = WIFEXITED(status)
                    ? std::format("'{}' exited with status {}", args[0], WEXITSTATUS(status))
                    : std::format("'{}' terminated by signal {}", args[0],
                                  WIFSIGNALED(status) ? WTERMSIG(status) : 0);
            }
            return OpenOutcome::failure(std::move(detail), elapsed);
        }
        if (r < 0 && errno != EINTR) {
            return OpenOutcome::failure(
                std::format("waitpid failed: {}", std::strerror(errno)), timer.elapsed_ms());
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            reap_in_background(pid);
            return OpenOutcome::failure(
                std::format("'{}' did not finish within {} ms", args[0], config_.timeout.count()),
                timer.elapsed_ms());
        }
        std::this_thread::sleep_for(kPollInterval);
    }
}

} // namespace urlrelay
