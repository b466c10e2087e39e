#pragma once

#include "opener/iurl_opener.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace urlrelay {

/**
 * @brief Opens URLs through the host launcher (`open` on macOS, `xdg-open`
 *        elsewhere) using posix_spawnp, never a shell
 *
 * The launcher's exit is awaited for at most `timeout`. A launcher that is
 * still running at the deadline is left alone and reaped in the background;
 * the request is reported as failed but the launch is not cancelled.
 */
class SystemUrlOpener : public IUrlOpener {
public:
    struct Config {
        std::vector<std::string> command;     // argv prefix; empty = platform default
        std::string browser;                  // optional application name
        std::chrono::milliseconds timeout{5000};
        size_t max_stderr_bytes = 4096;
    };

    explicit SystemUrlOpener(Config config);

    [[nodiscard]] OpenOutcome open(const std::string& url) override;

    [[nodiscard]] std::string name() const override;

    /// Full argv for one launch; the URL is always the last, separate element.
    [[nodiscard]] std::vector<std::string> build_argv(const std::string& url) const;

    [[nodiscard]] static std::vector<std::string> default_command(const std::string& browser);

private:
    Config config_;
    std::vector<std::string> command_;
};

} // namespace urlrelay
