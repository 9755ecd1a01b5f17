#ifndef SSOKIT_LOG_H
#define SSOKIT_LOG_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace ssokit {

struct Config;

// Largest size a log file reaches before spdlog rotates it mid-run
constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;

/**
 * Install the "ssokit" file logger as spdlog's default logger.
 *
 * The previous run's log is rotated away on every start, so `log_path`
 * always holds the current run: ssokit.log -> ssokit.1.log -> ... ->
 * ssokit.{max_files}.log. An empty `log_path` means
 * ~/.config/ssokit/log/ssokit.log. Unknown level names fall back to info.
 */
void init_log(const std::filesystem::path& log_path, const std::string& level, size_t max_files = 5);

// Path, level and rotation count taken from `config`
void init_log(const Config& config);

std::shared_ptr<spdlog::logger> get_logger();

}  // namespace ssokit

#endif  // SSOKIT_LOG_H
