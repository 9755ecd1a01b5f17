#include "log/log.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "core/config.hpp"
#include "core/version.hpp"

namespace ssokit {

namespace {

constexpr const char* kLoggerName = "ssokit";

spdlog::level::level_enum parse_level(const std::string& level) {
  auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off
  if (parsed == spdlog::level::off && level != "off") {
    std::cerr << "Unknown log level '" << level << "', using info\n";
    return spdlog::level::info;
  }
  return parsed;
}

}  // namespace

void init_log(const std::filesystem::path& log_path, const std::string& level, size_t max_files) {
  auto path = log_path.empty() ? config_paths::config_dir() / "log" / "ssokit.log" : log_path;

  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path.string(), kMaxLogFileSize, max_files,
                                                                       /*rotate_on_open=*/true);
    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sink);
    logger->set_level(parse_level(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    // Re-initialization replaces the previous logger
    spdlog::drop(kLoggerName);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== ssokit {} started (log: {}) ===", SSOKIT_VERSION_STRING, path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

void init_log(const Config& config) {
  init_log(config.log_file.value_or(std::filesystem::path{}), config.log_level, config.log_max_files);
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace ssokit
