#ifndef MASUMI_LOGGER_HPP
#define MASUMI_LOGGER_HPP

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace masumi::base {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Apply a textual level ("trace", "debug", "info", "warn", "error",
   * "critical", "off") to every registered logger and to loggers created later
   * @return false if the level name is unknown, levels are left untouched
   */
  bool setLogLevel(const std::string &level);
}  // namespace masumi::base

#endif  // MASUMI_LOGGER_HPP
