// tactflow/basic/logging.hpp - spdlog setup shared by the driver and tools
#pragma once

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tactflow
{

/**
 * Output verbosity selected by configuration or command line.
 */
enum class Verbosity : uint8_t {
  Quiet,    ///< errors only
  Default,  ///< informational messages
  Debug,    ///< everything, including per-node construction details
};

[[nodiscard]] std::optional<Verbosity> parse_verbosity(std::string_view text);
[[nodiscard]] std::string_view to_string(Verbosity verbosity) noexcept;

/**
 * Create a colored stderr logger named `name` at the level matching
 * `verbosity`. The logger is not registered globally; callers pass it to
 * the components that log.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger(
  const std::string & name, Verbosity verbosity = Verbosity::Default);

/**
 * A logger that drops every message. Used where a component requires a
 * logger but the caller does not want output (unit tests, library use).
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> make_null_logger(const std::string & name);

}  // namespace tactflow
