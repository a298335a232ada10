// tactflow/basic/logging.cpp - spdlog setup
#include "tactflow/basic/logging.hpp"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tactflow
{

std::optional<Verbosity> parse_verbosity(std::string_view text)
{
  if (text == "quiet") return Verbosity::Quiet;
  if (text == "default") return Verbosity::Default;
  if (text == "debug") return Verbosity::Debug;
  return std::nullopt;
}

std::string_view to_string(Verbosity verbosity) noexcept
{
  switch (verbosity) {
    case Verbosity::Quiet:
      return "quiet";
    case Verbosity::Default:
      return "default";
    case Verbosity::Debug:
      return "debug";
  }
  return "default";
}

std::shared_ptr<spdlog::logger> make_logger(const std::string & name, Verbosity verbosity)
{
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->set_pattern("%^[%l]%$ %v");

  switch (verbosity) {
    case Verbosity::Quiet:
      logger->set_level(spdlog::level::err);
      break;
    case Verbosity::Default:
      logger->set_level(spdlog::level::info);
      break;
    case Verbosity::Debug:
      logger->set_level(spdlog::level::debug);
      break;
  }
  return logger;
}

std::shared_ptr<spdlog::logger> make_null_logger(const std::string & name)
{
  auto logger =
    std::make_shared<spdlog::logger>(name, std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::off);
  return logger;
}

}  // namespace tactflow
