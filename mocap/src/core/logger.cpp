#include "mocap/core/logger.hpp"

namespace mocap::core {

std::shared_ptr<spdlog::logger> Logger::sLogger;

void Logger::init(const std::string &pattern) {
  if (sLogger) {
    return; // Already initialized
  }

  auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  const auto logger = std::make_shared<spdlog::logger>("mocap", consoleSink);

  logger->set_pattern(pattern);

#ifdef DEBUG
  logger->set_level(spdlog::level::debug);
#else
  logger->set_level(spdlog::level::info);
#endif

  spdlog::register_logger(logger);
  sLogger = logger;

  debug("Logger initialized");
}

void Logger::shutdown() {
  if (!sLogger) {
    return;
  }
  sLogger->flush();
  spdlog::drop(sLogger->name());
  sLogger.reset();
}

void Logger::setLevel(std::string_view level) {
  if (!sLogger) {
    return;
  }
  const auto parsed = spdlog::level::from_str(std::string(level));
  // from_str maps unknown names to "off"; only honour that when asked for explicitly
  if (parsed == spdlog::level::off && level != "off") {
    warn("Unknown log level '{}', keeping current level", level);
    return;
  }
  sLogger->set_level(parsed);
}

} // namespace mocap::core
