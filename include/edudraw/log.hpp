#pragma once
#include <memory>
#include <string>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace edudraw {

// Install the default logger once: colored console plus a truncating file
// sink. Later calls are no-ops.
inline void init_logging(const std::string& file = "edudraw.log",
                         spdlog::level::level_enum level = spdlog::level::info) {
  if (spdlog::get("edudraw")) return;

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true);
  file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  auto logger = std::make_shared<spdlog::logger>("edudraw", spdlog::sinks_init_list{console_sink, file_sink});
  logger->set_level(level);
  logger->flush_on(spdlog::level::warn);

  spdlog::register_logger(logger);
  spdlog::set_default_logger(logger);
}

} // namespace edudraw
