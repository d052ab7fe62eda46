#include "util/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vsfield {

namespace {

constexpr const char* kLoggerName = "vsfield";

}  // namespace

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stdout_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return instance;
}

void set_log_level(spdlog::level::level_enum level) {
  logger()->set_level(level);
}

}  // namespace vsfield
