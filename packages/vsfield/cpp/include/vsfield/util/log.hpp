#ifndef PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_UTIL_LOG_HPP_
#define PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_UTIL_LOG_HPP_

#include <spdlog/spdlog.h>

#include <memory>

namespace vsfield {

// The "vsfield" logger, created on first use at warn level.
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);

}  // namespace vsfield

#endif  // PACKAGES_VSFIELD_CPP_INCLUDE_VSFIELD_UTIL_LOG_HPP_
