#pragma once

#include <memory>
#include <spdlog/logger.h>

namespace asnsig::logger {

/**
 * @brief Get the shared library logger, create it on the first call
 * @return std::shared_ptr<spdlog::logger> or nullptr on failure
 */
std::shared_ptr<spdlog::logger> InitLog() noexcept;

} // namespace asnsig::logger
