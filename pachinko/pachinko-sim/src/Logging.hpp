#ifndef PACHINKO_SIM_LOGGING_HPP
#define PACHINKO_SIM_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pachinko_sim
{

/// @brief Name of the shared simulation logger
inline constexpr const char* kLoggerName = "pachinko";

/**
 * @brief Shared simulation logger.
 *
 * Returns the logger registered under kLoggerName, creating a colored
 * stdout logger on first use. A registration made by the host beforehand
 * (file sink, custom level, ...) is reused as is.
 */
std::shared_ptr<spdlog::logger> getLogger();

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_LOGGING_HPP
