// Ticket: 0004_logging

#ifndef TETHER_SIM_UTILS_LOGGING_HPP
#define TETHER_SIM_UTILS_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tether_sim::logging
{

/**
 * @brief Fetch a registered logger or create a colored stdout logger
 *
 * New loggers start at the debug level.
 *
 * @param name Logger name, also used as the registry key
 * @return Shared logger, never null
 * @throws spdlog::spdlog_ex if the sink cannot be created
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

}  // namespace tether_sim::logging

#endif  // TETHER_SIM_UTILS_LOGGING_HPP
