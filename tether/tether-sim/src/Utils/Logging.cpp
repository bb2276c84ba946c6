// Ticket: 0004_logging

#include <spdlog/sinks/stdout_color_sinks.h>

#include "tether-sim/src/Utils/Logging.hpp"

namespace tether_sim::logging
{

std::shared_ptr<spdlog::logger> getLogger(const std::string& name)
{
  if (auto existing = spdlog::get(name))
  {
    return existing;
  }

  try
  {
    auto logger = spdlog::stdout_color_mt(name);
    logger->set_level(spdlog::level::debug);
    return logger;
  }
  catch (const spdlog::spdlog_ex&)
  {
    // Registered by someone else between get() and stdout_color_mt()
    if (auto existing = spdlog::get(name))
    {
      return existing;
    }
    throw;
  }
}

}  // namespace tether_sim::logging
