#include "pachinko-sim/src/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pachinko_sim
{

std::shared_ptr<spdlog::logger> getLogger()
{
  if (auto logger = spdlog::get(kLoggerName))
  {
    return logger;
  }

  try
  {
    return spdlog::stdout_color_mt(kLoggerName);
  }
  catch (const spdlog::spdlog_ex&)
  {
    // Registered concurrently between get() and stdout_color_mt()
    return spdlog::get(kLoggerName);
  }
}

}  // namespace pachinko_sim
