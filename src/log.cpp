#include <skysync/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace skysync {

void init_logging(const std::string& level) {
  // stdout is reserved for program output (JSON, frame summaries)
  auto logger = spdlog::get("skysync");
  if (!logger) logger = spdlog::stderr_color_mt("skysync");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%t] %v");
  auto lvl = spdlog::level::from_str(level);
  // from_str maps unknown names to "off"
  if (lvl == spdlog::level::off && level != "off") {
    lvl = spdlog::level::info;
    spdlog::warn("unknown log level '{}', using info", level);
  }
  spdlog::set_level(lvl);
}

} // namespace skysync
