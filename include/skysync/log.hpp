#pragma once
#include <string>

namespace skysync {

// Configure spdlog's default logger: pattern and level ("trace".."off").
// Unknown level names fall back to "info".
void init_logging(const std::string& level);

} // namespace skysync
