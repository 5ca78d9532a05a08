#pragma once

#include "Logger/Logger.hpp"

namespace hexsnake::core {

//! Returns the logger instance based on the set up configuration.
Logging::Logger Logger();

} // namespace hexsnake::core
