/**
 * @file logging.cpp
 * @brief Logging globals
 *
 * @details Provides the definition of the global log mutex shared by every
 *          LOG_* macro.
 */

#include "media_convert/logging.hpp"

namespace media_convert {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

} // namespace media_convert
