#pragma once
#include <string>

namespace core {

// Console logging. Debug lines are printed only when CHUNKSCRIBE_DEBUG is set.
void log_debug(const std::string& msg);
void log_info(const std::string& msg);
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

bool debug_enabled();

}
