#pragma once

#include <functional>
#include <string>

namespace geoplot::core {

// Logging callback type for progress and error reporting
using LogCallback = std::function<void(const std::string& message, bool is_error)>;

// Routes a message to the callback, or to stdout/stderr with a
// "[component INFO]" / "[component ERROR]" prefix when none is set.
void log_message(const LogCallback& callback, const std::string& component,
                 const std::string& message, bool is_error = false);

} // namespace geoplot::core
