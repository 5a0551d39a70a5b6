#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace execution {

// Logger writing to path (truncated on open). Falls back to the default
// logger when the file sink cannot be created.
std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name, const std::string& path);

} // namespace execution
