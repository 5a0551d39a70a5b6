#include <execution/logging.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace execution {

std::shared_ptr<spdlog::logger> make_file_logger(const std::string& name, const std::string& path) {
    if (auto existing = spdlog::get(name)) return existing;

    std::shared_ptr<spdlog::logger> logger;
    try {
        const std::filesystem::path log_file(path);
        if (log_file.has_parent_path())
            std::filesystem::create_directories(log_file.parent_path());
        logger = spdlog::basic_logger_mt(name, log_file.string(), true);
        logger->set_level(spdlog::level::debug);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace execution
