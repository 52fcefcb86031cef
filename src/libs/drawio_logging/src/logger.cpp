#include <drawio_logging/logger.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace drawio_logging {

namespace {

std::shared_ptr<spdlog::logger>& shared_logger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_logger(spdlog::level::level_enum level,
    const std::optional<std::string>& log_file)
{
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    std::string file_error;
    if (log_file) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, true));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }
    }
    auto created = std::make_shared<spdlog::logger>(logger_name, sinks.begin(), sinks.end());
    created->set_level(level);
    created->flush_on(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    if (!file_error.empty())
        created->warn("Cannot open log file {}, logging to stderr only: {}", *log_file, file_error);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& instance = shared_logger();
    if (!instance) instance = make_logger(spdlog::level::warn, std::nullopt);
    return instance;
}

void configure(spdlog::level::level_enum level, const std::optional<std::string>& log_file) {
    shared_logger() = make_logger(level, log_file);
    if (log_file) shared_logger()->info("Logging initialized. file={}", *log_file);
}

} // namespace drawio_logging
