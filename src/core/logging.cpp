#include "safepy/logging.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <vector>

namespace safepy {

bool InitLogging(const std::string& level, const std::string& log_file) {
    spdlog::level::level_enum parsed = spdlog::level::from_str(level);
    bool known_level = parsed != spdlog::level::off || level == "off";
    if (!known_level) {
        parsed = spdlog::level::info;
    }

    // stdout belongs to results; logs go to stderr
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool file_ok = true;
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file));
        } catch (const spdlog::spdlog_ex& e) {
            file_ok = false;
            spdlog::error("Failed to open log file {}: {}", log_file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("safepy", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_level(parsed);

    if (!known_level) {
        spdlog::warn("Unknown log level '{}', using info", level);
    }
    spdlog::debug("Logging initialized (level={}, file={})", level, log_file.empty() ? "<none>" : log_file);
    return file_ok;
}

} // namespace safepy
