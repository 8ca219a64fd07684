#include "gridnav/logging/Log.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void gridnav::logsys::init(const fs::path& logDir) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logDir.empty()) {
        std::error_code ec; fs::create_directories(logDir, ec);
        if (!ec) {
            auto file = (logDir / "gridnav.log").string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, 1 << 20, 4)); // 1MB * 4
        }
    }

    g_logger = std::make_shared<spdlog::logger>("gridnav", sinks.begin(), sinks.end());
    spdlog::set_default_logger(g_logger);
    spdlog::set_level(spdlog::level::info);
    spdlog::flush_on(spdlog::level::warn);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    if (sinks.size() == 1 && !logDir.empty())
        spdlog::warn("Logging: could not create {}, file sink disabled", logDir.string());
    spdlog::info("Logging started");
}

std::shared_ptr<spdlog::logger> gridnav::logsys::get() {
    if (!g_logger) init();
    return g_logger;
}
