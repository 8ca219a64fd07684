#pragma once
#include <filesystem>
#include <memory>
#include <spdlog/spdlog.h>

namespace gridnav::logsys {
    // Default logger "gridnav": stderr plus, when `logDir` is non-empty, a rotating
    // gridnav.log there. Safe to call more than once; the last call wins.
    void init(const std::filesystem::path& logDir = {});
    std::shared_ptr<spdlog::logger> get();  // "gridnav"
}
