#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <utility>

namespace magnetmesh {
namespace logging {

constexpr const char* LOGGER_NAME = "magnetmesh";
constexpr const char* LOG_LEVEL_ENV = "MAGNETMESH_LOG_LEVEL";

// Names accepted in MAGNETMESH_LOG_LEVEL; anything else keeps info
inline spdlog::level::level_enum level_from_name(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::get(LOGGER_NAME);
        if (!log) {
            log = spdlog::stderr_color_mt(LOGGER_NAME);
        }
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

        const char* level_env = std::getenv(LOG_LEVEL_ENV);
        log->set_level(level_env ? level_from_name(level_env) : spdlog::level::info);
        return log;
    }();
    return logger;
}

// Logs the wall time of a pipeline stage at debug level when it goes out of scope
class StageTimer {
public:
    explicit StageTimer(std::string stage)
        : stage_(std::move(stage)), start_(std::chrono::steady_clock::now()) {
        get_logger()->debug("{}: started", stage_);
    }

    ~StageTimer() {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        get_logger()->debug("{}: done in {} ms", stage_, elapsed.count());
    }

    StageTimer(const StageTimer&) = delete;
    StageTimer& operator=(const StageTimer&) = delete;

private:
    std::string stage_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace logging
}  // namespace magnetmesh
