#pragma once

#include <chrono>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "obs/context.h"

namespace datalens {
namespace obs {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

inline const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
    }
    return "INFO";
}

inline std::string NowIso8601() {
    using namespace std::chrono;
    auto now = system_clock::now();
    auto secs = time_point_cast<seconds>(now);
    auto ms = duration_cast<milliseconds>(now - secs).count();
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setw(3) << std::setfill('0') << ms << "Z";
    return oss.str();
}

// Context fields are added first so explicit fields win on conflict.
inline nlohmann::json ContextFields() {
    nlohmann::json j = nlohmann::json::object();
    if (!HasContext()) return j;
    const auto& ctx = GetContext();
    if (!ctx.request_id.empty()) j["request_id"] = ctx.request_id;
    if (!ctx.run_id.empty()) j["run_id"] = ctx.run_id;
    if (!ctx.dataset_name.empty()) j["dataset_name"] = ctx.dataset_name;
    return j;
}

inline void LogEvent(LogLevel level,
                     const std::string& event,
                     const std::string& component,
                     const nlohmann::json& fields = nlohmann::json::object()) {
    nlohmann::json j = ContextFields();
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        j[it.key()] = it.value();
    }
    j["ts"] = NowIso8601();
    j["level"] = LevelToString(level);
    j["event"] = event;
    j["component"] = component;

    switch (level) {
        case LogLevel::Debug:
            spdlog::debug(j.dump());
            break;
        case LogLevel::Info:
            spdlog::info(j.dump());
            break;
        case LogLevel::Warn:
            spdlog::warn(j.dump());
            break;
        case LogLevel::Error:
            spdlog::error(j.dump());
            break;
    }
}

class ScopedTimer {
public:
    ScopedTimer(std::string event, std::string component, nlohmann::json fields = nlohmann::json::object())
        : event_(std::move(event)),
          component_(std::move(component)),
          fields_(std::move(fields)),
          start_(std::chrono::steady_clock::now()) {}

    auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    void Stop(LogLevel level = LogLevel::Info, nlohmann::json extra = nlohmann::json::object()) {
        if (stopped_) return;
        stopped_ = true;
        nlohmann::json payload = fields_;
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            payload[it.key()] = it.value();
        }
        payload["duration_ms"] = ElapsedMs();
        LogEvent(level, event_, component_, payload);
    }

    ~ScopedTimer() {
        if (!stopped_) {
            Stop(LogLevel::Info);
        }
    }

private:
    std::string event_;
    std::string component_;
    nlohmann::json fields_;
    std::chrono::steady_clock::time_point start_;
    bool stopped_ = false;
};

} // namespace obs
} // namespace datalens
