#pragma once

#include <chrono>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "obs/logging.h"

namespace datalens {
namespace obs {

// Logs http_request_start on construction and exactly one of
// http_request_end / http_request_error before the response leaves.
class HttpRequestLogScope {
public:
    HttpRequestLogScope(const httplib::Request& req,
                        httplib::Response& res,
                        const std::string& component,
                        const std::string& request_id,
                        nlohmann::json fields = nlohmann::json::object())
        : res_(&res),
          component_(component),
          start_(std::chrono::steady_clock::now()) {
        fields_["route"] = req.path;
        fields_["method"] = req.method;
        fields_["bytes_in"] = req.body.size();
        if (!request_id.empty()) {
            fields_["request_id"] = request_id;
        }
        AddFields(fields);
        LogEvent(LogLevel::Info, "http_request_start", component_, fields_);
    }

    HttpRequestLogScope(const HttpRequestLogScope&) = delete;
    HttpRequestLogScope& operator=(const HttpRequestLogScope&) = delete;

    void AddFields(const nlohmann::json& extra) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            fields_[it.key()] = it.value();
        }
    }

    void RecordError(const std::string& error_code, const std::string& message, int status_code) {
        if (error_logged_) return;
        nlohmann::json payload = fields_;
        payload["status_code"] = status_code;
        payload["duration_ms"] = ElapsedMs();
        payload["error_code"] = error_code;
        payload["error"] = message;
        LogEvent(status_code >= 500 ? LogLevel::Error : LogLevel::Warn,
                 "http_request_error", component_, payload);
        error_logged_ = true;
    }

    ~HttpRequestLogScope() {
        if (error_logged_) return;
        nlohmann::json payload = fields_;
        if (res_) {
            payload["status_code"] = res_->status;
            payload["bytes_out"] = res_->body.size();
        }
        payload["duration_ms"] = ElapsedMs();
        LogEvent(LogLevel::Info, "http_request_end", component_, payload);
    }

private:
    auto ElapsedMs() const -> double {
        return std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_).count();
    }

    httplib::Response* res_;
    std::string component_;
    nlohmann::json fields_ = nlohmann::json::object();
    std::chrono::steady_clock::time_point start_;
    bool error_logged_ = false;
};

} // namespace obs
} // namespace datalens
