#include "api_server.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include "errors.h"
#include "ids.h"
#include "metrics.h"
#include "obs/context.h"
#include "obs/error_codes.h"
#include "obs/http_log.h"
#include "pipeline.h"
#include "route_registry.h"
#include "serialization.h"

namespace datalens::api {

namespace {

std::string GetRequestId(const httplib::Request& req) {
    if (req.has_header("X-Request-ID")) {
        return req.get_header_value("X-Request-ID");
    }
    return GenerateUuid();
}

struct ClassifiedError {
    int status;
    const char* code;
};

// Must be called from inside a catch block.
ClassifiedError ClassifyHttpError() {
    try {
        throw;
    } catch (const nlohmann::json::parse_error&) {
        return {400, obs::kErrHttpJsonParseError};
    } catch (const MissingFieldError&) {
        return {400, obs::kErrHttpMissingField};
    } catch (const nlohmann::json::type_error&) {
        // e.g. "type must be string, but is number"
        return {400, obs::kErrHttpInvalidArgument};
    } catch (const nlohmann::json::out_of_range&) {
        // e.g. "number overflow parsing '1e400'"
        return {400, obs::kErrHttpInvalidArgument};
    } catch (const EmptyDatasetError&) {
        return {400, obs::kErrEmptyDataset};
    } catch (const MalformedRowError&) {
        return {400, obs::kErrMalformedRow};
    } catch (const AnalysisCancelledError&) {
        return {503, obs::kErrCancelled};
    } catch (const std::invalid_argument&) {
        return {400, obs::kErrHttpInvalidArgument};
    } catch (const std::exception&) {
        return {500, obs::kErrInternal};
    }
}

} // namespace

ApiServer::ApiServer(AnalysisConfig config, std::shared_ptr<ITextGenerator> generator, ServerOptions options)
    : config_(std::move(config)), generator_(std::move(generator)), options_(options) {
    Initialize();
}

void ApiServer::Initialize() {
    // Configure HTTP Server Limits
    svr_.set_payload_max_length(options_.payload_max_bytes);
    svr_.set_read_timeout(options_.read_timeout_sec, 0);
    svr_.set_write_timeout(options_.write_timeout_sec, 0);

    // Setup Routes
    svr_.Post("/api/analyze", [this](const httplib::Request& req, httplib::Response& res) {
        HandleAnalyze(req, res);
    });
    registered_routes_++;

    svr_.Get("/", [this](const httplib::Request& req, httplib::Response& res) {
        HandleRoot(req, res);
    });
    registered_routes_++;

    svr_.Get("/healthz", [this](const httplib::Request& req, httplib::Response& res) {
        HandleHealth(req, res);
    });
    registered_routes_++;

    svr_.Get("/metrics", [this](const httplib::Request& req, httplib::Response& res) {
        HandleMetrics(req, res);
    });
    registered_routes_++;
}

ApiServer::~ApiServer() {
    Stop();
}

void ApiServer::Start(const std::string& host, int port) {
    ValidateRoutes();
    spdlog::info("HTTP API Server listening on {}:{}", host, port);
    if (!svr_.listen(host.c_str(), port) && !stopping_) {
        throw std::runtime_error("Failed to listen on " + host + ":" + std::to_string(port));
    }
}

void ApiServer::Stop() {
    stopping_ = true;
    svr_.stop();
    workers_->Drain();
}

void ApiServer::HandleAnalyze(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    obs::ScopedContext ctx(obs::Context{rid, "", ""});
    try {
        auto body = nlohmann::json::parse(req.body);
        AnalysisRequest request = ParseAnalysisRequest(body);
        log.AddFields({{"dataset_name", request.dataset_name}, {"rows", request.dataset->RowCount()}});

        if (request.dataset->RowCount() > options_.max_rows) {
            std::string msg = "Too many rows: " + std::to_string(request.dataset->RowCount()) +
                              " (max " + std::to_string(options_.max_rows) + ")";
            log.RecordError(obs::kErrHttpPayloadTooLarge, msg, 413);
            SendError({res, msg, 413, obs::kErrHttpPayloadTooLarge, rid});
            return;
        }

        AnalysisRun run = Analyze(request, config_, generator_, &stopping_, workers_);
        log.AddFields({{"run_id", run.run_id}, {"route", RouteToString(run.executed_route)}});
        SendJson(res, RunToResponseJson(run), 200, rid);
    } catch (const std::exception& e) {
        auto classified = ClassifyHttpError();
        log.RecordError(classified.code, e.what(), classified.status);
        SendError({res, e.what(), classified.status, classified.code, rid});
    }
}

void ApiServer::HandleRoot(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    SendJson(res, {{"status", "online"}}, 200);
}

void ApiServer::HandleHealth(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    res.status = 200;
    res.set_content("{\"status\":\"OK\"}", "application/json");
}

void ApiServer::HandleMetrics(const httplib::Request& req, httplib::Response& res) {
    std::string rid = GetRequestId(req);
    obs::HttpRequestLogScope log(req, res, "api_server", rid);
    res.status = 200;
    res.set_content(metrics::MetricsRegistry::Instance().ToPrometheus(), "text/plain");
}

void ApiServer::SendJson(httplib::Response& res, nlohmann::json j, int status, const std::string& request_id) {
    if (!request_id.empty() && !j.contains("request_id")) {
        j["request_id"] = request_id;
    }
    res.status = status;
    if (!request_id.empty()) {
        res.set_header("X-Request-ID", request_id);
    }
    res.set_content(j.dump(), "application/json");
}

void ApiServer::SendError(const ApiErrorArgs& args) {
    metrics::MetricsRegistry::Instance().Increment(
        "http_errors_total", {{"status", std::to_string(args.status)}, {"code", args.code}});
    nlohmann::json j;
    j["error"]["message"] = args.message;
    j["error"]["code"] = args.code;
    if (!args.request_id.empty()) {
        j["error"]["request_id"] = args.request_id;
    }
    SendJson(args.res, j, args.status, args.request_id);
}

void ApiServer::ValidateRoutes() {
    if (kRequiredRoutes.size() != registered_routes_) {
        spdlog::warn("Route registry count mismatch! Expected {}, got {}", kRequiredRoutes.size(), registered_routes_);
    } else {
        spdlog::info("Route registry validated ({} routes)", kRequiredRoutes.size());
    }
}

} // namespace datalens::api
