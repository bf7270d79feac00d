#include "http_routes.h"
#include "multipart.h"
#include <json/json.h>
#include <chrono>

namespace scriptbox {

namespace {

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

HttpResponse json_response(int status, const Json::Value& body) {
    HttpResponse resp;
    resp.status_code = status;
    resp.body = to_json(body);
    return resp;
}

HttpResponse error_response(int status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return json_response(status, body);
}

int status_for(ErrorKind error) {
    switch (error) {
        case ErrorKind::NONE: return 200;
        case ErrorKind::INVALID_INPUT: return 400;
        case ErrorKind::NOT_FOUND: return 404;
        case ErrorKind::EXECUTION_FAILED: return 200;
        case ErrorKind::BACKEND_UNAVAILABLE:
        case ErrorKind::RETRIEVAL_FAULT:
        case ErrorKind::TEARDOWN_FAULT:
            return 500;
    }
    return 500;
}

HttpResponse handle_execute(ExecutionService& service, const HttpRequest& req) {
    std::string content_type = req.header("Content-Type");
    if (content_type.find("multipart/form-data") == std::string::npos) {
        return error_response(400, "No file provided");
    }

    std::vector<MultipartPart> parts = MultipartParser::parse(content_type, req.body);
    const MultipartPart* file = MultipartParser::find(parts, "file");
    if (!file) {
        return error_response(400, "No file provided");
    }

    SubmitResult submitted = service.submit(file->data, file->filename);
    if (!submitted.ok()) {
        return error_response(status_for(submitted.error), submitted.message);
    }

    Json::Value body;
    body["session_id"] = submitted.session_id;
    return json_response(200, body);
}

HttpResponse handle_result(ExecutionService& service, const HttpRequest& req) {
    std::string id = session_id_from_path(req.path, "/result/");
    if (id.empty()) {
        return error_response(404, "Session not found");
    }

    PollResult polled = service.poll(id);
    Json::Value body;
    switch (polled.state) {
        case PollState::STILL_RUNNING:
            body["status"] = "still running";
            return json_response(202, body);
        case PollState::FINISHED:
            body["logs"] = polled.logs;
            return json_response(200, body);
        case PollState::FAILED:
            body["status"] = "failed";
            body["logs"] = polled.logs;
            body["exit_code"] = polled.exit_code.value_or(-1);
            body["error"] = polled.message;
            return json_response(200, body);
        case PollState::NOT_FOUND:
            return error_response(404, "Session not found");
        case PollState::FAULT:
            return error_response(500, "Failed to retrieve result: " + polled.message);
    }
    return error_response(500, "Unknown poll state");
}

HttpResponse handle_cleanup(ExecutionService& service, const HttpRequest& req) {
    std::string id = session_id_from_path(req.path, "/cleanup/");
    if (id.empty()) {
        return error_response(404, "Session not found");
    }

    CleanupResult cleaned = service.cleanup(id);
    if (!cleaned.ok()) {
        return error_response(status_for(cleaned.error), cleaned.message);
    }

    Json::Value body;
    body["status"] = "cleaned up";
    return json_response(200, body);
}

HttpResponse handle_info(ExecutionService& service, const HttpRequest& req) {
    if (req.path != "/") {
        return error_response(404, "Not found");
    }

    const ServiceConfig& config = service.config();
    Json::Value body;
    body["service"] = "scriptbox";
    body["backend"] = service.backend().name();

    Json::Value endpoints(Json::arrayValue);
    endpoints.append("POST /execute");
    endpoints.append("GET /result/{session_id}");
    endpoints.append("POST /cleanup/{session_id}");
    endpoints.append("GET /stats");
    body["endpoints"] = endpoints;

    Json::Value limits;
    limits["max_artifact_bytes"] = Json::UInt64(config.artifact.max_bytes);
    limits["entrypoint"] = config.artifact.entrypoint;
    Json::Value extensions(Json::arrayValue);
    for (const auto& ext : config.artifact.allowed_extensions) {
        extensions.append(ext);
    }
    limits["allowed_extensions"] = extensions;
    limits["memory_mb"] = Json::UInt64(config.limits.memory_limit_mb);
    limits["wall_timeout_seconds"] = Json::Int64(config.limits.wall_timeout.count());
    limits["network"] = config.limits.allow_network;
    limits["session_max_age_seconds"] = Json::Int64(config.reaper.max_age.count());
    limits["session_idle_seconds"] = Json::Int64(config.reaper.idle_timeout.count());
    body["limits"] = limits;

    return json_response(200, body);
}

HttpResponse handle_stats(ExecutionService& service) {
    ServiceStats stats = service.stats();

    Json::Value body;
    body["backend"] = stats.backend;
    body["live_sessions"] = Json::UInt64(stats.live_sessions);

    Json::Value by_status(Json::objectValue);
    for (const auto& [status, count] : stats.by_status) {
        by_status[to_string(status)] = Json::UInt64(count);
    }
    body["sessions_by_status"] = by_status;

    body["cleaned"] = Json::UInt64(stats.cleanup.cleaned);
    body["reaped"] = Json::UInt64(stats.cleanup.reaped);
    body["teardown_faults"] = Json::UInt64(stats.cleanup.teardown_faults);

    Json::Value faults(Json::arrayValue);
    for (const auto& fault : stats.recent_faults) {
        Json::Value entry;
        entry["session_id"] = fault.session_id;
        entry["handle"] = fault.backend_handle;
        entry["message"] = fault.message;
        entry["reaped"] = fault.reaped;
        entry["at"] = Json::Int64(std::chrono::duration_cast<std::chrono::seconds>(
            fault.at.time_since_epoch()).count());
        faults.append(entry);
    }
    body["recent_faults"] = faults;

    return json_response(200, body);
}

} // namespace

std::string session_id_from_path(const std::string& path, const std::string& prefix) {
    if (path.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    std::string id = path.substr(prefix.size());
    size_t query = id.find_first_of("?#");
    if (query != std::string::npos) {
        id.erase(query);
    }
    if (id.find('/') != std::string::npos) {
        return "";
    }
    return id;
}

void register_routes(HttpServer& server, ExecutionService& service) {
    server.route("POST", "/execute", [&service](const HttpRequest& req) {
        return handle_execute(service, req);
    });
    server.route("GET", "/result/", [&service](const HttpRequest& req) {
        return handle_result(service, req);
    });
    server.route("POST", "/cleanup/", [&service](const HttpRequest& req) {
        return handle_cleanup(service, req);
    });
    server.route("GET", "/stats", [&service](const HttpRequest&) {
        return handle_stats(service);
    });
    server.route("GET", "/", [&service](const HttpRequest& req) {
        return handle_info(service, req);
    });
}

} // namespace scriptbox
