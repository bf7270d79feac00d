#pragma once

#include <string>
#include "http_server.h"
#include "execution_service.h"

namespace scriptbox {

// Registers the public API on `server`:
//
//   POST /execute          multipart upload, field "file"
//   GET  /result/{id}      200 logs | 202 still running | 404 | 500
//   POST /cleanup/{id}     200 cleaned up | 404
//   GET  /                 service info
//   GET  /stats            session counts and cleanup ledger
void register_routes(HttpServer& server, ExecutionService& service);

// Session id from "/prefix/{id}[?query]"; "" if missing or malformed
std::string session_id_from_path(const std::string& path, const std::string& prefix);

} // namespace scriptbox
