#include "api_handler.h"
#include "logger.h"
#include <json/json.h>
#include <sstream>
#include <stdexcept>

namespace runbox {

namespace {

HttpResponse json_response(int status, const Json::Value& body) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;

    HttpResponse resp;
    resp.status_code = status;
    resp.body = Json::writeString(builder, body);
    return resp;
}

HttpResponse error_response(int status, const std::string& message) {
    Json::Value body;
    body["error"] = message;
    return json_response(status, body);
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ApiHandler::ApiHandler(const CodeExecutor& executor, const LanguageRegistry& languages)
    : executor_(executor), languages_(languages) {}

void ApiHandler::register_routes(HttpServer& server) const {
    server.route("GET", "/", [this](const HttpRequest& req) { return health(req); });
    server.route("POST", "/api/execute", [this](const HttpRequest& req) { return execute(req); });
}

HttpResponse ApiHandler::health(const HttpRequest&) const {
    Json::Value body;
    body["status"] = "healthy";
    return json_response(200, body);
}

HttpResponse ApiHandler::execute(const HttpRequest& req) const {
    LOG_INFO("[API] Received request from " + req.client_ip + " (" +
             std::to_string(req.body.size()) + " bytes)");

    if (is_blank(req.body)) {
        LOG_ERROR("[API] Request body is missing");
        return error_response(400, "Request body is missing");
    }

    Json::Value body;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(req.body);
    if (!Json::parseFromStream(builder, stream, &body, &errors) || !body.isObject()) {
        LOG_ERROR("[API] Invalid JSON body: " + errors);
        return error_response(400, "Invalid JSON body");
    }

    const Json::Value& language = body["language"];
    const Json::Value& code = body["code"];
    if (!language.isString() || !code.isString() ||
        language.asString().empty() || code.asString().empty()) {
        LOG_ERROR("[API] Language or code is missing in request");
        return error_response(400, "Language and code are required");
    }

    if (!languages_.supports(language.asString())) {
        LOG_ERROR("[API] Unsupported language: " + language.asString());
        return error_response(400, "Unsupported language");
    }

    ExecutionRequest request;
    request.language = language.asString();
    request.code = code.asString();

    const Json::Value& input = body["input"];
    if (input.isString()) {
        request.input = input.asString();
    } else if (!input.isNull()) {
        LOG_ERROR("[API] Input is not a string");
        return error_response(400, "Input must be a string");
    }

    LOG_INFO("[API] Executing " + std::to_string(request.code.size()) + " bytes of " +
             request.language + (request.input.empty() ? "" : " with input"));

    JobResult result;
    try {
        result = executor_.execute(request);
    } catch (const ExecutionError& e) {
        return error_response(500, e.what());
    } catch (const std::invalid_argument& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("[API] Error during execution: " + std::string(e.what()));
        return error_response(500, e.what());
    }

    // Non-zero exit is a failure; stderr is the best diagnostic we have
    if (result.exit_code != 0) {
        return error_response(500, result.error.empty() ? "Execution failed" : result.error);
    }

    Json::Value response;
    response["output"] = result.output;
    response["error"] = result.error;
    LOG_INFO("[API] Sending response for job " + result.job_id);
    return json_response(200, response);
}

} // namespace runbox
