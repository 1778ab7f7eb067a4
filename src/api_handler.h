#pragma once

#include "http_server.h"
#include "executor.h"
#include "language_registry.h"

namespace runbox {

// HTTP surface of the service:
//   GET  /             liveness
//   POST /api/execute  {language, code, input?} -> {output, error}
class ApiHandler {
public:
    ApiHandler(const CodeExecutor& executor, const LanguageRegistry& languages);

    HttpResponse health(const HttpRequest& req) const;
    HttpResponse execute(const HttpRequest& req) const;

    void register_routes(HttpServer& server) const;

private:
    const CodeExecutor& executor_;
    const LanguageRegistry& languages_;
};

} // namespace runbox
