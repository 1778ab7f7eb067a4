#include "docker_client.h"
#include "constants.h"
#include "logger.h"
#include <json/json.h>
#include <sstream>
#include <algorithm>

namespace runbox {

namespace {

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

bool parse_json(const std::string& text, Json::Value& out) {
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    return Json::parseFromStream(builder, stream, &out, &errors);
}

// Docker reports failures as {"message": "..."}
std::string engine_message(const EngineResponse& resp) {
    Json::Value body;
    if (parse_json(resp.body, body) && body.isObject() && body["message"].isString()) {
        return body["message"].asString();
    }
    if (!resp.body.empty()) return resp.body;
    return resp.reason.empty() ? "HTTP " + std::to_string(resp.status_code) : resp.reason;
}

void expect_success(const EngineResponse& resp, const std::string& what) {
    if (!resp.ok()) {
        throw EngineError(what + " failed: " + engine_message(resp), resp.status_code);
    }
}

// Attach channel backed by a hijacked Docker connection
class DockerAttachStream : public AttachStream {
public:
    DockerAttachStream(std::unique_ptr<UnixSocket> sock, std::string leftover)
        : sock_(std::move(sock)), leftover_(std::move(leftover)) {}

    size_t read(char* buffer, size_t len) override {
        if (offset_ < leftover_.size()) {
            size_t take = std::min(len, leftover_.size() - offset_);
            leftover_.copy(buffer, take, offset_);
            offset_ += take;
            return take;
        }
        return sock_->recv_blocking(buffer, len);
    }

    void write(const std::string& data, std::chrono::milliseconds timeout) override {
        sock_->send_all(data, std::chrono::steady_clock::now() + timeout);
    }

    void close_write() noexcept override {
        sock_->shutdown_write();
    }

    void close() noexcept override {
        sock_->shutdown_both();
    }

private:
    std::unique_ptr<UnixSocket> sock_;
    std::string leftover_;
    size_t offset_ = 0;
};

} // namespace

DockerClient::DockerClient(const std::string& socket_path, std::string api_version)
    : http_(socket_path), api_version_(std::move(api_version)) {}

EngineResponse DockerClient::call(const std::string& method, const std::string& path,
                                  const std::string& body) {
    return http_.request(method, url(path), body,
                         std::chrono::duration_cast<std::chrono::milliseconds>(ENGINE_IO_TIMEOUT));
}

void DockerClient::ping() {
    EngineResponse resp = call("GET", "/_ping");
    expect_success(resp, "Ping");
}

std::string DockerClient::create_body(const ContainerSpec& spec) {
    Json::Value body;
    body["Image"] = spec.image;

    Json::Value cmd(Json::arrayValue);
    for (const auto& arg : spec.command) {
        cmd.append(arg);
    }
    body["Cmd"] = cmd;
    body["WorkingDir"] = spec.working_dir;
    body["Tty"] = false;
    body["OpenStdin"] = spec.open_stdin;
    body["StdinOnce"] = spec.open_stdin;
    body["AttachStdin"] = spec.open_stdin;
    body["AttachStdout"] = true;
    body["AttachStderr"] = true;

    Json::Value host;
    Json::Value binds(Json::arrayValue);
    for (const auto& bind : spec.binds) {
        binds.append(bind);
    }
    host["Binds"] = binds;
    host["Memory"] = static_cast<Json::Int64>(spec.memory_bytes);
    host["CpuPeriod"] = static_cast<Json::Int64>(spec.cpu_period_us);
    host["CpuQuota"] = static_cast<Json::Int64>(spec.cpu_quota_us);
    host["AutoRemove"] = false;
    body["HostConfig"] = host;

    return to_json(body);
}

std::string DockerClient::create_container(const ContainerSpec& spec) {
    EngineResponse resp = call("POST", "/containers/create", create_body(spec));
    expect_success(resp, "Create container");

    Json::Value body;
    if (!parse_json(resp.body, body) || !body["Id"].isString()) {
        throw EngineError("Create container returned no id: " + resp.body, resp.status_code);
    }
    if (body["Warnings"].isArray()) {
        for (const auto& warning : body["Warnings"]) {
            LOG_WARN("[Docker] " + warning.asString());
        }
    }
    return body["Id"].asString();
}

void DockerClient::start_container(const std::string& id) {
    EngineResponse resp = call("POST", "/containers/" + id + "/start");
    // 304: already started
    if (resp.status_code == 304) return;
    expect_success(resp, "Start container");
}

std::unique_ptr<AttachStream> DockerClient::attach_container(const std::string& id) {
    std::string leftover;
    auto sock = http_.upgrade(
        url("/containers/" + id + "/attach?stream=1&stdin=1&stdout=1&stderr=1&logs=1"),
        leftover,
        std::chrono::duration_cast<std::chrono::milliseconds>(ENGINE_IO_TIMEOUT));
    return std::make_unique<DockerAttachStream>(std::move(sock), std::move(leftover));
}

WaitResult DockerClient::wait_container(const std::string& id, std::chrono::milliseconds timeout) {
    EngineResponse resp = http_.request("POST", url("/containers/" + id + "/wait?condition=not-running"),
                                        "", timeout);
    expect_success(resp, "Wait for container");

    Json::Value body;
    if (!parse_json(resp.body, body) || !body.isMember("StatusCode")) {
        throw EngineError("Wait returned no status code: " + resp.body, resp.status_code);
    }

    WaitResult result;
    result.status_code = body["StatusCode"].asInt64();
    if (body["Error"].isObject() && body["Error"]["Message"].isString()) {
        result.error = body["Error"]["Message"].asString();
    }
    return result;
}

std::string DockerClient::inspect_state(const std::string& id) {
    EngineResponse resp = call("GET", "/containers/" + id + "/json");
    expect_success(resp, "Inspect container");

    Json::Value body;
    if (!parse_json(resp.body, body)) {
        throw EngineError("Inspect returned invalid JSON", resp.status_code);
    }
    return to_json(body["State"]);
}

std::string DockerClient::container_logs(const std::string& id) {
    EngineResponse resp = call("GET", "/containers/" + id + "/logs?stdout=1&stderr=1");
    expect_success(resp, "Fetch container logs");
    return resp.body;
}

void DockerClient::remove_container(const std::string& id, bool force) {
    EngineResponse resp = call("DELETE", "/containers/" + id + (force ? "?force=1" : ""));
    expect_success(resp, "Remove container");
}

} // namespace runbox
