#pragma once

#include "engine_client.h"
#include "unix_http.h"
#include <string>

namespace runbox {

// EngineClient speaking the Docker Engine API over its Unix control socket
class DockerClient : public EngineClient {
public:
    explicit DockerClient(const std::string& socket_path,
                          std::string api_version = "/v1.41");

    void ping() override;
    std::string create_container(const ContainerSpec& spec) override;
    void start_container(const std::string& id) override;
    std::unique_ptr<AttachStream> attach_container(const std::string& id) override;
    WaitResult wait_container(const std::string& id, std::chrono::milliseconds timeout) override;
    std::string inspect_state(const std::string& id) override;
    std::string container_logs(const std::string& id) override;
    void remove_container(const std::string& id, bool force) override;

    // JSON body for POST /containers/create (exposed for tests)
    static std::string create_body(const ContainerSpec& spec);

    const std::string& socket_path() const { return http_.socket_path(); }

private:
    EngineResponse call(const std::string& method, const std::string& path,
                        const std::string& body = "");
    std::string url(const std::string& path) const { return api_version_ + path; }

    UnixHttpClient http_;
    std::string api_version_;
};

} // namespace runbox
