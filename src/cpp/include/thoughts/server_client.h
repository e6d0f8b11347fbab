#pragma once

#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace thoughts {

// Talks to the sidecar's HTTP endpoint on localhost
class ServerClient {
public:
    explicit ServerClient(int port);

    // GET /health. Throws NetworkException unless the server answers 200
    // with a JSON body.
    nlohmann::json get_health() const;

    // Pause between health attempts. Returns true to abandon the wait.
    using WaitStep = std::function<bool()>;

    // Poll /health once per second until it answers or the timeout expires.
    // A wait_step replaces the one-second sleep, so the caller can stop
    // waiting early (e.g. on a termination signal).
    bool wait_for_ready(int timeout_seconds, const WaitStep& wait_step = nullptr) const;

    std::string get_base_url() const;
    int port() const { return port_; }

private:
    std::string make_http_request(const std::string& endpoint, int timeout_seconds = 5) const;

    int port_;
};

} // namespace thoughts
