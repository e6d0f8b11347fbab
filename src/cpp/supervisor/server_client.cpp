#include <thoughts/server_client.h>
#include <thoughts/error_types.h>
#include <chrono>
#include <thread>

// Note: Not using OpenSSL support since we only connect to localhost
#include <httplib.h>

namespace thoughts {

ServerClient::ServerClient(int port)
    : port_(port)
{
}

std::string ServerClient::get_base_url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
}

nlohmann::json ServerClient::get_health() const {
    std::string response = make_http_request("/health");
    try {
        return nlohmann::json::parse(response);
    } catch (const nlohmann::json::parse_error& e) {
        throw NetworkException(std::string("invalid health response: ") + e.what());
    }
}

bool ServerClient::wait_for_ready(int timeout_seconds, const WaitStep& wait_step) const {
    for (int i = 0; i < timeout_seconds; ++i) {
        try {
            get_health();
            return true;
        } catch (const NetworkException&) {
            if (!wait_step) {
                std::this_thread::sleep_for(std::chrono::seconds(1));
            } else if (wait_step()) {
                return false;
            }
        }
    }
    return false;
}

std::string ServerClient::make_http_request(const std::string& endpoint, int timeout_seconds) const {
    // Use 127.0.0.1 instead of "localhost" to avoid IPv6/IPv4 resolution issues
    httplib::Client cli("127.0.0.1", port_);
    cli.set_connection_timeout(2, 0);
    cli.set_read_timeout(timeout_seconds, 0);

    auto res = cli.Get(endpoint.c_str());
    if (!res) {
        throw NetworkException("connection to " + get_base_url() + " failed: " +
                               httplib::to_string(res.error()));
    }

    if (res->status != 200) {
        throw NetworkException("request " + endpoint + " failed with status: " +
                               std::to_string(res->status));
    }

    return res->body;
}

} // namespace thoughts
