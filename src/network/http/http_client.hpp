#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <chrono>
#include <string>

namespace Binder {
namespace Network {
namespace Http {

// Status: the exchange completed with a non-2xx status.
enum class ErrorType { None, Status, Network, Timeout, Tls, InvalidUrl };

inline const char* to_string(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::Status: return "status";
        case ErrorType::Network: return "network";
        case ErrorType::Timeout: return "timeout";
        case ErrorType::Tls: return "tls";
        case ErrorType::InvalidUrl: return "invalid url";
    }
    return "unknown";
}

struct Response {
    long        status_code = 0;
    std::string location;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;

    bool is_redirect() const {
        return status_code >= 300 && status_code < 400 && !location.empty();
    }
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void set_connect_timeout(std::chrono::milliseconds /*timeout*/) {}
    virtual void set_request_timeout(std::chrono::seconds /*timeout*/) {}
    virtual void set_user_agent(const std::string& /*user_agent*/) {}

    // Single request, no redirect following. Transport failures are reported in the
    // Response, never thrown.
    virtual boost::asio::awaitable<Response> get(const std::string& url) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Binder
