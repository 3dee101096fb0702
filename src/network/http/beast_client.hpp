#pragma once

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <string>
#include "../../core/types/constants.hpp"
#include "http_client.hpp"

namespace Binder {
namespace Network {
namespace Http {

class BeastClient : public HttpClient {
public:
    BeastClient();
    ~BeastClient() override = default;

    void set_connect_timeout(std::chrono::milliseconds timeout) override;
    void set_request_timeout(std::chrono::seconds timeout) override;
    void set_user_agent(const std::string& user_agent) override;
    boost::asio::awaitable<Response> get(const std::string& url) override;

private:
    std::chrono::milliseconds connect_timeout_{Core::Constants::CONNECT_TIMEOUT_MS};
    std::chrono::seconds      request_timeout_{Core::Constants::REQUEST_TIMEOUT_SECONDS};
    std::string               user_agent_ = Core::Constants::USER_AGENT;
    boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tlsv12_client};

    struct Endpoint {
        std::string host;  // unbracketed, for resolve and SNI
        std::string port;
        std::string host_header;
        std::string target;
    };

    boost::asio::awaitable<Response> perform_http_request(const Endpoint& endpoint,
                                                          Response        response);
    boost::asio::awaitable<Response> perform_https_request(const Endpoint& endpoint,
                                                           Response        response);

    template <typename Stream>
    boost::asio::awaitable<Response>
    exchange(Stream& stream, const std::string& host, const std::string& target, Response response);
};

}  // namespace Http
}  // namespace Network
}  // namespace Binder
