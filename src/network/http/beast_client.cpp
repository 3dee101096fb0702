#include "beast_client.hpp"
#include <boost/asio/redirect_error.hpp>
#include "../../utils/url/url.hpp"

namespace Binder {
namespace Network {
namespace Http {

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

BeastClient::BeastClient() {
    ssl_ctx_.set_default_verify_paths();
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
}

void BeastClient::set_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout_ = timeout;
}

void BeastClient::set_request_timeout(std::chrono::seconds timeout) {
    request_timeout_ = timeout;
}

void BeastClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

net::awaitable<Response> BeastClient::get(const std::string& url) {
    Response response;

    auto parsed = Binder::Utils::Url::parse(url);
    if (parsed.host.empty() || (parsed.scheme != "http" && parsed.scheme != "https")) {
        response.error      = "Invalid URL";
        response.error_type = ErrorType::InvalidUrl;
        co_return response;
    }

    Endpoint endpoint;
    endpoint.port        = parsed.port.empty() ? Utils::Url::default_port(parsed.scheme) : parsed.port;
    endpoint.target      = Utils::Url::request_target(parsed);
    endpoint.host_header = Utils::Url::host_header(parsed);
    endpoint.host        = parsed.host;
    // IPv6 brackets stay in the Host header; resolve and SNI take the bare address.
    if (endpoint.host.size() > 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']')
        endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);

    try {
        if (parsed.scheme == "https") {
            co_return co_await perform_https_request(endpoint, std::move(response));
        }
        co_return co_await perform_http_request(endpoint, std::move(response));
    } catch (const boost::system::system_error& e) {
        Response failed;
        failed.error = e.code().message();
        if (e.code() == beast::error::timeout)
            failed.error_type = ErrorType::Timeout;
        else if (e.code().category() == net::error::get_ssl_category())
            failed.error_type = ErrorType::Tls;
        else
            failed.error_type = ErrorType::Network;
        co_return failed;
    } catch (const std::exception& e) {
        Response failed;
        failed.error      = e.what();
        failed.error_type = ErrorType::Network;
        co_return failed;
    }
}

template <typename Stream>
net::awaitable<Response> BeastClient::exchange(Stream&            stream,
                                               const std::string& host,
                                               const std::string& target,
                                               Response           response) {
    http::request<http::string_body> req{http::verb::get, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    req.set(http::field::accept, "text/html,application/xhtml+xml");

    co_await http::async_write(stream, req, net::use_awaitable);

    beast::flat_buffer                b;
    http::response<http::string_body> res;
    co_await                          http::async_read(stream, b, res, net::use_awaitable);

    response.status_code = res.result_int();
    response.body        = std::move(res.body());
    response.success     = (response.status_code >= 200 && response.status_code < 300);
    if (!response.success) {
        response.error      = "HTTP " + std::to_string(response.status_code);
        response.error_type = ErrorType::Status;
    }

    auto loc = res.find(http::field::location);
    if (loc != res.end())
        response.location = std::string(loc->value());

    co_return response;
}

net::awaitable<Response> BeastClient::perform_http_request(const Endpoint& endpoint,
                                                           Response        response) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results =
        co_await resolver.async_resolve(endpoint.host, endpoint.port, net::use_awaitable);

    beast::tcp_stream stream(co_await net::this_coro::executor);
    stream.expires_after(connect_timeout_);
    co_await stream.async_connect(results, net::use_awaitable);

    stream.expires_after(request_timeout_);
    response = co_await exchange(stream, endpoint.host_header, endpoint.target, std::move(response));

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return response;
}

net::awaitable<Response> BeastClient::perform_https_request(const Endpoint& endpoint,
                                                            Response        response) {
    tcp::resolver resolver(co_await net::this_coro::executor);
    auto          results =
        co_await resolver.async_resolve(endpoint.host, endpoint.port, net::use_awaitable);

    beast::ssl_stream<beast::tcp_stream> ssl_stream(co_await net::this_coro::executor, ssl_ctx_);
    if (!SSL_set_tlsext_host_name(ssl_stream.native_handle(), endpoint.host.c_str())) {
        throw beast::system_error(
            beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
    }
    // Certificate must name the host, not just chain to a trusted CA.
    ssl_stream.set_verify_callback(ssl::host_name_verification(endpoint.host));

    beast::get_lowest_layer(ssl_stream).expires_after(connect_timeout_);
    co_await beast::get_lowest_layer(ssl_stream).async_connect(results, net::use_awaitable);
    co_await ssl_stream.async_handshake(ssl::stream_base::client, net::use_awaitable);

    beast::get_lowest_layer(ssl_stream).expires_after(request_timeout_);
    response =
        co_await exchange(ssl_stream, endpoint.host_header, endpoint.target, std::move(response));

    // Servers often close without close_notify; the response is already complete.
    beast::error_code ec;
    co_await ssl_stream.async_shutdown(net::redirect_error(net::use_awaitable, ec));
    co_return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Binder
