#include "http_page_fetcher.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Binder {
namespace Engine {

using namespace Binder::Core;
using namespace Binder::Network::Http;
using Binder::Utils::Url;

namespace {

Page failed(const std::string& url, FetchErrorType type, const std::string& error) {
    Page page;
    page.url        = url;
    page.success    = false;
    page.error_type = type;
    page.error      = error;
    return page;
}

}  // namespace

HttpPageFetcher::HttpPageFetcher(std::unique_ptr<HttpClient> client,
                                 Utils::Html::Extractor      extractor,
                                 int                         max_redirects)
    : client_(std::move(client)), extractor_(std::move(extractor)), max_redirects_(max_redirects) {
}

boost::asio::awaitable<Page> HttpPageFetcher::fetch(const std::string& url) {
    std::string current = url;

    for (int hop = 0;; ++hop) {
        Response res = co_await client_->get(current);

        if (res.is_redirect()) {
            if (hop >= max_redirects_)
                co_return failed(url, FetchErrorType::Network, "Too many redirects");

            auto next = Url::normalize(Url::resolve(current, res.location));
            if (!next)
                co_return failed(url, FetchErrorType::Network, "Bad redirect: " + res.location);

            Logger::debug("Redirect " + current + " -> " + *next);
            current = *next;
            continue;
        }

        if (!res.success) {
            std::string cause = res.error_type == ErrorType::Status
                                    ? res.error
                                    : std::string(to_string(res.error_type)) + ": " + res.error;
            co_return failed(url, FetchErrorType::Network, cause);
        }

        co_return make_page(current, res);
    }
}

Page HttpPageFetcher::make_page(const std::string& url, const Response& res) const {
    if (!Utils::Text::is_valid_utf8(res.body)) {
        return failed(url, FetchErrorType::Decode, "Response body is not valid UTF-8");
    }

    auto extraction = extractor_.extract(res.body);
    if (!extraction.found_content) {
        return failed(url, FetchErrorType::ContentNotFound, "Could not find content on the page");
    }

    Page page;
    page.url     = url;
    page.success = true;
    page.content = std::move(extraction.content);

    if (extraction.next_href) {
        page.next_url = Url::normalize(Url::resolve(url, *extraction.next_href));
        if (!page.next_url) {
            Logger::info("Ignoring unresolvable next link '" + *extraction.next_href + "' on "
                         + url);
        }
    }
    return page;
}

}  // namespace Engine
}  // namespace Binder
