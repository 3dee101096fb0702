#pragma once
#include <memory>
#include "../../network/http/http_client.hpp"
#include "../../utils/html/extractor.hpp"
#include "page_fetcher.hpp"

namespace Binder {
namespace Engine {

class HttpPageFetcher : public PageFetcher {
public:
    HttpPageFetcher(std::unique_ptr<Network::Http::HttpClient> client,
                    Utils::Html::Extractor                     extractor,
                    int                                        max_redirects);

    boost::asio::awaitable<Page> fetch(const std::string& url) override;

private:
    std::unique_ptr<Network::Http::HttpClient> client_;
    Utils::Html::Extractor                     extractor_;
    int                                        max_redirects_;

    Page make_page(const std::string& url, const Network::Http::Response& res) const;
};

}  // namespace Engine
}  // namespace Binder
