#pragma once
#include <cstddef>

namespace Binder {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS         = 2;   // IO Threads
    static constexpr int         DEFAULT_MAX_CONCURRENCY = 50;  // In-flight fetches
    static constexpr const char* VERSION                 = "0.1.0";

    static constexpr const char* DEFAULT_START_URL =
        "https://doc.rust-lang.org/stable/book/title-page.html";
    static constexpr const char* DEFAULT_OUTPUT_PATH      = "scraped_book_concurrent.html";
    static constexpr const char* DEFAULT_CONTENT_SELECTOR = "main";
    static constexpr const char* DEFAULT_NEXT_SELECTOR    = "a[title='Next chapter']";
    static constexpr const char* DEFAULT_TITLE            = "Scraped Documentation";
    static constexpr const char* CHAPTER_SEPARATOR        = "<hr />\n";

    static constexpr int         REQUEST_TIMEOUT_SECONDS    = 10;
    static constexpr int         CONNECT_TIMEOUT_MS         = 5000;
    static constexpr int         DEFAULT_MAX_REDIRECTS      = 5;
    static constexpr std::size_t DEFAULT_MAX_CHAPTERS       = 0;  // 0 = Unlimited
    static constexpr int         DEFAULT_RUN_TIMEOUT_SECONDS = 0;  // 0 = None
    static constexpr const char* USER_AGENT                 = "Binder/0.1";
};

}  // namespace Core
}  // namespace Binder
