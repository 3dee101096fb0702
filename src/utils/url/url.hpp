#pragma once
#include <optional>
#include <string>

namespace Binder {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
    bool        has_authority = false;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string compose(const UrlParsed& parsed);

    // RFC 3986 reference resolution. The result is not validated; pass it through
    // normalize() before using it as a page identity.
    static std::string resolve(const std::string& base, const std::string& relative);

    // Canonical form of an absolute http(s) URL: lower-case scheme and host, no default
    // port, no dot segments, "/" for an empty path. Query, fragment and trailing slashes
    // are kept as they are. Returns nothing for anything else, including URLs carrying
    // userinfo or port 0.
    static std::optional<std::string> normalize(const std::string& url);

    static std::string request_target(const UrlParsed& parsed);
    // Value for the HTTP Host header: host as written (IPv6 keeps its brackets), with
    // the port only when it is not the scheme's default.
    static std::string host_header(const UrlParsed& parsed);
    static std::string default_port(const std::string& scheme);
    static std::string remove_dot_segments(const std::string& path);
};

}  // namespace Utils
}  // namespace Binder
