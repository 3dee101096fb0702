#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <string_view>
#include "../text/string_utils.hpp"

namespace Binder {
namespace Utils {

namespace {

constexpr std::string_view FORBIDDEN_HOST_CHARS = " \t\r\n<>\"\\^`{|}%/?#";

bool is_http_scheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https";
}

bool is_scheme_char(char c, bool first) {
    if (std::isalpha(static_cast<unsigned char>(c)))
        return true;
    return !first && (std::isdigit(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.');
}

bool has_scheme(std::string_view ref) {
    size_t colon = ref.find(':');
    if (colon == std::string_view::npos || colon == 0)
        return false;
    for (size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(ref[i], i == 0))
            return false;
    }
    return true;
}

void pop_last_segment(std::string& output) {
    size_t pos = output.rfind('/');
    output.erase(pos == std::string::npos ? 0 : pos);
}

std::string authority_of(const UrlParsed& parsed) {
    std::string auth = parsed.userinfo.empty() ? parsed.host : parsed.userinfo + "@" + parsed.host;
    if (!parsed.port.empty())
        auth += ":" + parsed.port;
    return auth;
}

std::string merge_paths(const UrlParsed& base, const std::string& relative_path) {
    if (base.has_authority && base.path.empty())
        return "/" + relative_path;
    size_t last_slash = base.path.find_last_of('/');
    if (last_slash == std::string::npos)
        return relative_path;
    return base.path.substr(0, last_slash + 1) + relative_path;
}

bool valid_port(const std::string& port) {
    if (port.empty() || port.size() > 5)
        return false;
    if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); }))
        return false;
    int value = std::stoi(port);
    return value > 0 && value <= 65535;
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed        parsed;
    std::string_view sv = url;

    if (has_scheme(sv)) {
        size_t colon  = sv.find(':');
        parsed.scheme = Text::to_lower(std::string(sv.substr(0, colon)));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        parsed.has_authority = true;
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));
        sv = end_auth == std::string_view::npos ? std::string_view{} : sv.substr(end_auth);

        size_t      at        = authority.find_last_of('@');
        std::string host_port = authority;
        if (at != std::string::npos) {
            parsed.userinfo = authority.substr(0, at);
            host_port       = authority.substr(at + 1);
        }

        if (!host_port.empty() && host_port[0] == '[') {
            size_t end_bracket = host_port.find(']');
            if (end_bracket != std::string::npos) {
                parsed.host    = host_port.substr(0, end_bracket + 1);
                size_t p_colon = host_port.find(':', end_bracket + 1);
                if (p_colon != std::string::npos) {
                    parsed.port = host_port.substr(p_colon + 1);
                }
            }
            else {
                parsed.host = host_port;
            }
        }
        else {
            size_t p_colon = host_port.find_last_of(':');
            if (p_colon != std::string::npos) {
                parsed.host = host_port.substr(0, p_colon);
                parsed.port = host_port.substr(p_colon + 1);
            }
            else {
                parsed.host = host_port;
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);
    return parsed;
}

std::string Url::compose(const UrlParsed& parsed) {
    std::string result;
    if (!parsed.scheme.empty())
        result += parsed.scheme + ":";
    if (parsed.has_authority)
        result += "//" + authority_of(parsed);
    result += parsed.path;
    if (!parsed.query.empty())
        result += "?" + parsed.query;
    if (!parsed.fragment.empty())
        result += "#" + parsed.fragment;
    return result;
}

std::string Url::remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::string output;

    while (!input.empty()) {
        if (input.rfind("../", 0) == 0) {
            input.erase(0, 3);
        }
        else if (input.rfind("./", 0) == 0) {
            input.erase(0, 2);
        }
        else if (input.rfind("/./", 0) == 0) {
            input.replace(0, 3, "/");
        }
        else if (input == "/.") {
            input = "/";
        }
        else if (input.rfind("/../", 0) == 0) {
            input.replace(0, 4, "/");
            pop_last_segment(output);
        }
        else if (input == "/..") {
            input = "/";
            pop_last_segment(output);
        }
        else if (input == "." || input == "..") {
            input.clear();
        }
        else {
            size_t next = input.find('/', input[0] == '/' ? 1 : 0);
            if (next == std::string::npos)
                next = input.size();
            output += input.substr(0, next);
            input.erase(0, next);
        }
    }
    return output;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    std::string ref = Text::trim(relative);
    UrlParsed   b   = parse(base);

    if (has_scheme(ref)) {
        UrlParsed r = parse(ref);
        r.path      = remove_dot_segments(r.path);
        return compose(r);
    }

    UrlParsed target;
    target.scheme = b.scheme;

    if (ref.rfind("//", 0) == 0) {
        UrlParsed r          = parse(ref);
        target.has_authority = true;
        target.userinfo      = r.userinfo;
        target.host          = r.host;
        target.port          = r.port;
        target.path          = remove_dot_segments(r.path);
        target.query         = r.query;
        target.fragment      = r.fragment;
        return compose(target);
    }

    UrlParsed r          = parse(ref);
    target.has_authority = b.has_authority;
    target.userinfo      = b.userinfo;
    target.host          = b.host;
    target.port          = b.port;
    target.fragment      = r.fragment;

    if (r.path.empty()) {
        target.path  = b.path;
        bool has_q   = ref.find('?') != std::string::npos;
        target.query = has_q ? r.query : b.query;
    }
    else {
        target.path  = remove_dot_segments(r.path[0] == '/' ? r.path : merge_paths(b, r.path));
        target.query = r.query;
    }
    return compose(target);
}

std::optional<std::string> Url::normalize(const std::string& url) {
    UrlParsed p = parse(Text::trim(url));

    if (!is_http_scheme(p.scheme) || !p.has_authority || p.host.empty())
        return std::nullopt;
    if (!p.userinfo.empty())
        return std::nullopt;
    if (p.host.find_first_of(FORBIDDEN_HOST_CHARS) != std::string::npos && p.host[0] != '[')
        return std::nullopt;

    p.host = Text::to_lower(p.host);

    if (!p.port.empty()) {
        if (!valid_port(p.port))
            return std::nullopt;
        p.port = std::to_string(std::stoi(p.port));
        if (p.port == default_port(p.scheme))
            p.port.clear();
    }

    p.path = remove_dot_segments(p.path);
    if (p.path.empty() || p.path[0] != '/')
        p.path = "/" + p.path;

    return compose(p);
}

std::string Url::request_target(const UrlParsed& parsed) {
    std::string target = parsed.path.empty() ? "/" : parsed.path;
    if (!parsed.query.empty())
        target += "?" + parsed.query;
    return target;
}

std::string Url::host_header(const UrlParsed& parsed) {
    if (parsed.port.empty() || parsed.port == default_port(parsed.scheme))
        return parsed.host;
    return parsed.host + ":" + parsed.port;
}

std::string Url::default_port(const std::string& scheme) {
    return scheme == "https" ? "443" : "80";
}

}  // namespace Utils
}  // namespace Binder
