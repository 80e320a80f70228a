#include "validator/url_parser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <ada.h>

namespace {

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

std::expected<ParsedUrl, UrlParseError> parse_url(std::string_view url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (!parsed) {
        return std::unexpected(UrlParseError::kMalformed);
    }

    const std::string_view hostname = parsed->get_hostname();
    if (hostname.empty()) {
        return std::unexpected(UrlParseError::kMissingHost);
    }

    ParsedUrl out{};

    // get_protocol() 은 "https:" 처럼 ':' 를 포함한다
    std::string_view protocol = parsed->get_protocol();
    if (!protocol.empty() && protocol.back() == ':') {
        protocol.remove_suffix(1);
    }
    out.scheme   = to_lower(protocol);
    out.username = std::string(parsed->get_username());
    out.password = std::string(parsed->get_password());
    out.host     = to_lower(hostname);

    const std::string_view port_text = parsed->get_port();
    if (!port_text.empty()) {
        std::uint16_t value{0};
        const auto [ptr, ec] = std::from_chars(port_text.data(),
                                               port_text.data() + port_text.size(), value);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size()) {
            return std::unexpected(UrlParseError::kMalformed);
        }
        out.port = value;
    }

    out.rest  = std::string(parsed->get_pathname());
    out.rest += parsed->get_search();
    out.rest += parsed->get_hash();
    return out;
}

std::string to_normalized_string(const ParsedUrl& url) {
    std::string out = url.scheme;
    out += "://";
    if (url.has_credentials()) {
        out += url.username;
        if (!url.password.empty()) {
            out += ':';
            out += url.password;
        }
        out += '@';
    }
    out += url.host;
    if (url.port) {
        out += ':';
        out += std::to_string(*url.port);
    }
    out += url.rest;
    return out;
}

std::string_view to_string(UrlParseError error) noexcept {
    switch (error) {
        case UrlParseError::kMalformed:   return "malformed URL";
        case UrlParseError::kMissingHost: return "URL has no host";
    }
    return "unknown";
}
