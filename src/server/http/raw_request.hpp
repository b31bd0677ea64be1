#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>
#include <string_view>

// Request as read off the wire. Header names are stored lower-cased.
struct RawRequest {
    std::string method;
    std::string path;
    std::string version;
    std::map<std::string, std::string> headers;
    std::string body;

    static std::string lower(std::string_view s) {
        std::string out(s);
        std::ranges::transform(out, out.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    void set_header(std::string_view name, std::string value) {
        headers[lower(name)] = std::move(value);
    }

    std::string header(std::string_view name) const {
        auto it = headers.find(lower(name));
        return it != headers.end() ? it->second : std::string{};
    }

    bool has_header(std::string_view name) const {
        return headers.contains(lower(name));
    }
};
