#include "http/multipart.hpp"

#include "http/text_util.hpp"

#include <vector>

namespace multipart {

namespace {

constexpr std::string_view kCrlf = "\r\n";
constexpr std::string_view kHeaderEnd = "\r\n\r\n";

std::string_view strip_quotes(std::string_view s) {
    while (!s.empty() && s.front() == '"') s.remove_prefix(1);
    while (!s.empty() && s.back() == '"') s.remove_suffix(1);
    return s;
}

std::vector<std::string_view> split(std::string_view s, std::string_view delim) {
    std::vector<std::string_view> out;
    size_t start = 0;
    while (true) {
        auto pos = s.find(delim, start);
        if (pos == std::string_view::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + delim.size();
    }
}

struct Disposition {
    std::string name;
    bool is_file = false;
};

Disposition parse_disposition(std::string_view header_block) {
    Disposition d;
    auto headers = text::utf8_replace_invalid(header_block);

    for (auto line : split(headers, kCrlf)) {
        if (!text::starts_with_icase(line, "content-disposition:")) continue;

        for (auto item : split(line, ";")) {
            item = text::trim(item);
            if (item.starts_with("name=")) {
                d.name = strip_quotes(item.substr(5));
            }
            if (item.starts_with("filename=")) {
                d.is_file = true;
            }
        }
    }
    return d;
}

} // namespace

std::expected<std::string, ApiError> boundary_of(std::string_view content_type) {
    for (auto param : split(content_type, ";")) {
        param = text::trim(param);
        if (param.starts_with("boundary=")) {
            auto boundary = strip_quotes(text::trim(param.substr(9)));
            if (boundary.empty()) break;
            return std::string(boundary);
        }
    }
    return std::unexpected(ApiError::invalid_request("No boundary found in Content-Type"));
}

std::expected<FormFields, ApiError> decode(std::string_view body, std::string_view content_type) {
    auto boundary = boundary_of(content_type);
    if (!boundary) return std::unexpected(boundary.error());

    const std::string delimiter = "--" + *boundary;
    FormFields fields;

    for (auto part : split(body, delimiter)) {
        if (part.empty() || text::trim(part) == "--") continue;

        if (part.starts_with(kCrlf)) part.remove_prefix(kCrlf.size());
        if (part.ends_with(kCrlf)) part.remove_suffix(kCrlf.size());

        auto sep = part.find(kHeaderEnd);
        if (sep == std::string_view::npos) continue;

        auto disposition = parse_disposition(part.substr(0, sep));
        if (disposition.name.empty()) continue;

        auto content = part.substr(sep + kHeaderEnd.size());

        FormField field{.name = disposition.name, .is_file = disposition.is_file, .value = {}};
        if (field.is_file) {
            field.value.assign(content);
        } else {
            field.value = std::string(text::trim_unicode(text::utf8_replace_invalid(content)));
        }
        fields.insert_or_assign(std::move(disposition.name), std::move(field));
    }

    return fields;
}

} // namespace multipart
