#pragma once

#include "http/api_error.hpp"

#include <expected>
#include <map>
#include <string>
#include <string_view>

struct FormField {
    std::string name;
    bool is_file = false;
    // Raw bytes for file parts, trimmed UTF-8 text otherwise.
    std::string value;
};

// Keyed by field name; a repeated name keeps the last occurrence.
using FormFields = std::map<std::string, FormField>;

// multipart/form-data decoding over a fully buffered body.
namespace multipart {

// Extracts the boundary parameter from a Content-Type value.
std::expected<std::string, ApiError> boundary_of(std::string_view content_type);

// Parts without a header/content separator or without a name are skipped.
std::expected<FormFields, ApiError> decode(std::string_view body, std::string_view content_type);

} // namespace multipart
