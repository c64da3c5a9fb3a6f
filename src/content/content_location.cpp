// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file content_location.cpp
 * @brief file:// URI encoding and decoding
 */

#include <kcenon/ims_session/content/content_location.h>

#include <cctype>
#include <cstdio>

namespace kcenon::ims_session {

namespace {

constexpr std::string_view file_scheme = "file://";

auto is_unreserved(unsigned char c) -> bool {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/';
}

auto percent_encode(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size());
    for (unsigned char c : input) {
        if (is_unreserved(c)) {
            output += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            output += buf;
        }
    }
    return output;
}

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

auto percent_decode(std::string_view input) -> result<std::string> {
    std::string output;
    output.reserve(input.size());
    for (std::size_t i = 0; i < input.size(); ++i) {
        if (input[i] != '%') {
            output += input[i];
            continue;
        }
        if (i + 2 >= input.size()) {
            return unexpected(error{error_code::invalid_argument, "truncated escape in URI"});
        }
        int hi = hex_value(input[i + 1]);
        int lo = hex_value(input[i + 2]);
        if (hi < 0 || lo < 0) {
            return unexpected(error{error_code::invalid_argument, "invalid escape in URI"});
        }
        output += static_cast<char>((hi << 4) | lo);
        i += 2;
    }
    return output;
}

}  // namespace

auto content_location::from_path(const std::filesystem::path& path) -> content_location {
    auto absolute = path.is_absolute() ? path : std::filesystem::absolute(path);
    auto normalized = absolute.lexically_normal();
    return content_location(std::string(file_scheme) + percent_encode(normalized.generic_string()),
                            normalized);
}

auto content_location::from_uri(const std::string& uri) -> result<content_location> {
    if (uri.rfind(file_scheme, 0) != 0) {
        return unexpected(error{error_code::invalid_argument, "not a file URI: " + uri});
    }

    auto decoded = percent_decode(std::string_view(uri).substr(file_scheme.size()));
    if (!decoded) {
        return unexpected(decoded.error());
    }
    if (decoded.value().empty() || decoded.value().front() != '/') {
        return unexpected(error{error_code::invalid_argument, "file URI without absolute path"});
    }

    return content_location(uri, std::filesystem::path(decoded.value()));
}

}  // namespace kcenon::ims_session
