#pragma once

#include <optional>
#include <string>

namespace textutil {

struct PathInfo {
    std::string title;
    std::optional<std::string> description;
};

bool starts_with(const std::string& s, const std::string& pre);
bool ends_with(const std::string& s, const std::string& suf);

// %XX -> byte, '+' -> ' '. A '%' not followed by two hex digits is kept as is.
std::string percent_decode(const std::string& input);

// Strict query component encoding: only A-Z a-z 0-9 - _ . ~ pass through.
std::string encode_component(const std::string& s);

// Looser encoding for free text (keeps ! * ' ( ) as well).
std::string encode_uri(const std::string& s);

std::string base64_encode(const std::string& input);
std::string basic_auth_header(const std::string& username, const std::string& password);

// Title and description of a series or chapter from its site path.
// description is the last segment; title is the nearest segment from the end
// that does not start with '!' (group annotations).
PathInfo derive_from_path(const std::string& path);

std::string normalize_chapter_href(const std::string& raw);

// First space separated token of the title that is a float, else -1.
float parse_chapter_number(const std::string& title);

// Collapses runs of whitespace to one space and trims both ends.
std::string normalize_whitespace(const std::string& s);

} // namespace textutil
