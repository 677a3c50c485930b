#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <vector>

namespace textutil {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
    return -1;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

std::string percent_encode_if(const std::string& s, bool (*keep)(unsigned char)) {
    static const char* digits = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (keep(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

std::vector<std::string> split_nonempty(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= s.size()) {
        size_t next = s.find(sep, pos);
        if (next == std::string::npos) next = s.size();
        if (next > pos) parts.push_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

std::optional<float> parse_float_token(const std::string& token) {
    const char* first = token.data();
    const char* last = token.data() + token.size();
    if (first != last && *first == '+') ++first;
    if (first == last || *first == '+') return std::nullopt;

    // decimal only, no locale; accepts inf and nan spellings
    double value = 0;
    auto res = std::from_chars(first, last, value, std::chars_format::general);
    if (res.ptr != last) return std::nullopt;
    if (res.ec == std::errc::result_out_of_range) {
        // beyond double range: overflow saturates, underflow goes to zero
        const bool negative = *first == '-';
        const size_t exp = token.find_first_of("eE");
        const bool tiny = exp != std::string::npos && exp + 1 < token.size() && token[exp + 1] == '-';
        if (tiny) return negative ? -0.0f : 0.0f;
        return negative ? -std::numeric_limits<float>::infinity()
                        : std::numeric_limits<float>::infinity();
    }
    if (res.ec != std::errc()) return std::nullopt;
    if (std::isfinite(value) && std::fabs(value) > std::numeric_limits<float>::max()) {
        return value < 0 ? -std::numeric_limits<float>::infinity()
                         : std::numeric_limits<float>::infinity();
    }
    return static_cast<float>(value);
}

} // namespace

bool starts_with(const std::string& s, const std::string& pre) {
    return s.rfind(pre, 0) == 0;
}

bool ends_with(const std::string& s, const std::string& suf) {
    if (s.size() < suf.size()) return false;
    return std::equal(s.end() - suf.size(), s.end(), suf.begin());
}

std::string percent_decode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        char c = input[i];
        if (c == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 3;
                continue;
            }
            out.push_back('%');
            ++i;
        } else if (c == '+') {
            out.push_back(' ');
            ++i;
        } else {
            out.push_back(c);
            ++i;
        }
    }
    return out;
}

std::string encode_component(const std::string& s) {
    return percent_encode_if(s, [](unsigned char c) { return is_unreserved(c); });
}

std::string encode_uri(const std::string& s) {
    return percent_encode_if(s, [](unsigned char c) {
        return is_unreserved(c) || c == '!' || c == '*' || c == '\'' || c == '(' || c == ')';
    });
}

std::string base64_encode(const std::string& input) {
    static const char* b64chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string encoded;
    encoded.reserve(((input.size() + 2) / 3) * 4);
    unsigned int val = 0;
    int valb = -6;
    for (unsigned char c : input) {
        val = ((val << 8) + c) & 0xFFFFFFu;
        valb += 8;
        while (valb >= 0) {
            encoded.push_back(b64chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) encoded.push_back(b64chars[((val << 8) >> (valb + 8)) & 0x3F]);
    while (encoded.size() % 4) encoded.push_back('=');
    return encoded;
}

std::string basic_auth_header(const std::string& username, const std::string& password) {
    return "Basic " + base64_encode(username + ":" + password);
}

PathInfo derive_from_path(const std::string& path) {
    PathInfo info;
    auto segs = split_nonempty(path, '/');
    if (segs.empty()) return info;

    info.description = percent_decode(segs.back());
    for (auto it = segs.rbegin(); it != segs.rend(); ++it) {
        std::string dec = percent_decode(*it);
        if (!starts_with(dec, "!")) {
            info.title = std::move(dec);
            break;
        }
    }
    return info;
}

std::string normalize_chapter_href(const std::string& raw) {
    if (starts_with(raw, "/")) return raw;
    return "/" + raw;
}

float parse_chapter_number(const std::string& title) {
    size_t pos = 0;
    while (pos <= title.size()) {
        size_t next = title.find(' ', pos);
        if (next == std::string::npos) next = title.size();
        if (auto v = parse_float_token(title.substr(pos, next - pos))) return *v;
        pos = next + 1;
    }
    return -1.0f;
}

std::string normalize_whitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(static_cast<char>(c));
    }
    return out;
}

} // namespace textutil
