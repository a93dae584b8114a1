#include "taildrive/network/url.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace taildrive {
namespace network {

namespace {

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string url_encode(const std::string& value) {
    std::ostringstream out;
    out << std::uppercase << std::hex;
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            out << ch;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string url_encode_path(const std::string& path) {
    std::string result;
    std::size_t start = 0;
    while (start <= path.size()) {
        const auto slash = path.find('/', start);
        const auto end = slash == std::string::npos ? path.size() : slash;
        result += url_encode(path.substr(start, end - start));
        if (slash == std::string::npos) {
            break;
        }
        result += '/';
        start = slash + 1;
    }
    return result;
}

std::string url_decode(const std::string& value, bool plus_as_space) {
    std::string result;
    result.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '%' && i + 2 < value.size()) {
            const int hi = hex_value(value[i + 1]);
            const int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                result += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        if (c == '+' && plus_as_space) {
            result += ' ';
            continue;
        }
        result += c;
    }
    return result;
}

QueryParams parse_query(const std::string& query) {
    QueryParams params;
    std::size_t start = 0;
    while (start < query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string::npos) {
                params[url_decode(pair, true)] = "";
            } else {
                params[url_decode(pair.substr(0, eq), true)] = url_decode(pair.substr(eq + 1), true);
            }
        }
        start = end + 1;
    }
    return params;
}

std::string build_query(const std::initializer_list<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        query += query.empty() ? '?' : '&';
        query += url_encode(key);
        query += '=';
        query += url_encode(value);
    }
    return query;
}

std::string content_disposition_attachment(const std::string& filename) {
    std::string value = "attachment; filename=\"";
    for (const char c : filename) {
        const auto byte = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            value += '\\';
            value += c;
        } else if (byte < 0x20 || byte == 0x7f) {
            value += '_';
        } else {
            value += c;
        }
    }
    value += '"';
    return value;
}

std::string content_disposition_filename(const std::string& header_value) {
    static const std::string marker = "filename=\"";
    const auto pos = header_value.find(marker);
    if (pos == std::string::npos) {
        return "";
    }

    std::string name;
    for (auto i = pos + marker.size(); i < header_value.size(); ++i) {
        const char c = header_value[i];
        if (c == '"') {
            return name;
        }
        if (c == '\\' && i + 1 < header_value.size()) {
            ++i;
        }
        name += header_value[i];
    }
    return "";
}

} // namespace network
} // namespace taildrive
