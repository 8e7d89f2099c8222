#include <op_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace op_mcp {

std::string UrlEncode(const std::string& value) {
    std::ostringstream out;
    out << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string BuildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        query += query.empty() ? '?' : '&';
        query += key;
        query += '=';
        query += UrlEncode(value);
    }
    return query;
}

} // namespace op_mcp
