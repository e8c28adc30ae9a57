#include <timber_mcp/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace timber_mcp {

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlEncodePath(std::string_view path) {
    std::string out;
    size_t start = 0;
    while (true) {
        auto slash = path.find('/', start);
        out += UrlEncode(path.substr(start, slash - start));
        if (slash == std::string_view::npos) break;
        out += '/';
        start = slash + 1;
    }
    return out;
}

} // namespace timber_mcp
