#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Clawweb {
namespace Utils {
namespace Text {

namespace {

constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

bool is_continuation(unsigned char c, unsigned char low = 0x80, unsigned char high = 0xBF) {
    return c >= low && c <= high;
}

}  // namespace

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string escape_html(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#x27;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string sanitize_utf8(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    const size_t n = bytes.size();
    size_t       i = 0;
    while (i < n) {
        auto lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            out += static_cast<char>(lead);
            ++i;
            continue;
        }

        size_t        length = 0;
        unsigned char low    = 0x80;
        unsigned char high   = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        }
        else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0)
                low = 0xA0;
            else if (lead == 0xED)
                high = 0x9F;
        }
        else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0)
                low = 0x90;
            else if (lead == 0xF4)
                high = 0x8F;
        }
        else {
            out += REPLACEMENT_CHARACTER;
            ++i;
            continue;
        }

        // Only the byte right after the lead has a narrowed range.
        size_t consumed = 1;
        while (consumed < length && i + consumed < n) {
            auto c  = static_cast<unsigned char>(bytes[i + consumed]);
            bool ok = consumed == 1 ? is_continuation(c, low, high) : is_continuation(c);
            if (!ok)
                break;
            ++consumed;
        }

        if (consumed == length) {
            out.append(bytes, i, length);
        }
        else {
            out += REPLACEMENT_CHARACTER;
        }
        i += consumed;
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Clawweb
