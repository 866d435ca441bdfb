/**
 * @file json.cpp
 * @brief JSON string escaping.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/json.h"

#include <iomanip>
#include <sstream>

namespace vcxbridge {

std::string json_escape(std::string_view str) {
    std::ostringstream result;

    for (char c : str) {
        switch (c) {
            case '"':  result << "\\\""; break;
            case '\\': result << "\\\\"; break;
            case '\n': result << "\\n"; break;
            case '\r': result << "\\r"; break;
            case '\t': result << "\\t"; break;
            case '\b': result << "\\b"; break;
            case '\f': result << "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result << "\\u"
                           << std::hex << std::setfill('0') << std::setw(4)
                           << static_cast<int>(static_cast<unsigned char>(c))
                           << std::dec;
                } else {
                    result << c;
                }
        }
    }

    return result.str();
}

std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '"';
        out += json_escape(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}

} // namespace vcxbridge
