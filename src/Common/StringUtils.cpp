#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

#include "GDT.h"
#include "Common/StringUtils.h"

namespace StringUtils {

std::string to_lower(const std::string& str) {
    std::string lower_str = str;
    std::transform(lower_str.begin(), lower_str.end(), lower_str.begin(), [](unsigned char c) { 
        return static_cast<char>(std::tolower(c)); 
    });
    return lower_str;
}

bool case_insensitive_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() && to_lower(a) == to_lower(b);
}

bool case_insensitive_search(const std::string& original, const std::string& to_find) {
    std::string lower_original = to_lower(original);
    std::string lower_to_find = to_lower(to_find);

    return lower_original.find(lower_to_find) != std::string::npos;
}

std::vector<char16_t> utf8_to_utf16(const std::string& utf8_str) {
    std::vector<char16_t> utf16_vec;
    utf16_vec.reserve(utf8_str.size());

    for (size_t i = 0; i < utf8_str.size();) {
        uint32_t codepoint = 0;
        size_t num_bytes = 0;

        unsigned char ch = static_cast<unsigned char>(utf8_str[i]);
        if (ch <= 0x7F) {
            codepoint = ch;
            num_bytes = 1;
        } else if ((ch & 0xE0) == 0xC0) {
            codepoint = ch & 0x1F;
            num_bytes = 2;
        } else if ((ch & 0xF0) == 0xE0) {
            codepoint = ch & 0x0F;
            num_bytes = 3;
        } else if ((ch & 0xF8) == 0xF0) {
            codepoint = ch & 0x07;
            num_bytes = 4;
        } else {
            throw GDTException(ErrCode::STR_ENCODING, HERE(), "Invalid UTF-8 encoding");
        }

        if (i + num_bytes > utf8_str.size()) {
            throw GDTException(ErrCode::STR_ENCODING, HERE(), "Incomplete UTF-8 sequence");
        }

        for (size_t j = 1; j < num_bytes; ++j) {
            ch = static_cast<unsigned char>(utf8_str[i + j]);
            if ((ch & 0xC0) != 0x80) {
                throw GDTException(ErrCode::STR_ENCODING, HERE(), "Invalid UTF-8 encoding");
            }
            codepoint = (codepoint << 6) | (ch & 0x3F);
        }

        if (codepoint <= 0xFFFF) {
            utf16_vec.push_back(static_cast<char16_t>(codepoint));
        } else {
            codepoint -= 0x10000;
            utf16_vec.push_back(static_cast<char16_t>((codepoint >> 10) + 0xD800));
            utf16_vec.push_back(static_cast<char16_t>((codepoint & 0x3FF) + 0xDC00));
        }

        i += num_bytes;
    }

    return utf16_vec;
}

std::string uint32_to_hex_string(uint32_t value) {
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setw(8) << std::setfill('0') << value;
    return ss.str();
}

std::string bytes_to_hex_string(const uint8_t* data, size_t size) {
    std::ostringstream hex_stream;
    for (size_t i = 0; i < size; ++i) {
        hex_stream << std::hex << std::uppercase << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return hex_stream.str();
}

}; // namespace StringUtils
