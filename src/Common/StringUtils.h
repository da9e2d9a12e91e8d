#ifndef _STRING_UTILS_H_
#define _STRING_UTILS_H_

#include <cstdint>
#include <string>
#include <vector>

namespace StringUtils {
    std::string to_lower(const std::string& str);
    bool case_insensitive_equals(const std::string& a, const std::string& b);
    bool case_insensitive_search(const std::string& original, const std::string& to_find);
    std::vector<char16_t> utf8_to_utf16(const std::string& utf8_str);
    std::string uint32_to_hex_string(uint32_t value);
    std::string bytes_to_hex_string(const uint8_t* data, size_t size);
};

#endif // _STRING_UTILS_H_
