#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace verdict::utils {

// Visitor built from lambdas for std::visit.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

// Unicode White_Space code points.
inline bool IsWhitespaceCodePoint(char32_t c) {
    return (c >= 0x09 && c <= 0x0D) || c == 0x20 || c == 0x85 || c == 0xA0 || c == 0x1680 ||
           (c >= 0x2000 && c <= 0x200A) || c == 0x2028 || c == 0x2029 || c == 0x202F ||
           c == 0x205F || c == 0x3000;
}

// Decodes the UTF-8 sequence starting at `pos`; 0 bytes when it is malformed or truncated.
inline std::size_t DecodeUtf8(const std::string& value, std::size_t pos, char32_t& code_point) {
    const auto lead = static_cast<unsigned char>(value[pos]);
    std::size_t length = 0;
    if (lead < 0x80) {
        code_point = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
    } else {
        return 0;
    }
    if (pos + length > value.size()) {
        return 0;
    }
    for (std::size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(value[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            return 0;
        }
        code_point = (code_point << 6) | (byte & 0x3F);
    }
    return length;
}

inline std::string TrimRight(const std::string& value) {
    auto end = value.size();
    while (end > 0) {
        auto begin = end - 1;
        while (begin > 0 && end - begin < 4 && (static_cast<unsigned char>(value[begin]) & 0xC0) == 0x80) {
            --begin;
        }
        char32_t code_point = 0;
        if (DecodeUtf8(value, begin, code_point) != end - begin || !IsWhitespaceCodePoint(code_point)) {
            break;
        }
        end = begin;
    }
    return value.substr(0, end);
}

inline std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    while (begin < value.size()) {
        char32_t code_point = 0;
        const auto length = DecodeUtf8(value, begin, code_point);
        if (length == 0 || !IsWhitespaceCodePoint(code_point)) {
            break;
        }
        begin += length;
    }
    return TrimRight(value.substr(begin));
}

inline bool IsBlank(const std::string& value) {
    return TrimRight(value).empty();
}

inline std::vector<std::string> SplitWhitespace(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (stream >> item) {
        items.push_back(item);
    }
    return items;
}

}  // namespace verdict::utils
