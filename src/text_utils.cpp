#include "gosnomer/text_utils.h"

namespace gosnomer {
namespace text {

size_t utf8SequenceLength(unsigned char first_byte) {
    if ((first_byte & 0x80) == 0) {
        return 1;
    }
    if ((first_byte & 0xE0) == 0xC0) {
        return 2;
    }
    if ((first_byte & 0xF0) == 0xE0) {
        return 3;
    }
    if ((first_byte & 0xF8) == 0xF0) {
        return 4;
    }
    return 0;
}

std::u32string decodeUtf8(const std::string& text) {
    std::u32string result;
    result.reserve(text.length());

    size_t i = 0;
    while (i < text.length()) {
        const unsigned char first = static_cast<unsigned char>(text[i]);
        const size_t length = utf8SequenceLength(first);

        if (length == 0 || i + length > text.length()) {
            result += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        if (length == 1) {
            result += static_cast<char32_t>(first);
            ++i;
            continue;
        }

        // Bits útiles del primer byte: 5, 4 o 3 según la longitud
        char32_t code_point = first & (0xFF >> (length + 1));
        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            const unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Rechazar formas sobrelargas, surrogates y valores fuera de rango
        static const char32_t MIN_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
        if (valid && (code_point < MIN_FOR_LENGTH[length] ||
                      code_point > 0x10FFFF ||
                      (code_point >= 0xD800 && code_point <= 0xDFFF))) {
            valid = false;
        }

        if (!valid) {
            result += REPLACEMENT_CHAR;
            ++i;
            continue;
        }

        result += code_point;
        i += length;
    }

    return result;
}

std::string encodeUtf8(char32_t code_point) {
    std::string result;

    if (code_point < 0x80) {
        result += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        result += static_cast<char>(0xC0 | (code_point >> 6));
        result += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        result += static_cast<char>(0xE0 | (code_point >> 12));
        result += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        result += static_cast<char>(0xF0 | (code_point >> 18));
        result += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        result += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        result += static_cast<char>(0x80 | (code_point & 0x3F));
    }

    return result;
}

std::string encodeUtf8(const std::u32string& text) {
    std::string result;
    result.reserve(text.length() * 2);

    for (char32_t c : text) {
        result += encodeUtf8(c);
    }

    return result;
}

bool isWhitespace(char32_t c) {
    switch (c) {
        case U' ':
        case U'\t':
        case U'\n':
        case U'\v':
        case U'\f':
        case U'\r':
        case 0x85:
        case 0xA0:
        case 0x1680:
        case 0x2028:
        case 0x2029:
        case 0x202F:
        case 0x205F:
        case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

std::u32string trim(const std::u32string& text) {
    size_t begin = 0;
    size_t end = text.length();

    while (begin < end && isWhitespace(text[begin])) {
        ++begin;
    }
    while (end > begin && isWhitespace(text[end - 1])) {
        --end;
    }

    return text.substr(begin, end - begin);
}

char32_t toUpper(char32_t c) {
    // Latín básico
    if (c >= U'a' && c <= U'z') {
        return c - (U'a' - U'A');
    }
    // Cirílico а-я
    if (c >= 0x0430 && c <= 0x044F) {
        return c - 0x20;
    }
    // Cirílico ѐ-џ (incluye ё)
    if (c >= 0x0450 && c <= 0x045F) {
        return c - 0x50;
    }
    return c;
}

} // namespace text
} // namespace gosnomer
