#include "core/text/utf8.hpp"

#include <fstream>

namespace inkbridge::core::text {

namespace {

// Length of the sequence introduced by `lead`, 0 for an invalid lead byte.
std::size_t sequence_length(const unsigned char lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

bool is_continuation(const unsigned char c) { return (c & 0xC0) == 0x80; }

// Second-byte ranges that rule out overlongs, surrogates and > U+10FFFF.
bool valid_second_byte(const unsigned char lead, const unsigned char second) {
    switch (lead) {
        case 0xE0: return second >= 0xA0 && second <= 0xBF;
        case 0xED: return second >= 0x80 && second <= 0x9F;
        case 0xF0: return second >= 0x90 && second <= 0xBF;
        case 0xF4: return second >= 0x80 && second <= 0x8F;
        default: return is_continuation(second);
    }
}

}  // namespace

bool is_valid_utf8(std::string_view bytes, const bool allow_cut_tail) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const std::size_t len = sequence_length(lead);
        if (len == 0) {
            return false;
        }
        if (len == 1) {
            ++i;
            continue;
        }
        for (std::size_t k = 1; k < len; ++k) {
            if (i + k >= bytes.size()) {
                return allow_cut_tail;
            }
            const auto c = static_cast<unsigned char>(bytes[i + k]);
            const bool ok = (k == 1) ? valid_second_byte(lead, c) : is_continuation(c);
            if (!ok) {
                return false;
            }
        }
        i += len;
    }
    return true;
}

bool looks_binary(std::string_view sample, const bool sample_may_be_cut) {
    if (sample.find('\0') != std::string_view::npos) {
        return true;
    }
    return !is_valid_utf8(sample, sample_may_be_cut);
}

bool file_looks_binary(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    char buffer[kSniffBytes];
    in.read(buffer, static_cast<std::streamsize>(kSniffBytes));
    const auto read_bytes = static_cast<std::size_t>(in.gcount());
    return looks_binary(std::string_view(buffer, read_bytes), read_bytes == kSniffBytes);
}

std::u32string decode_utf8(std::string_view bytes) {
    std::u32string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        const std::size_t len = sequence_length(lead);
        if (len == 0 || i + len > bytes.size()) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        if (len == 1) {
            out.push_back(static_cast<char32_t>(lead));
            ++i;
            continue;
        }
        char32_t cp = lead & (0xFF >> (len + 1));
        bool ok = true;
        for (std::size_t k = 1; k < len; ++k) {
            const auto c = static_cast<unsigned char>(bytes[i + k]);
            if (!(k == 1 ? valid_second_byte(lead, c) : is_continuation(c))) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (c & 0x3F);
        }
        if (!ok) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
        i += len;
    }
    return out;
}

std::string encode_utf8(std::u32string_view code_points) {
    std::string out;
    out.reserve(code_points.size());
    for (const char32_t cp : code_points) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

std::size_t count_code_points(std::string_view bytes) {
    std::size_t count = 0;
    for (const char c : bytes) {
        if (!is_continuation(static_cast<unsigned char>(c))) {
            ++count;
        }
    }
    return count;
}

std::string take_code_points(std::string_view bytes, const std::size_t max_code_points) {
    std::size_t seen = 0;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (is_continuation(static_cast<unsigned char>(bytes[i]))) {
            continue;
        }
        if (seen == max_code_points) {
            return std::string(bytes.substr(0, i));
        }
        ++seen;
    }
    return std::string(bytes);
}

bool is_unicode_whitespace(const char32_t c) {
    switch (c) {
        case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
        case U'\u0085': case U'\u00A0': case U'\u1680':
        case U'\u2028': case U'\u2029': case U'\u202F': case U'\u205F': case U'\u3000':
            return true;
        default:
            return c >= U'\u2000' && c <= U'\u200A';
    }
}

std::size_t count_non_whitespace(std::string_view bytes) {
    std::size_t count = 0;
    for (const char32_t c : decode_utf8(bytes)) {
        if (!is_unicode_whitespace(c)) {
            ++count;
        }
    }
    return count;
}

}  // namespace inkbridge::core::text
