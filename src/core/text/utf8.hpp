#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace inkbridge::core::text {

// True when `bytes` is well-formed UTF-8. With `allow_cut_tail`, an incomplete
// multi-byte sequence at the very end is accepted (the sample was cut mid-character).
bool is_valid_utf8(std::string_view bytes, bool allow_cut_tail = false);

// NUL byte or invalid UTF-8 in a leading sample of a file.
bool looks_binary(std::string_view sample, bool sample_may_be_cut);

// Reads up to kSniffBytes from the start of the file; false if it cannot be opened.
inline constexpr std::size_t kSniffBytes = 4096;
bool file_looks_binary(const std::string& path);

std::u32string decode_utf8(std::string_view bytes);
std::string encode_utf8(std::u32string_view code_points);

std::size_t count_code_points(std::string_view bytes);

// First `max_code_points` characters of `bytes`; input is assumed valid UTF-8.
std::string take_code_points(std::string_view bytes, std::size_t max_code_points);

bool is_unicode_whitespace(char32_t c);

// Number of non-whitespace characters, the word count used for chapters.
std::size_t count_non_whitespace(std::string_view bytes);

}  // namespace inkbridge::core::text
