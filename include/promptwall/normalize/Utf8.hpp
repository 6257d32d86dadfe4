#pragma once

#include <string>

namespace promptwall {
namespace utf8 {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

// Every byte of an ill-formed sequence becomes U+FFFD. Never throws.
std::u32string decode(const std::string& bytes);

std::string encode(const std::u32string& scalars);
std::string encode(char32_t scalar);

} // namespace utf8
} // namespace promptwall
