#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace promptwall {

// Canonical form of one prompt. Built once per evaluate() call, then read-only.
struct NormalizedInput {
    std::string original;                 // raw bytes as received
    std::string normalized;               // UTF-8, NFC, whitespace-canonical
    std::string encoding;                 // "utf-8" for now
    std::size_t length = 0;               // scalar values in normalized
    std::vector<char32_t> characterSet;   // sorted, distinct

    // Decoded normalized text so rules do not re-walk the UTF-8
    std::u32string scalars;
};

} // namespace promptwall
