#include "promptwall/normalize/Utf8.hpp"

#include <boost/locale/utf.hpp>
#include <iterator>

namespace promptwall {
namespace utf8 {

namespace butf = boost::locale::utf;

std::u32string decode(const std::string& bytes) {
    std::u32string out;
    out.reserve(bytes.size());

    auto p = bytes.begin();
    const auto e = bytes.end();
    while (p != e) {
        const auto start = p;
        const butf::code_point c = butf::utf_traits<char>::decode(p, e);
        if (c == butf::illegal || c == butf::incomplete) {
            // resync on the next byte so a valid char after a broken lead survives
            out.push_back(REPLACEMENT_CHAR);
            p = start + 1;
            continue;
        }
        out.push_back(static_cast<char32_t>(c));
    }
    return out;
}

std::string encode(const std::u32string& scalars) {
    std::string out;
    out.reserve(scalars.size());
    auto it = std::back_inserter(out);
    for (char32_t c : scalars) {
        const butf::code_point cp = butf::is_valid_codepoint(c) ? c : REPLACEMENT_CHAR;
        it = butf::utf_traits<char>::encode(cp, it);
    }
    return out;
}

std::string encode(char32_t scalar) {
    return encode(std::u32string(1, scalar));
}

} // namespace utf8
} // namespace promptwall
