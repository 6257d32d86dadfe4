#include "promptwall/normalize/Normalizer.hpp"
#include "promptwall/normalize/Utf8.hpp"

#include <boost/locale/conversion.hpp>
#include <boost/locale/generator.hpp>

#include <set>

namespace promptwall {

namespace {

bool isHorizontalSpace(char32_t c) {
    return c == U' ' || c == U'\t';
}

bool isEdgeSpace(char32_t c) {
    return c == U' ' || c == U'\t' || c == U'\n' || c == U'\v' || c == U'\f';
}

std::u32string canonicalWhitespace(const std::u32string& s) {
    std::u32string out;
    out.reserve(s.size());

    bool pendingSpace = false;
    for (std::size_t i = 0; i < s.size(); ++i) {
        char32_t c = s[i];

        if (c == U'\r') {
            if (i + 1 < s.size() && s[i + 1] == U'\n') continue;
            c = U'\n';
        }

        if (isHorizontalSpace(c)) {
            pendingSpace = true;
            continue;
        }

        if (c == U'\n') {
            // space before a break is dropped
            pendingSpace = false;
            out.push_back(c);
            continue;
        }

        // space after a break or at the start is dropped
        if (pendingSpace && !out.empty() && out.back() != U'\n') {
            out.push_back(U' ');
        }
        pendingSpace = false;
        out.push_back(c);
    }

    std::size_t begin = 0;
    std::size_t end = out.size();
    while (begin < end && isEdgeSpace(out[begin])) ++begin;
    while (end > begin && isEdgeSpace(out[end - 1])) --end;
    return out.substr(begin, end - begin);
}

} // namespace

Normalizer::Normalizer() {
    boost::locale::generator gen;
    locale_ = gen("en_US.UTF-8");
}

NormalizedInput Normalizer::normalize(const std::string& raw) const {
    NormalizedInput out;
    out.original = raw;

    // Step 0-1: well-formed UTF-8, then NFC
    const std::string wellFormed = utf8::encode(utf8::decode(raw));
    const std::string composed = compose(wellFormed);

    // Step 2-4
    out.scalars = canonicalWhitespace(utf8::decode(composed));
    out.normalized = utf8::encode(out.scalars);
    out.length = out.scalars.size();

    // Step 5
    out.encoding = detectEncoding(out.scalars);

    // Step 6
    std::set<char32_t> distinct(out.scalars.begin(), out.scalars.end());
    out.characterSet.assign(distinct.begin(), distinct.end());

    return out;
}

std::string Normalizer::compose(const std::string& text) const {
    try {
        return boost::locale::normalize(text, boost::locale::norm_nfc, locale_);
    } catch (const std::exception&) {
        // Input is well-formed here; only a backend without normalization
        // support gets us this far. Keep the uncomposed text.
        return text;
    }
}

std::string Normalizer::detectEncoding(const std::u32string&) const {
    return DEFAULT_ENCODING;
}

} // namespace promptwall
