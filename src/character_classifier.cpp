#include "daily_input_counter/character_classifier.hpp"

#include <algorithm>
#include <array>

namespace dic::stats {

namespace {

constexpr char32_t kReplacement = 0xFFFD;

// Full-width and CJK punctuation counted as symbols, sorted for binary search.
constexpr std::array<char32_t, 26> kCjkSymbols = {
    0x00B7,  // ·
    0x2014,  // —
    0x2018,  // ‘
    0x2019,  // ’
    0x201C,  // “
    0x201D,  // ”
    0x2026,  // …
    0x3001,  // 、
    0x3002,  // 。
    0x3008,  // 〈
    0x3009,  // 〉
    0x300A,  // 《
    0x300B,  // 》
    0x300C,  // 「
    0x300D,  // 」
    0x300E,  // 『
    0x300F,  // 』
    0x3010,  // 【
    0x3011,  // 】
    0xFF01,  // ！
    0xFF08,  // （
    0xFF09,  // ）
    0xFF0C,  // ，
    0xFF1A,  // ：
    0xFF1B,  // ；
    0xFF1F,  // ？
};

constexpr char32_t kFullWidthYen = 0xFFE5;
constexpr char32_t kFullWidthTilde = 0xFF5E;

bool isChinese(char32_t cp) { return cp >= 0x4E00 && cp <= 0x9FFF; }

bool isEnglish(char32_t cp) {
    return (cp >= U'A' && cp <= U'Z') || (cp >= U'a' && cp <= U'z');
}

bool isNumber(char32_t cp) { return cp >= U'0' && cp <= U'9'; }

bool isSymbol(char32_t cp) {
    if ((cp >= 0x21 && cp <= 0x2F) || (cp >= 0x3A && cp <= 0x40) ||
        (cp >= 0x5B && cp <= 0x60) || (cp >= 0x7B && cp <= 0x7E)) {
        return true;
    }
    if (cp == kFullWidthYen || cp == kFullWidthTilde) {
        return true;
    }
    return std::binary_search(kCjkSymbols.begin(), kCjkSymbols.end(), cp);
}

}  // namespace

Category classify(char32_t code_point) noexcept {
    if (isChinese(code_point)) return Category::Chinese;
    if (isEnglish(code_point)) return Category::English;
    if (isNumber(code_point)) return Category::Number;
    if (isSymbol(code_point)) return Category::Symbol;
    return Category::Other;
}

std::vector<char32_t> decodeUtf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            out.push_back(lead);
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            out.push_back(kReplacement);
            ++i;
            continue;
        }

        bool valid = true;
        for (std::size_t k = 1; k <= extra; ++k) {
            if (i + k >= text.size()) {
                valid = false;
                extra = k - 1;
                break;
            }
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
                extra = k - 1;
                break;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Reject overlong forms, surrogates and out-of-range values.
        static constexpr char32_t kMinForLength[4] = {0, 0x80, 0x800, 0x10000};
        if (valid && (cp < kMinForLength[extra] || cp > 0x10FFFF ||
                      (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        out.push_back(valid ? cp : kReplacement);
        i += extra + 1;
    }
    return out;
}

CounterSet analyzeText(const std::string& text) {
    CounterSet counters;
    for (char32_t cp : decodeUtf8(text)) {
        counters.add(classify(cp));
    }
    return counters;
}

}  // namespace dic::stats
