#include "mdexpand/tokens.hpp"

#include <cctype>

namespace mdexpand {

namespace {

bool is_letter(unsigned char c) {
    // Non-ASCII bytes are treated as letters so UTF-8 words stay together
    return std::isalpha(c) || c >= 0x80;
}

bool is_digit(unsigned char c) {
    return std::isdigit(c) != 0;
}

bool is_space(unsigned char c) {
    return std::isspace(c) != 0;
}

size_t ceil_div(size_t a, size_t b) {
    return (a + b - 1) / b;
}

// Letter runs up to this length are usually a single vocabulary entry
constexpr size_t WORD_PIECE = 6;

} // namespace

size_t estimate_tokens(const std::string& text) {
    return ceil_div(text.size(), 4);
}

size_t count_tokens(const std::string& text) {
    size_t tokens = 0;
    size_t i = 0;
    const size_t n = text.size();

    auto at = [&text](size_t k) { return static_cast<unsigned char>(text[k]); };

    while (i < n) {
        unsigned char c = at(i);

        // 's 't 're 've 'm 'll 'd
        if (c == '\'' && i + 1 < n) {
            char next = static_cast<char>(std::tolower(at(i + 1)));
            if (next == 's' || next == 't' || next == 'm' || next == 'd') {
                ++tokens;
                i += 2;
                continue;
            }
            if (i + 2 < n) {
                char next2 = static_cast<char>(std::tolower(at(i + 2)));
                if ((next == 'r' && next2 == 'e') || (next == 'v' && next2 == 'e') ||
                    (next == 'l' && next2 == 'l')) {
                    ++tokens;
                    i += 3;
                    continue;
                }
            }
        }

        // Optional single leading space or symbol attached to a word
        size_t start = i;
        if (!is_letter(c) && !is_digit(c) && c != '\n' && i + 1 < n && is_letter(at(i + 1))) {
            ++i;
        }

        if (i < n && is_letter(at(i))) {
            while (i < n && is_letter(at(i))) ++i;
            tokens += ceil_div(i - start, WORD_PIECE);
            continue;
        }
        i = start;

        if (is_digit(c)) {
            size_t run = 0;
            while (i < n && is_digit(at(i))) {
                ++i;
                ++run;
            }
            tokens += ceil_div(run, 3);
            continue;
        }

        if (is_space(c)) {
            while (i < n && is_space(at(i))) ++i;
            ++tokens;
            continue;
        }

        // Punctuation run
        size_t run = 0;
        while (i < n && !is_letter(at(i)) && !is_digit(at(i)) && !is_space(at(i))) {
            ++i;
            ++run;
        }
        tokens += ceil_div(run, 2);
    }

    return tokens;
}

} // namespace mdexpand
