#include "mdexpand/scanner.hpp"

namespace mdexpand {

namespace {

size_t run_length(const std::string& text, size_t pos, char c) {
    size_t len = 0;
    while (pos + len < text.size() && text[pos + len] == c) {
        ++len;
    }
    return len;
}

size_t skip_to_line_end(const std::string& text, size_t pos) {
    while (pos < text.size() && text[pos] != '\n') {
        ++pos;
    }
    return pos;
}

} // namespace

std::vector<SafeRange> find_safe_ranges(const std::string& text) {
    std::vector<SafeRange> ranges;
    ScanContext context = ScanContext::Normal;
    size_t range_start = 0;
    size_t i = 0;
    char fence_char = 0;
    size_t fence_len = 0;

    while (i < text.size()) {
        char c = text[i];

        if (context == ScanContext::Normal) {
            if (c == '`' || c == '~') {
                size_t len = run_length(text, i, c);
                if (len >= 3) {
                    if (i > range_start) {
                        ranges.push_back({range_start, i});
                    }
                    context = ScanContext::FencedCode;
                    fence_char = c;
                    fence_len = len;
                    // Info string belongs to the fence
                    i = skip_to_line_end(text, i + len);
                    continue;
                }
            }

            if (c == '`' && (i + 1 >= text.size() || text[i + 1] != '`')) {
                if (i > range_start) {
                    ranges.push_back({range_start, i});
                }
                context = ScanContext::InlineCode;
                ++i;
                continue;
            }

            ++i;
        } else if (context == ScanContext::FencedCode) {
            bool at_line_start = (i == 0 || text[i - 1] == '\n');
            if (at_line_start && c == fence_char) {
                size_t len = run_length(text, i, fence_char);
                if (len >= fence_len) {
                    i = skip_to_line_end(text, i + len);
                    if (i < text.size()) {
                        ++i;
                    }
                    context = ScanContext::Normal;
                    range_start = i;
                    continue;
                }
            }
            ++i;
        } else {
            if (c == '`') {
                ++i;
                context = ScanContext::Normal;
                range_start = i;
                continue;
            }
            if (c == '\n') {
                context = ScanContext::Normal;
                range_start = i;
            }
            ++i;
        }
    }

    if (context == ScanContext::Normal && range_start < text.size()) {
        ranges.push_back({range_start, text.size()});
    }

    return ranges;
}

std::set<size_t> find_unsafe_block_starts(const std::string& text,
                                          const std::vector<SafeRange>& safe_ranges) {
    std::set<size_t> starts;

    if (!safe_ranges.empty()) {
        if (safe_ranges.front().start > 0) {
            starts.insert(0);
        }
        for (const auto& range : safe_ranges) {
            if (range.end < text.size()) {
                starts.insert(range.end);
            }
        }
    } else if (!text.empty()) {
        starts.insert(0);
    }

    return starts;
}

bool is_in_safe_range(size_t index, const std::vector<SafeRange>& safe_ranges) {
    for (const auto& range : safe_ranges) {
        if (index >= range.start && index < range.end) {
            return true;
        }
    }
    return false;
}

} // namespace mdexpand
