#pragma once

#include <cstddef>
#include <string>

namespace mdexpand {

// Cheap estimate: one token per four characters, rounded up
size_t estimate_tokens(const std::string& text);

/**
 * Refined estimate for budget decisions near the limit. Still a heuristic:
 * no vocabulary is loaded, so real tokenizer counts can differ.
 *
 * Splits text the way BPE pre-tokenizers do (contractions, letter runs with
 * an optional leading space, 1-3 digit groups, punctuation runs, whitespace)
 * and charges long runs extra for the merges a vocabulary would not cover.
 */
size_t count_tokens(const std::string& text);

} // namespace mdexpand
