#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace replyd::store {

// Trims, drops everything from a '>' to the end of its line (quoted reply
// text) and collapses whitespace runs into single spaces.
std::string sanitize_text(const std::string& text);

// Cuts to at most max_bytes without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& text, std::size_t max_bytes);

std::string to_lower(const std::string& text);

// Lowercased runs of letters, digits and underscores.
std::vector<std::string> word_tokens(const std::string& text);

// Whitespace separated words, case preserved.
std::vector<std::string> split_words(const std::string& text);

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles);

struct EmailTraits {
  std::string email_type{"general"};
  std::string formality{"medium"};
  std::string urgency{"normal"};
  std::size_t word_count{0};
};

EmailTraits classify_email(const std::string& sanitized);

}  // namespace replyd::store
