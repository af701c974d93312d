#include "store/text.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace replyd::store {
namespace {

struct TypeRule {
  const char* type;
  std::vector<std::string> keywords;
};

const std::vector<TypeRule>& type_rules() {
  static const std::vector<TypeRule> kRules = {
      {"scheduling", {"meeting", "schedule", "calendar", "appointment"}},
      {"gratitude", {"thank", "appreciate", "grateful"}},
      {"urgent", {"urgent", "asap", "immediate", "priority"}},
      {"inquiry", {"question", "help", "clarify", "explain"}},
      {"update_request", {"update", "status", "progress", "report"}},
  };
  return kRules;
}

std::size_t count_present(const std::string& haystack, const std::vector<std::string>& needles) {
  return static_cast<std::size_t>(std::count_if(needles.begin(), needles.end(), [&haystack](const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
  }));
}

bool is_word_char(const unsigned char c) { return std::isalnum(c) != 0 || c == '_'; }

}  // namespace

std::string sanitize_text(const std::string& text) {
  std::string out;
  out.reserve(text.size());

  bool quoted = false;
  bool pending_space = false;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (c == '\n' || c == '\r') {
      quoted = false;
      pending_space = true;
      continue;
    }
    if (quoted) {
      continue;
    }
    if (c == '>') {
      quoted = true;
      continue;
    }
    if (std::isspace(c) != 0) {
      pending_space = true;
      continue;
    }
    if (pending_space && !out.empty()) {
      out.push_back(' ');
    }
    pending_space = false;
    out.push_back(raw);
  }
  return out;
}

std::string truncate_utf8(const std::string& text, const std::size_t max_bytes) {
  if (text.size() <= max_bytes) {
    return text;
  }
  std::size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
    --cut;
  }
  return text.substr(0, cut);
}

std::string to_lower(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::vector<std::string> word_tokens(const std::string& text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (is_word_char(c)) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<std::string> split_words(const std::string& text) {
  std::vector<std::string> words;
  std::string current;
  for (const char raw : text) {
    if (std::isspace(static_cast<unsigned char>(raw)) != 0) {
      if (!current.empty()) {
        words.push_back(std::move(current));
        current.clear();
      }
    } else {
      current.push_back(raw);
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

bool contains_any(const std::string& haystack, const std::vector<std::string>& needles) {
  return count_present(haystack, needles) > 0;
}

EmailTraits classify_email(const std::string& sanitized) {
  static const std::vector<std::string> kFormal = {"dear", "sincerely", "regards", "please", "kindly", "would you"};
  static const std::vector<std::string> kCasual = {"hey", "hi", "thanks", "sure", "ok", "cool"};

  EmailTraits traits{};
  const std::string lower = to_lower(sanitized);

  for (const auto& rule : type_rules()) {
    if (contains_any(lower, rule.keywords)) {
      traits.email_type = rule.type;
      break;
    }
  }
  if (traits.email_type == "urgent") {
    traits.urgency = "high";
  }

  const std::size_t formal = count_present(lower, kFormal);
  const std::size_t casual = count_present(lower, kCasual);
  if (formal > casual) {
    traits.formality = "high";
  } else if (casual > formal) {
    traits.formality = "low";
  }

  traits.word_count = split_words(sanitized).size();
  return traits;
}

}  // namespace replyd::store
