#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fitscore::core {

// Deterministic ASCII-only normalization utilities.
// These functions are locale-independent and produce byte-stable output
// across all platforms and compilers.
//
// - ASCII lowercasing: A-Z -> a-z via explicit char math (no std::tolower)
// - Whitespace runs (space, tab, CR, LF) collapse to a single space
// - Term boundaries treat '+' and '#' as part of a term ("c++", "c#")
// - No locale dependence, no undefined behavior

// normalize_ascii_lower converts ASCII uppercase (A-Z) to lowercase (a-z).
// Non-ASCII characters are preserved unchanged.
inline std::string normalize_ascii_lower(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (const char ch : input) {
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

inline bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// normalize_term produces the canonical identity of a skill token or a searchable
// text body: ASCII-lowercased, trimmed, internal whitespace runs collapsed to one space.
inline std::string normalize_term(const std::string_view input) {
  std::string result;
  result.reserve(input.size());

  bool pending_space = false;
  for (const char ch : input) {
    if (is_ascii_space(ch)) {
      pending_space = !result.empty();
      continue;
    }
    if (pending_space) {
      result.push_back(' ');
      pending_space = false;
    }
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      result.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      result.push_back(ch);
    }
  }

  return result;
}

// tokenize_ascii splits input on non-alphanumeric delimiters into tokens.
// - Converts to lowercase
// - Splits on any non-alphanumeric character
// - Drops tokens shorter than min_length
// - Returns tokens in encounter order (caller sorts if needed)
inline std::vector<std::string> tokenize_ascii(const std::string_view input,
                                               const std::size_t min_length = 2) {
  std::vector<std::string> tokens;
  std::string current_token;
  current_token.reserve(32);

  const auto flush = [&]() {
    if (current_token.size() >= min_length) {
      tokens.push_back(current_token);
    }
    current_token.clear();
  };

  for (const char ch : input) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9')) {
      current_token.push_back(ch);
    } else if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      current_token.push_back(static_cast<char>(ch + kCaseOffset));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

// is_term_char reports whether ch may continue a technology term.
inline bool is_term_char(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
         ch == '+' || ch == '#';
}

// find_term returns the first position >= from where `term` occurs in `haystack` on term
// boundaries, or std::string_view::npos. Both arguments must already be normalize_term()'d.
// "java" is not found in "javascript"; "node" is found in "node.js".
inline std::size_t find_term(const std::string_view haystack, const std::string_view term,
                             std::size_t from = 0) {
  if (term.empty()) {
    return std::string_view::npos;
  }

  std::size_t pos = haystack.find(term, from);
  while (pos != std::string_view::npos) {
    const bool left_ok = pos == 0 || !is_term_char(haystack[pos - 1]);
    const std::size_t end = pos + term.size();
    const bool right_ok = end >= haystack.size() || !is_term_char(haystack[end]);
    if (left_ok && right_ok) {
      return pos;
    }
    pos = haystack.find(term, pos + 1);
  }
  return std::string_view::npos;
}

inline bool contains_term(const std::string_view haystack, const std::string_view term) {
  return find_term(haystack, term) != std::string_view::npos;
}

// split_sentences breaks free text into trimmed sentences. A sentence ends at a newline, or
// at '.', '!' or '?' followed by whitespace or end of input, so "node.js" stays whole.
// Empty fragments are dropped; order is preserved.
inline std::vector<std::string> split_sentences(const std::string_view text) {
  std::vector<std::string> sentences;
  std::size_t start = 0;

  const auto emit = [&](std::size_t end) {
    std::string sentence = trim(text.substr(start, end - start));
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '\n') {
      emit(i);
      start = i + 1;
    } else if (ch == '.' || ch == '!' || ch == '?') {
      const bool at_end = i + 1 >= text.size();
      if (at_end || is_ascii_space(text[i + 1])) {
        emit(i + 1);
        start = i + 1;
      }
    }
  }
  if (start < text.size()) {
    emit(text.size());
  }

  return sentences;
}

}  // namespace fitscore::core
