#include "as_of_system_time.hpp"

#include <array>
#include <cctype>
#include <optional>
#include <stdexcept>

namespace txcoord::retry {

namespace {

bool IsIdentChar(char c) {
  const auto u = static_cast<unsigned char>(c);
  return std::isalnum(u) || c == '_' || c == '$';
}

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view TrimRight(std::string_view text) {
  while (!text.empty() && IsSpace(text.back())) text.remove_suffix(1);
  return text;
}

std::string_view Trim(std::string_view text) {
  while (!text.empty() && IsSpace(text.front())) text.remove_prefix(1);
  return TrimRight(text);
}

bool EqualsUpper(std::string_view word, std::string_view upper) {
  if (word.size() != upper.size()) return false;
  for (std::size_t i = 0; i < word.size(); ++i) {
    if (std::toupper(static_cast<unsigned char>(word[i])) != upper[i]) return false;
  }
  return true;
}

// Top-level words of a statement, with their offsets.
class WordScanner {
 public:
  explicit WordScanner(std::string_view sql) : sql_(sql) {
  }

  struct Word {
    std::size_t      offset;
    std::string_view text;
  };

  std::optional<Word> Next() {
    while (pos_ < sql_.size()) {
      const char c = sql_[pos_];

      if (c == '\'' || c == '"' || c == '`') {
        SkipQuoted(c);
        continue;
      }
      if (c == '-' && Peek(1) == '-') {
        while (pos_ < sql_.size() && sql_[pos_] != '\n') ++pos_;
        continue;
      }
      if (c == '/' && Peek(1) == '*') {
        const auto end = sql_.find("*/", pos_ + 2);
        pos_           = end == std::string_view::npos ? sql_.size() : end + 2;
        continue;
      }
      if (c == '(') {
        ++depth_;
        ++pos_;
        continue;
      }
      if (c == ')') {
        if (depth_ > 0) --depth_;
        ++pos_;
        continue;
      }
      if (IsIdentChar(c)) {
        const auto start = pos_;
        while (pos_ < sql_.size() && IsIdentChar(sql_[pos_])) ++pos_;
        if (depth_ == 0) {
          return Word{start, sql_.substr(start, pos_ - start)};
        }
        continue;
      }
      ++pos_;
    }
    return std::nullopt;
  }

 private:
  char Peek(std::size_t ahead) const {
    return pos_ + ahead < sql_.size() ? sql_[pos_ + ahead] : '\0';
  }

  // Doubled quote characters stay inside the literal.
  void SkipQuoted(char quote) {
    ++pos_;
    while (pos_ < sql_.size()) {
      if (sql_[pos_] == quote) {
        if (Peek(1) == quote) {
          pos_ += 2;
          continue;
        }
        ++pos_;
        return;
      }
      ++pos_;
    }
  }

  std::string_view sql_;
  std::size_t      pos_   = 0;
  int              depth_ = 0;
};

constexpr std::array<std::string_view, 4> kClauseWords = {"WHERE", "HAVING", "LIMIT", "OFFSET"};

} // namespace

std::string FormatAsOfInterval(std::string_view interval) {
  interval = Trim(interval);
  if (interval.empty()) {
    throw std::invalid_argument("AS OF SYSTEM TIME interval must not be empty");
  }
  if (interval.front() == '\'' || interval.find('(') != std::string_view::npos) {
    return std::string(interval);
  }

  std::string out = "'";
  for (char c : interval) {
    if (c == '\'') out.push_back('\'');
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string RewriteAsOfSystemTime(std::string_view query, std::string_view interval) {
  const auto clause = " AS OF SYSTEM TIME " + FormatAsOfInterval(interval);

  std::string_view body = TrimRight(query);
  bool             semicolon = false;
  if (!body.empty() && body.back() == ';') {
    semicolon = true;
    body      = TrimRight(body.substr(0, body.size() - 1));
  }

  WordScanner scanner(body);
  bool        seen_from = false;
  std::optional<std::size_t> insert_at;

  while (auto word = scanner.Next()) {
    if (!seen_from) {
      seen_from = EqualsUpper(word->text, "FROM");
      continue;
    }

    bool ends_from = false;
    for (auto keyword : kClauseWords) {
      ends_from = ends_from || EqualsUpper(word->text, keyword);
    }
    if (!ends_from && (EqualsUpper(word->text, "GROUP") || EqualsUpper(word->text, "ORDER"))) {
      auto next = scanner.Next();
      ends_from = next && EqualsUpper(next->text, "BY");
    }
    if (ends_from) {
      insert_at = word->offset;
      break;
    }
  }

  if (!seen_from) {
    throw std::invalid_argument("AS OF SYSTEM TIME needs a query with a top-level FROM clause");
  }

  std::string out;
  if (insert_at) {
    out.append(TrimRight(body.substr(0, *insert_at)));
    out.append(clause);
    out.push_back(' ');
    out.append(body.substr(*insert_at));
  } else {
    out.append(body);
    out.append(clause);
  }
  if (semicolon) out.push_back(';');
  return out;
}

} // namespace txcoord::retry
