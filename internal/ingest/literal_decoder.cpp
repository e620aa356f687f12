#include "literal_decoder.hpp"

#include <charconv>
#include <cstdint>

namespace tripgraph::ingest {

namespace {

constexpr int kMaxDepth = 64;

constexpr char32_t kReplacementChar = 0xFFFD;

bool IsIdentStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

void AppendUtf8(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// repr() of a float the way Python prints it
std::string FormatFloat(double value) {
  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  std::string text(buf, ec == std::errc() ? end : buf);
  if (text.find_first_of(".eEn") == std::string::npos) text += ".0";
  return text;
}

class LiteralParser {
 public:
  explicit LiteralParser(std::string_view text) : text_(text) {
  }

  bool Parse(google::protobuf::Value* out) {
    SkipSpace();
    if (AtEnd()) return Fail("empty input");
    if (!ParseValue(out, 0)) return false;
    SkipSpace();
    if (!AtEnd()) return Fail("unexpected trailing characters");
    return true;
  }

  // Containers finish innermost first, so the last one closed is the outermost.
  LiteralContainer Container(const google::protobuf::Value& value) const {
    const auto kind = value.kind_case();
    if (kind != google::protobuf::Value::kListValue && kind != google::protobuf::Value::kStructValue) {
      return LiteralContainer::kScalar;
    }
    return last_container_;
  }

  const std::string& Error() const {
    return error_;
  }

 private:
  bool AtEnd() const {
    return pos_ >= text_.size();
  }

  char Peek(std::size_t ahead = 0) const {
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
  }

  bool Fail(const std::string& what) {
    if (error_.empty()) error_ = what + " at offset " + std::to_string(pos_);
    return false;
  }

  void SkipSpace() {
    while (!AtEnd()) {
      char c = text_[pos_];
      if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v') {
        ++pos_;
      } else if (c == '#') {
        while (!AtEnd() && text_[pos_] != '\n') ++pos_;
      } else if (c == '\\' && (Peek(1) == '\n' || (Peek(1) == '\r' && Peek(2) == '\n'))) {
        pos_ += Peek(1) == '\n' ? 2 : 3;
      } else {
        break;
      }
    }
  }

  bool ParseValue(google::protobuf::Value* out, int depth) {
    if (depth > kMaxDepth) return Fail("nesting too deep");
    SkipSpace();
    if (AtEnd()) return Fail("unexpected end of input");

    const char c = Peek();
    if (c == '[') {
      ++pos_;
      if (!ParseItems(']', out->mutable_list_value(), depth)) return false;
      last_container_ = LiteralContainer::kList;
      return true;
    }
    if (c == '(') return ParseParen(out, depth);
    if (c == '{') return ParseBrace(out, depth);
    if (c == '+' || c == '-') return ParseSigned(out);
    if (IsDigit(c) || (c == '.' && IsDigit(Peek(1)))) return ParseNumber(out, false);
    if (IsStringStart()) return ParseStrings(out);
    if (IsIdentStart(c)) return ParseName(out);
    return Fail(std::string("unexpected character '") + c + "'");
  }

  // Items up to and including `close`; the opener is already consumed.
  bool ParseItems(char close, google::protobuf::ListValue* list, int depth) {
    for (;;) {
      SkipSpace();
      if (Peek() == close) {
        ++pos_;
        return true;
      }
      if (!ParseValue(list->add_values(), depth + 1)) return false;
      SkipSpace();
      if (Peek() == ',') {
        ++pos_;
        continue;
      }
      if (Peek() == close) {
        ++pos_;
        return true;
      }
      return Fail(std::string("expected ',' or '") + close + "'");
    }
  }

  // "(x)" is x itself; "(x,)" and "(x, y)" are tuples.
  bool ParseParen(google::protobuf::Value* out, int depth) {
    ++pos_;
    SkipSpace();
    if (Peek() == ')') {
      ++pos_;
      out->mutable_list_value();
      last_container_ = LiteralContainer::kTuple;
      return true;
    }

    google::protobuf::Value first;
    if (!ParseValue(&first, depth + 1)) return false;
    SkipSpace();
    if (Peek() == ')') {
      ++pos_;
      *out = std::move(first);
      return true;
    }
    if (Peek() != ',') return Fail("expected ',' or ')'");
    ++pos_;

    auto* list          = out->mutable_list_value();
    *list->add_values() = std::move(first);
    if (!ParseItems(')', list, depth)) return false;
    last_container_ = LiteralContainer::kTuple;
    return true;
  }

  // Dict when the first element is followed by ':', set otherwise.
  bool ParseBrace(google::protobuf::Value* out, int depth) {
    ++pos_;
    SkipSpace();
    if (Peek() == '}') {
      ++pos_;
      out->mutable_struct_value();
      last_container_ = LiteralContainer::kDict;
      return true;
    }

    google::protobuf::Value first;
    if (!ParseValue(&first, depth + 1)) return false;
    const bool first_is_int = last_number_was_int_;
    SkipSpace();

    if (Peek() != ':') {
      auto* list          = out->mutable_list_value();
      *list->add_values() = std::move(first);
      if (Peek() != '}') {
        if (Peek() != ',') return Fail("expected ',' or '}'");
        ++pos_;
        if (!ParseItems('}', list, depth)) return false;
      } else {
        ++pos_;
      }
      last_container_ = LiteralContainer::kSet;
      return true;
    }

    auto*                   fields     = out->mutable_struct_value()->mutable_fields();
    google::protobuf::Value key        = std::move(first);
    bool                    key_is_int = first_is_int;
    for (;;) {
      // at ':'
      ++pos_;
      std::string key_text;
      if (!KeyText(key, key_is_int, &key_text)) return false;
      auto& slot = (*fields)[key_text];
      slot.Clear();
      if (!ParseValue(&slot, depth + 1)) return false;

      SkipSpace();
      if (Peek() == ',') {
        ++pos_;
        SkipSpace();
      } else if (Peek() != '}') {
        return Fail("expected ',' or '}'");
      }
      if (Peek() == '}') {
        ++pos_;
        last_container_ = LiteralContainer::kDict;
        return true;
      }

      key.Clear();
      if (!ParseValue(&key, depth + 1)) return false;
      key_is_int = last_number_was_int_;
      SkipSpace();
      if (Peek() != ':') return Fail("expected ':'");
    }
  }

  // Struct keys are strings; scalar keys use their Python repr.
  bool KeyText(const google::protobuf::Value& key, bool is_int, std::string* out) {
    switch (key.kind_case()) {
      case google::protobuf::Value::kStringValue:
        *out = key.string_value();
        return true;
      case google::protobuf::Value::kNumberValue:
        if (is_int) {
          char buf[32];
          auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<long long>(key.number_value()));
          *out = std::string(buf, ec == std::errc() ? end : buf);
        } else {
          *out = FormatFloat(key.number_value());
        }
        return true;
      case google::protobuf::Value::kBoolValue:
        *out = key.bool_value() ? "True" : "False";
        return true;
      case google::protobuf::Value::kNullValue:
        *out = "None";
        return true;
      default:
        return Fail("unsupported dict key");
    }
  }

  // A single sign only; "--5" is an expression, not a literal.
  bool ParseSigned(google::protobuf::Value* out) {
    const bool negative = Peek() == '-';
    ++pos_;
    SkipSpace();
    if (!(IsDigit(Peek()) || (Peek() == '.' && IsDigit(Peek(1))))) return Fail("expected a number after sign");
    return ParseNumber(out, negative);
  }

  bool ParseNumber(google::protobuf::Value* out, bool negative) {
    double value = 0;

    if (Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X' || Peek(1) == 'o' || Peek(1) == 'O' || Peek(1) == 'b' || Peek(1) == 'B')) {
      const char marker = static_cast<char>(Peek(1) | 0x20);
      const int  base   = marker == 'x' ? 16 : marker == 'o' ? 8 : 2;
      pos_ += 2;
      bool any = false;
      while (!AtEnd()) {
        char c = Peek();
        if (c == '_') {
          ++pos_;
          continue;
        }
        int digit = HexValue(c);
        if (digit < 0 || digit >= base) break;
        value = value * base + digit;
        any   = true;
        ++pos_;
      }
      if (!any) return Fail("malformed integer literal");
      last_number_was_int_ = true;
    } else {
      std::string digits;
      bool        is_int = true;
      auto        take_digits = [&] {
        while (IsDigit(Peek()) || (Peek() == '_' && IsDigit(Peek(1)))) {
          if (Peek() != '_') digits.push_back(Peek());
          ++pos_;
        }
      };

      take_digits();
      if (Peek() == '.') {
        is_int = false;
        digits.push_back('.');
        ++pos_;
        take_digits();
      }
      if ((Peek() == 'e' || Peek() == 'E') && (IsDigit(Peek(1)) || ((Peek(1) == '+' || Peek(1) == '-') && IsDigit(Peek(2))))) {
        is_int = false;
        digits.push_back('e');
        ++pos_;
        if (Peek() == '+' || Peek() == '-') {
          digits.push_back(Peek());
          ++pos_;
        }
        take_digits();
      }

      // from_chars rejects "5." and ".5" forms
      if (!digits.empty() && digits.front() == '.') digits.insert(digits.begin(), '0');
      if (auto dot = digits.find('.'); dot != std::string::npos && (dot + 1 == digits.size() || digits[dot + 1] == 'e')) {
        digits.insert(dot + 1, "0");
      }

      auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
      if (ec != std::errc() || end != digits.data() + digits.size()) return Fail("malformed number literal");
      last_number_was_int_ = is_int;
    }

    if (Peek() == 'j' || Peek() == 'J') return Fail("complex literals are not supported");
    if (IsIdentChar(Peek())) return Fail("malformed number literal");

    out->set_number_value(negative ? -value : value);
    return true;
  }

  bool ParseName(google::protobuf::Value* out) {
    const std::size_t start = pos_;
    while (IsIdentChar(Peek())) ++pos_;
    const auto name = text_.substr(start, pos_ - start);

    if (name == "True") {
      out->set_bool_value(true);
    } else if (name == "False") {
      out->set_bool_value(false);
    } else if (name == "None") {
      out->set_null_value(google::protobuf::NULL_VALUE);
    } else {
      pos_ = start;
      return Fail("unsupported name '" + std::string(name) + "'");
    }
    return true;
  }

  // Length of a string prefix (r, b, u, rb, br) followed by a quote, or npos.
  std::size_t PrefixLength() const {
    std::size_t n = 0;
    while (n < 2) {
      char c = static_cast<char>(Peek(n) | 0x20);
      if (c != 'r' && c != 'b' && c != 'u') break;
      ++n;
    }
    const char q = Peek(n);
    return (q == '\'' || q == '"') ? n : std::string_view::npos;
  }

  bool IsStringStart() const {
    return PrefixLength() != std::string_view::npos;
  }

  // One or more adjacent literals, concatenated.
  bool ParseStrings(google::protobuf::Value* out) {
    std::string text;
    if (!ParseStringLiteral(&text)) return false;
    for (;;) {
      const std::size_t mark = pos_;
      SkipSpace();
      if (!IsStringStart()) {
        pos_ = mark;
        break;
      }
      if (!ParseStringLiteral(&text)) return false;
    }
    out->set_string_value(std::move(text));
    return true;
  }

  bool ParseStringLiteral(std::string* out) {
    const std::size_t prefix = PrefixLength();
    bool              raw    = false;
    bool              bytes  = false;
    for (std::size_t i = 0; i < prefix; ++i) {
      char c = static_cast<char>(Peek(i) | 0x20);
      raw |= c == 'r';
      bytes |= c == 'b';
    }
    pos_ += prefix;

    const char q      = Peek();
    const bool triple = Peek(1) == q && Peek(2) == q;
    pos_ += triple ? 3 : 1;

    for (;;) {
      if (AtEnd()) return Fail("unterminated string");
      const char c = Peek();

      if (c == q) {
        if (!triple) {
          ++pos_;
          return true;
        }
        if (Peek(1) == q && Peek(2) == q) {
          pos_ += 3;
          return true;
        }
      }
      if (!triple && c == '\n') return Fail("newline in single-quoted string");

      if (c != '\\') {
        out->push_back(c);
        ++pos_;
        continue;
      }

      if (raw) {
        // the backslash stays; it only stops the next char from closing the string
        out->push_back('\\');
        ++pos_;
        if (!AtEnd()) {
          out->push_back(Peek());
          ++pos_;
        }
        continue;
      }

      if (!ParseEscape(out, bytes)) return false;
    }
  }

  bool ReadHex(std::size_t count, char32_t* cp) {
    char32_t value = 0;
    for (std::size_t i = 0; i < count; ++i) {
      int digit = HexValue(Peek(i));
      if (digit < 0) return Fail("truncated escape sequence");
      value = value * 16 + static_cast<char32_t>(digit);
    }
    pos_ += count;
    *cp = value;
    return true;
  }

  // pos_ is at the backslash.
  bool ParseEscape(std::string* out, bool bytes) {
    const char e = Peek(1);
    pos_ += 2;
    switch (e) {
      case '\n':
        return true;
      case '\r':
        if (Peek() == '\n') ++pos_;
        return true;
      case '\\':
      case '\'':
      case '"':
        out->push_back(e);
        return true;
      case 'a':
        out->push_back('\a');
        return true;
      case 'b':
        out->push_back('\b');
        return true;
      case 'f':
        out->push_back('\f');
        return true;
      case 'n':
        out->push_back('\n');
        return true;
      case 'r':
        out->push_back('\r');
        return true;
      case 't':
        out->push_back('\t');
        return true;
      case 'v':
        out->push_back('\v');
        return true;
      case 'x': {
        char32_t cp = 0;
        if (!ReadHex(2, &cp)) return false;
        AppendUtf8(*out, cp);
        return true;
      }
      case 'u':
      case 'U': {
        if (bytes) break;
        char32_t cp = 0;
        if (!ReadHex(e == 'u' ? 4 : 8, &cp)) return false;
        if (cp > 0x10FFFF) return Fail("escape outside the unicode range");
        AppendCodepoint(out, cp);
        return true;
      }
      default:
        if (e >= '0' && e <= '7') {
          char32_t cp = static_cast<char32_t>(e - '0');
          for (int i = 0; i < 2 && Peek() >= '0' && Peek() <= '7'; ++i) {
            cp = cp * 8 + static_cast<char32_t>(Peek() - '0');
            ++pos_;
          }
          AppendUtf8(*out, cp);
          return true;
        }
        break;
    }

    if (e == '\0' && AtEnd()) return Fail("unterminated string");
    // unknown escapes are kept verbatim
    out->push_back('\\');
    out->push_back(e);
    return true;
  }

  // Joins \uD8xx\uDCxx pairs; a lone surrogate becomes U+FFFD.
  void AppendCodepoint(std::string* out, char32_t cp) {
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      if (Peek() == '\\' && Peek(1) == 'u') {
        char32_t          low  = 0;
        const std::size_t mark = pos_;
        pos_ += 2;
        if (ReadHex(4, &low) && low >= 0xDC00 && low <= 0xDFFF) {
          AppendUtf8(*out, 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00));
          return;
        }
        pos_ = mark;
        error_.clear();
      }
      AppendUtf8(*out, kReplacementChar);
      return;
    }
    if (cp >= 0xDC00 && cp <= 0xDFFF) {
      AppendUtf8(*out, kReplacementChar);
      return;
    }
    AppendUtf8(*out, cp);
  }

  std::string_view text_;
  std::size_t      pos_ = 0;
  std::string      error_;
  bool             last_number_was_int_ = false;
  LiteralContainer last_container_      = LiteralContainer::kScalar;
};

} // namespace

LiteralDecodeResult DecodeLiteral(std::string_view text) {
  LiteralDecodeResult result;
  LiteralParser       parser(text);
  if (parser.Parse(&result.value)) {
    result.ok        = true;
    result.container = parser.Container(result.value);
    return result;
  }
  result.value.Clear();
  result.value.set_null_value(google::protobuf::NULL_VALUE);
  result.error = parser.Error();
  return result;
}

} // namespace tripgraph::ingest
