#include "internal/expr/parser.hpp"

#include <cctype>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace opentimeline::expr {

namespace {

constexpr std::size_t kMaxDepth = 256;

enum class TokenKind {
  kIdent,
  kString,
  kLParen,
  kRParen,
  kEq,
  kNotEq,
  kAnd,
  kOr,
  kNot,
  kExists,
  kEnd,
};

struct Token {
  TokenKind   kind;
  std::size_t pos;
  std::string text;  // identifier name, decoded string, or keyword as written
};

const char* Describe(TokenKind kind) {
  switch (kind) {
    case TokenKind::kIdent:
      return "tag name";
    case TokenKind::kString:
      return "quoted value";
    case TokenKind::kLParen:
      return "'('";
    case TokenKind::kRParen:
      return "')'";
    case TokenKind::kEq:
      return "'='";
    case TokenKind::kNotEq:
      return "'!='";
    case TokenKind::kAnd:
      return "AND";
    case TokenKind::kOr:
      return "OR";
    case TokenKind::kNot:
      return "NOT";
    case TokenKind::kExists:
      return "EXISTS";
    case TokenKind::kEnd:
    default:
      return "end of expression";
  }
}

bool IsIdentStart(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool IsIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.' || c == ':';
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

void AppendUtf8(std::string& out, std::uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

// ------------------------------------------------------------
// Lexer
// ------------------------------------------------------------

class Lexer {
 public:
  explicit Lexer(std::string_view src) : src_(src) {
  }

  std::vector<Token> Run() {
    std::vector<Token> tokens;
    for (;;) {
      SkipSpace();
      if (pos_ >= src_.size()) {
        tokens.push_back({TokenKind::kEnd, pos_, {}});
        return tokens;
      }

      const std::size_t start = pos_;
      const char        c     = src_[pos_];

      if (c == '(') {
        ++pos_;
        tokens.push_back({TokenKind::kLParen, start, "("});
      } else if (c == ')') {
        ++pos_;
        tokens.push_back({TokenKind::kRParen, start, ")"});
      } else if (c == '=') {
        ++pos_;
        tokens.push_back({TokenKind::kEq, start, "="});
      } else if (c == '!') {
        if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '=') {
          pos_ += 2;
          tokens.push_back({TokenKind::kNotEq, start, "!="});
        } else {
          throw util::ParseError(start, "unknown operator '!'");
        }
      } else if (c == '"') {
        tokens.push_back({TokenKind::kString, start, ReadString()});
      } else if (IsIdentStart(c)) {
        tokens.push_back(ReadWord());
      } else {
        throw util::ParseError(start, std::string("unexpected character '") + c + "'");
      }
    }
  }

 private:
  void SkipSpace() {
    while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
  }

  Token ReadWord() {
    const std::size_t start = pos_;
    while (pos_ < src_.size() && IsIdentChar(src_[pos_])) ++pos_;
    std::string word(src_.substr(start, pos_ - start));

    if (EqualsIgnoreCase(word, "and")) return {TokenKind::kAnd, start, word};
    if (EqualsIgnoreCase(word, "or")) return {TokenKind::kOr, start, word};
    if (EqualsIgnoreCase(word, "not")) return {TokenKind::kNot, start, word};
    if (EqualsIgnoreCase(word, "exists")) return {TokenKind::kExists, start, word};
    return {TokenKind::kIdent, start, word};
  }

  std::uint32_t ReadHex4(std::size_t escape_pos) {
    if (pos_ + 4 > src_.size()) {
      throw util::ParseError(escape_pos, "truncated \\u escape");
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
      const char c = src_[pos_++];
      value <<= 4;
      if (c >= '0' && c <= '9') value |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') value |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') value |= static_cast<std::uint32_t>(c - 'A' + 10);
      else throw util::ParseError(escape_pos, "invalid hex digit in \\u escape");
    }
    return value;
  }

  std::string ReadString() {
    const std::size_t open = pos_++;
    std::string       out;

    while (pos_ < src_.size()) {
      const char c = src_[pos_];
      if (c == '"') {
        ++pos_;
        return out;
      }
      if (c != '\\') {
        out += c;
        ++pos_;
        continue;
      }

      const std::size_t escape_pos = pos_++;
      if (pos_ >= src_.size()) break;

      switch (src_[pos_++]) {
        case '"':
          out += '"';
          break;
        case '\\':
          out += '\\';
          break;
        case '/':
          out += '/';
          break;
        case 'b':
          out += '\b';
          break;
        case 'f':
          out += '\f';
          break;
        case 'n':
          out += '\n';
          break;
        case 'r':
          out += '\r';
          break;
        case 't':
          out += '\t';
          break;
        case 'u': {
          std::uint32_t cp = ReadHex4(escape_pos);
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (pos_ + 1 >= src_.size() || src_[pos_] != '\\' || src_[pos_ + 1] != 'u') {
              throw util::ParseError(escape_pos, "unpaired surrogate in \\u escape");
            }
            pos_ += 2;
            const std::uint32_t low = ReadHex4(escape_pos);
            if (low < 0xDC00 || low > 0xDFFF) {
              throw util::ParseError(escape_pos, "unpaired surrogate in \\u escape");
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            throw util::ParseError(escape_pos, "unpaired surrogate in \\u escape");
          }
          AppendUtf8(out, cp);
          break;
        }
        default:
          throw util::ParseError(escape_pos, "invalid escape sequence");
      }
    }

    throw util::ParseError(open, "unterminated string");
  }

  std::string_view src_;
  std::size_t      pos_ = 0;
};

// ------------------------------------------------------------
// Recursive descent
// ------------------------------------------------------------

class Parser {
 public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
  }

  Predicate Run() {
    Predicate result = ParseOr();
    if (Peek().kind != TokenKind::kEnd) {
      throw util::ParseError(Peek().pos, std::string("unexpected ") + Describe(Peek().kind) + " after expression");
    }
    return result;
  }

 private:
  const Token& Peek() const {
    return tokens_[index_];
  }

  const Token& Next() {
    const Token& t = tokens_[index_];
    if (t.kind != TokenKind::kEnd) ++index_;
    return t;
  }

  void Enter() {
    if (++depth_ > kMaxDepth) {
      throw util::ParseError(Peek().pos, "expression nested too deeply");
    }
  }

  Predicate ParseOr() {
    Predicate first = ParseAnd();
    if (Peek().kind != TokenKind::kOr) return first;

    Predicate::Or node;
    node.children.push_back(std::move(first));
    while (Peek().kind == TokenKind::kOr) {
      Next();
      node.children.push_back(ParseAnd());
    }
    return Predicate{std::move(node)};
  }

  Predicate ParseAnd() {
    Predicate first = ParseNot();
    if (Peek().kind != TokenKind::kAnd) return first;

    Predicate::And node;
    node.children.push_back(std::move(first));
    while (Peek().kind == TokenKind::kAnd) {
      Next();
      node.children.push_back(ParseNot());
    }
    return Predicate{std::move(node)};
  }

  Predicate ParseNot() {
    if (Peek().kind != TokenKind::kNot) return ParsePrimary();

    Next();
    Enter();
    Predicate::Not node;
    node.children.push_back(ParseNot());
    --depth_;
    return Predicate{std::move(node)};
  }

  Predicate ParsePrimary() {
    const Token& t = Peek();

    if (t.kind == TokenKind::kLParen) {
      Next();
      Enter();
      if (Peek().kind == TokenKind::kRParen) {
        throw util::ParseError(Peek().pos, "empty parentheses");
      }
      Predicate inner = ParseOr();
      if (Peek().kind != TokenKind::kRParen) {
        throw util::ParseError(Peek().pos, std::string("expected ')' but found ") + Describe(Peek().kind));
      }
      Next();
      --depth_;
      return inner;
    }

    if (t.kind == TokenKind::kString) {
      return Predicate{AnonymousValue{Next().text}};
    }

    if (t.kind == TokenKind::kIdent) {
      return ParseLeaf();
    }

    if (t.kind == TokenKind::kEnd) {
      throw util::ParseError(t.pos, "unexpected end of expression");
    }
    throw util::ParseError(t.pos, std::string("unexpected ") + Describe(t.kind) + ", expected tag name, quoted value or '('");
  }

  Predicate ParseLeaf() {
    const std::string name = Next().text;
    const Token&      op   = Peek();

    switch (op.kind) {
      case TokenKind::kEq:
        Next();
        return Predicate{TagEquals{name, ExpectValue("=")}};
      case TokenKind::kNotEq:
        Next();
        return Predicate{TagNotEquals{name, ExpectValue("!=")}};
      case TokenKind::kExists:
        Next();
        return Predicate{TagExists{name}};
      case TokenKind::kNot:
        Next();
        if (Peek().kind != TokenKind::kExists) {
          throw util::ParseError(Peek().pos, "expected EXISTS after NOT");
        }
        Next();
        return Predicate{TagNotExists{name}};
      default:
        throw util::ParseError(op.pos, "expected '=', '!=', EXISTS or NOT EXISTS after tag name '" + name + "'");
    }
  }

  std::string ExpectValue(const char* op) {
    if (Peek().kind != TokenKind::kString) {
      throw util::ParseError(Peek().pos, std::string("expected quoted value after '") + op + "'");
    }
    return Next().text;
  }

  std::vector<Token> tokens_;
  std::size_t        index_ = 0;
  std::size_t        depth_ = 0;
};

} // namespace

std::optional<Predicate> Parse(std::string_view expression) {
  std::vector<Token> tokens = Lexer(expression).Run();
  if (tokens.size() == 1) {
    return std::nullopt;
  }
  return Parser(std::move(tokens)).Run();
}

} // namespace opentimeline::expr
