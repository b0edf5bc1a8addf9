#include "layout_parser.h"

#include "layout_error.h"
#include "layout_utils.h"

#include <llvm/Support/FormatVariadic.h>

#include <optional>
#include <set>
#include <utility>

namespace offsetgen {

namespace {

enum class TokenKind {
  Identifier,
  Integer,
  Punct,
  End,
};

struct Token {
  TokenKind kind = TokenKind::End;
  llvm::StringRef text;
  uint64_t value = 0;
  unsigned line = 1;
  unsigned column = 1;
};

constexpr uint64_t kMaxLiteral = 0xffffffffULL;

const std::set<std::string> KEYWORDS = {"struct", "public", "private", "plain",
                                        "debug",  "checked", "const"};

const std::set<std::string> CXX_KEYWORDS = {
    "alignas",   "alignof",      "and",        "and_eq",       "asm",          "auto",
    "bitand",    "bitor",        "bool",       "break",        "case",         "catch",
    "char",      "char16_t",     "char32_t",   "char8_t",      "class",        "compl",
    "concept",   "const",        "consteval",  "constexpr",    "constinit",    "const_cast",
    "continue",  "co_await",     "co_return",  "co_yield",     "decltype",     "default",
    "delete",    "do",           "double",     "dynamic_cast", "else",         "enum",
    "explicit",  "export",       "extern",     "false",        "float",        "for",
    "friend",    "goto",         "if",         "inline",       "int",          "long",
    "mutable",   "namespace",    "new",        "noexcept",     "not",          "not_eq",
    "nullptr",   "operator",     "or",         "or_eq",        "private",      "protected",
    "public",    "register",     "reinterpret_cast", "requires", "return",     "short",
    "signed",    "sizeof",       "static",     "static_assert", "static_cast", "struct",
    "switch",    "template",     "this",       "thread_local", "throw",        "true",
    "try",       "typedef",      "typeid",     "typename",     "union",        "unsigned",
    "using",     "virtual",      "void",       "volatile",     "wchar_t",      "while",
    "xor",       "xor_eq"};

bool is_ident_start(char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

bool is_ident_char(char ch) {
  return is_ident_start(ch) || (ch >= '0' && ch <= '9');
}

class Lexer {
public:
  explicit Lexer(llvm::StringRef text) : text_(text) {}

  llvm::Error tokenize(std::vector<Token> &tokens) {
    while (pos_ < text_.size()) {
      char ch = peek();
      if (ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
        advance(1);
        continue;
      }
      if (ch == '#' || (ch == '/' && peek(1) == '/')) {
        while (pos_ < text_.size() && peek() != '\n') {
          advance(1);
        }
        continue;
      }
      if (ch == '/' && peek(1) == '*') {
        unsigned line = line_;
        unsigned column = column_;
        advance(2);
        while (pos_ < text_.size() && !(peek() == '*' && peek(1) == '/')) {
          advance(1);
        }
        if (pos_ >= text_.size()) {
          return error_at(line, column, "unterminated block comment");
        }
        advance(2);
        continue;
      }

      Token token;
      token.line = line_;
      token.column = column_;
      size_t start = pos_;
      if (is_ident_start(ch)) {
        while (pos_ < text_.size() && is_ident_char(peek())) {
          advance(1);
        }
        token.kind = TokenKind::Identifier;
        token.text = text_.slice(start, pos_);
      } else if (ch >= '0' && ch <= '9') {
        while (pos_ < text_.size() && is_ident_char(peek())) {
          advance(1);
        }
        token.kind = TokenKind::Integer;
        token.text = text_.slice(start, pos_);
        if (auto err = parse_literal(token)) {
          return err;
        }
      } else if (llvm::StringRef("{}[];*").contains(ch)) {
        advance(1);
        token.kind = TokenKind::Punct;
        token.text = text_.slice(start, pos_);
      } else {
        return error_at(line_, column_, "unexpected character '" + std::string(1, ch) + "'");
      }
      tokens.push_back(token);
    }

    Token end;
    end.kind = TokenKind::End;
    end.line = line_;
    end.column = column_;
    tokens.push_back(end);
    return llvm::Error::success();
  }

private:
  llvm::StringRef text_;
  size_t pos_ = 0;
  unsigned line_ = 1;
  unsigned column_ = 1;

  char peek(size_t ahead = 0) const {
    return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
  }

  void advance(size_t count) {
    for (size_t i = 0; i < count && pos_ < text_.size(); ++i) {
      if (text_[pos_] == '\n') {
        line_++;
        column_ = 1;
      } else {
        column_++;
      }
      pos_++;
    }
  }

  llvm::Error parse_literal(Token &token) const {
    llvm::StringRef digits = token.text;
    unsigned radix = 10;
    if (digits.startswith_insensitive("0x")) {
      digits = digits.drop_front(2);
      radix = 16;
    }
    uint64_t value = 0;
    if (digits.empty() || digits.getAsInteger(radix, value)) {
      return error_at(token.line, token.column,
                      "invalid integer literal '" + token.text.str() + "'");
    }
    if (value > kMaxLiteral) {
      return error_at(token.line, token.column,
                      "integer literal '" + token.text.str() + "' is out of range");
    }
    token.value = value;
    return llvm::Error::success();
  }

  static llvm::Error error_at(unsigned line, unsigned column, const std::string &message) {
    return make_layout_error(LayoutErrorKind::Syntax, "", "",
                             llvm::formatv("column {0}: {1}", column, message).str(), line);
  }
};

class Parser {
public:
  Parser(std::vector<Token> tokens, const ParseOptions &options)
      : tokens_(std::move(tokens)), options_(options) {}

  llvm::Expected<LayoutFile> parse(llvm::StringRef source_name) {
    LayoutFile file;
    file.source_name = source_name.str();
    std::set<std::string> struct_names;
    while (peek().kind != TokenKind::End) {
      auto spec = parse_struct();
      if (!spec) {
        return spec.takeError();
      }
      if (!struct_names.insert(spec->name).second) {
        return make_layout_error(LayoutErrorKind::DuplicateStruct, spec->name, "",
                                 "struct is declared more than once", spec->line);
      }
      file.structs.push_back(std::move(*spec));
    }
    return file;
  }

private:
  std::vector<Token> tokens_;
  size_t pos_ = 0;
  const ParseOptions &options_;
  const TypeRegistry builtins_ = make_default_registry(8);

  const Token &peek() const { return tokens_[pos_]; }

  const Token &next() {
    const Token &token = tokens_[pos_];
    if (token.kind != TokenKind::End) {
      pos_++;
    }
    return token;
  }

  bool is_punct(char ch) const {
    return peek().kind == TokenKind::Punct && peek().text.front() == ch;
  }

  bool is_keyword(llvm::StringRef keyword) const {
    return peek().kind == TokenKind::Identifier && peek().text == keyword;
  }

  static std::string describe(const Token &token) {
    switch (token.kind) {
    case TokenKind::End:
      return "end of input";
    case TokenKind::Integer:
      return "integer '" + token.text.str() + "'";
    default:
      return "'" + token.text.str() + "'";
    }
  }

  llvm::Error syntax_error(const Token &token, const std::string &message,
                           const std::string &struct_name = "") const {
    return make_layout_error(LayoutErrorKind::Syntax, struct_name, "",
                             llvm::formatv("column {0}: {1}", token.column, message).str(),
                             token.line);
  }

  llvm::Error expect_punct(char ch, const std::string &context) {
    if (!is_punct(ch)) {
      return syntax_error(peek(), "expected '" + std::string(1, ch) + "' " + context + ", found " +
                                      describe(peek()));
    }
    next();
    return llvm::Error::success();
  }

  llvm::Expected<uint64_t> parse_integer(const std::string &what) {
    if (peek().kind != TokenKind::Integer) {
      return syntax_error(peek(), "expected " + what + ", found " + describe(peek()));
    }
    return next().value;
  }

  std::optional<std::string> reserved_reason(const std::string &name) const {
    if (CXX_KEYWORDS.count(name)) {
      return "a C++ keyword";
    }
    if (is_base_type(builtins_, name)) {
      return "a base type name";
    }
    return std::nullopt;
  }

  llvm::Expected<std::string> parse_identifier(const std::string &what) {
    const Token &token = peek();
    if (token.kind != TokenKind::Identifier || KEYWORDS.count(token.text.str())) {
      return syntax_error(token, "expected " + what + ", found " + describe(token));
    }
    return next().text.str();
  }

  llvm::Expected<StructSpec> parse_struct() {
    StructSpec spec;
    spec.mode = options_.default_mode;
    spec.line = peek().line;
    bool seen_visibility = false;
    bool seen_mode = false;
    while (peek().kind == TokenKind::Identifier && !is_keyword("struct")) {
      const Token &token = peek();
      if (token.text == "public" || token.text == "private") {
        if (seen_visibility) {
          return syntax_error(token, "duplicate struct visibility");
        }
        seen_visibility = true;
        spec.visibility = token.text == "private" ? Visibility::Private : Visibility::Public;
      } else if (token.text == "plain" || token.text == "debug") {
        if (seen_mode) {
          return syntax_error(token, "duplicate generation mode");
        }
        seen_mode = true;
        spec.mode = token.text == "debug" ? GenerationMode::Debug : GenerationMode::Plain;
      } else if (token.text == "checked") {
        if (spec.checked) {
          return syntax_error(token, "duplicate 'checked'");
        }
        spec.checked = true;
      } else {
        return syntax_error(token, "expected 'struct', found " + describe(token));
      }
      next();
    }
    if (!is_keyword("struct")) {
      return syntax_error(peek(), "expected 'struct', found " + describe(peek()));
    }
    next();

    const Token &name_token = peek();
    auto name = parse_identifier("struct name");
    if (!name) {
      return name.takeError();
    }
    spec.name = *name;
    if (spec.name.rfind(kPaddingPrefix, 0) == 0) {
      return make_layout_error(LayoutErrorKind::ReservedName, spec.name, "",
                               "struct names may not start with '" + std::string(kPaddingPrefix) + "'",
                               name_token.line);
    }
    if (auto reason = reserved_reason(spec.name)) {
      return make_layout_error(LayoutErrorKind::ReservedName, spec.name, "",
                               "struct name is " + *reason, name_token.line);
    }

    if (is_punct('[')) {
      next();
      auto total = parse_integer("total struct size");
      if (!total) {
        return total.takeError();
      }
      spec.total_size = static_cast<int64_t>(*total);
      if (auto err = expect_punct(']', "after total struct size")) {
        return std::move(err);
      }
    }

    if (auto err = expect_punct('{', "to open struct " + spec.name)) {
      return std::move(err);
    }

    std::set<std::string> field_names;
    while (!is_punct('}')) {
      if (peek().kind == TokenKind::End) {
        return syntax_error(peek(), "unterminated struct " + spec.name, spec.name);
      }
      auto field = parse_field();
      if (!field) {
        return field.takeError();
      }
      if (field->name.rfind(kPaddingPrefix, 0) == 0) {
        return make_layout_error(LayoutErrorKind::ReservedName, spec.name, field->name,
                                 "field names may not start with '" + std::string(kPaddingPrefix) + "'",
                                 field->line);
      }
      if (auto reason = reserved_reason(field->name)) {
        return make_layout_error(LayoutErrorKind::ReservedName, spec.name, field->name,
                                 "field name is " + *reason, field->line);
      }
      if (field->name == spec.name) {
        return make_layout_error(LayoutErrorKind::DuplicateField, spec.name, field->name,
                                 "field has the same name as its struct", field->line);
      }
      if (!field_names.insert(field->name).second) {
        return make_layout_error(LayoutErrorKind::DuplicateField, spec.name, field->name,
                                 "field is declared more than once", field->line);
      }
      spec.fields.push_back(std::move(*field));
    }
    next();
    if (is_punct(';')) {
      next();
    }
    return spec;
  }

  llvm::Expected<FieldSpec> parse_field() {
    FieldSpec field;
    field.line = peek().line;
    auto offset = parse_integer("field offset");
    if (!offset) {
      return offset.takeError();
    }
    field.offset = static_cast<int64_t>(*offset);

    if (is_keyword("public") || is_keyword("private")) {
      field.visibility = next().text == "private" ? Visibility::Private : Visibility::Public;
    }

    std::vector<std::string> qualifiers;
    while (is_keyword("const")) {
      next();
      if (qualifiers.empty()) {
        qualifiers.emplace_back("const");
      }
    }

    auto type_name = parse_identifier("field type");
    if (!type_name) {
      return type_name.takeError();
    }
    TypeRef type = make_named(*type_name);
    type->qualifiers = qualifiers;
    while (is_punct('*')) {
      next();
      type = make_pointer(type);
    }

    auto name = parse_identifier("field name");
    if (!name) {
      return name.takeError();
    }
    field.name = *name;

    std::vector<int64_t> dims;
    while (is_punct('[')) {
      next();
      const Token &count_token = peek();
      auto count = parse_integer("array count");
      if (!count) {
        return count.takeError();
      }
      if (*count == 0) {
        return syntax_error(count_token, "array count must be positive");
      }
      dims.push_back(static_cast<int64_t>(*count));
      if (auto err = expect_punct(']', "after array count")) {
        return std::move(err);
      }
    }
    for (size_t i = dims.size(); i-- > 0;) {
      type = make_array(type, dims[i]);
    }
    field.type = type;

    if (auto err = expect_punct(';', "after field " + field.name)) {
      return std::move(err);
    }
    return field;
  }
};

} // namespace

llvm::Expected<LayoutFile> parse_layout(llvm::StringRef text, llvm::StringRef source_name,
                                        const ParseOptions &options) {
  std::vector<Token> tokens;
  Lexer lexer(text);
  if (auto err = lexer.tokenize(tokens)) {
    return std::move(err);
  }
  Parser parser(std::move(tokens), options);
  return parser.parse(source_name);
}

} // namespace offsetgen
