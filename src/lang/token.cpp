#include <weft/lang/token.hpp>
#include <algorithm>
#include <cctype>
#include <regex>

namespace weft {

// ---------------------------------------------------------------------------
// TokenPosition
// ---------------------------------------------------------------------------

Result<TokenPosition> TokenPosition::create(int line, int character, int absolute) {
    if (line < 0 || character < 0 || absolute < 0) {
        return WeftError{WeftError::InvalidArg,
            "token position components must not be negative (" +
            std::to_string(line) + ", " + std::to_string(character) + ", " +
            std::to_string(absolute) + ")",
            "use TokenPosition::unpositioned() for tokens without a source"};
    }
    return Result<TokenPosition>::ok(TokenPosition{line, character, absolute});
}

std::string TokenPosition::to_string() const {
    if (!is_positioned()) return "unpositioned";
    return std::to_string(line + 1) + ":" + std::to_string(character + 1);
}

bool TokenPosition::operator==(const TokenPosition& o) const {
    return line == o.line && character == o.character && absolute == o.absolute;
}

bool TokenPosition::operator!=(const TokenPosition& o) const {
    return !(*this == o);
}

// ---------------------------------------------------------------------------
// TokenDefinition
// ---------------------------------------------------------------------------

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

TokenDefinition::TokenDefinition(std::string name, Predicate predicate)
    : name_(std::move(name)), predicate_(std::move(predicate)) {}

TokenDefinition TokenDefinition::literal(const std::string& text, bool ignore_case) {
    if (ignore_case) {
        return TokenDefinition("literal:" + text,
            [text](const std::string& v) { return iequals(v, text); });
    }
    return TokenDefinition("literal:" + text,
        [text](const std::string& v) { return v == text; });
}

Result<TokenDefinition> TokenDefinition::pattern(const std::string& regex) {
    std::shared_ptr<const std::regex> re;
    try {
        re = std::make_shared<const std::regex>(regex);
    } catch (const std::regex_error& e) {
        return WeftError{WeftError::Pattern,
            "invalid token pattern '" + regex + "': " + e.what()};
    }
    return Result<TokenDefinition>::ok(TokenDefinition("pattern:" + regex,
        [re](const std::string& v) { return std::regex_match(v, *re); }));
}

TokenDefinition TokenDefinition::any() {
    return TokenDefinition("any", [](const std::string&) { return true; });
}

bool TokenDefinition::matches(const std::string& value) const {
    return predicate_ && predicate_(value);
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::Simple:    return "simple";
    case TokenKind::Escaped:   return "escaped";
    case TokenKind::Group:     return "group";
    case TokenKind::Annotated: return "annotated";
    case TokenKind::Indexed:   return "indexed";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Token
// ---------------------------------------------------------------------------

bool Token::is_positioned() const {
    return start().is_positioned() && end().is_positioned();
}

bool Token::equals(const Token& o) const {
    return kind() == o.kind() && value() == o.value() &&
           start() == o.start() && end() == o.end();
}

std::string Token::to_string() const {
    std::string out = token_kind_name(kind());
    out += "(\"";
    out += value();
    out += "\"";
    if (is_positioned()) {
        out += " @";
        out += start().to_string();
    }
    out += ")";
    return out;
}

bool operator==(const Token& a, const Token& b) {
    return a.equals(b);
}

bool operator!=(const Token& a, const Token& b) {
    return !a.equals(b);
}

bool same_tokens(const TokenList& a, const TokenList& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a[i] == b[i]) continue;
        if (!a[i] || !b[i] || !a[i]->equals(*b[i])) return false;
    }
    return true;
}

std::string join_values(const TokenList& tokens) {
    std::string out;
    for (const auto& t : tokens) out += t->value();
    return out;
}

static WeftError rejected_value(const TokenDefinition& def, const std::string& value) {
    return WeftError{WeftError::InvalidArg,
        "token value '" + value + "' is not accepted by definition '" +
        def.name() + "'"};
}

// ---------------------------------------------------------------------------
// SimpleToken
// ---------------------------------------------------------------------------

SimpleToken::SimpleToken(Key, TokenDefinition definition, std::string value,
                         TokenPosition start, TokenPosition end)
    : definition_(std::move(definition)), value_(std::move(value)),
      start_(start), end_(end) {}

Result<TokenPtr> SimpleToken::create(TokenDefinition definition, std::string value,
                                     TokenPosition start, TokenPosition end) {
    if (!definition.matches(value)) {
        return rejected_value(definition, value);
    }
    if (start.is_positioned() != end.is_positioned()) {
        return WeftError{WeftError::InvalidArg,
            "token '" + value + "' must be positioned at both ends or neither"};
    }
    if (start.is_positioned() && end.absolute < start.absolute) {
        return WeftError{WeftError::InvalidArg,
            "token '" + value + "' ends before it starts"};
    }
    return Result<TokenPtr>::ok(std::make_shared<SimpleToken>(
        Key{}, std::move(definition), std::move(value), start, end));
}

Result<TokenPtr> SimpleToken::create(TokenDefinition definition, std::string value,
                                     TokenPosition start) {
    TokenPosition end = start;
    if (start.is_positioned() && !value.empty()) {
        int span = static_cast<int>(value.size()) - 1;
        end.character += span;
        end.absolute += span;
    }
    return create(std::move(definition), std::move(value), start, end);
}

Result<TokenPtr> SimpleToken::unpositioned(TokenDefinition definition, std::string value) {
    return create(std::move(definition), std::move(value),
                  TokenPosition::unpositioned(), TokenPosition::unpositioned());
}

TokenPtr SimpleToken::of(const std::string& value) {
    return std::make_shared<SimpleToken>(Key{}, TokenDefinition::literal(value), value,
                                         TokenPosition::unpositioned(),
                                         TokenPosition::unpositioned());
}

// ---------------------------------------------------------------------------
// EscapedToken
// ---------------------------------------------------------------------------

EscapedToken::EscapedToken(Key, TokenDefinition definition, std::string value,
                           TokenPosition start)
    : definition_(std::move(definition)), value_(std::move(value)),
      start_(start), end_(start) {
    if (start_.is_positioned()) {
        end_.character += 1;
        end_.absolute += 1;
    }
}

Result<TokenPtr> EscapedToken::create(TokenDefinition definition, std::string value,
                                      TokenPosition start) {
    if (value.size() != 2 || value[0] != '\\') {
        return WeftError{WeftError::InvalidArg,
            "escaped token must be a backslash followed by one character, got '" +
            value + "'"};
    }
    if (!definition.matches(value)) {
        return rejected_value(definition, value);
    }
    return Result<TokenPtr>::ok(std::make_shared<EscapedToken>(
        Key{}, std::move(definition), std::move(value), start));
}

// ---------------------------------------------------------------------------
// TokenGroup
// ---------------------------------------------------------------------------

TokenGroup::TokenGroup(Key, TokenList tokens, TokenDefinition definition, std::string value)
    : tokens_(std::move(tokens)), definition_(std::move(definition)),
      value_(std::move(value)) {}

Result<TokenPtr> TokenGroup::create(TokenList tokens, TokenDefinition definition) {
    if (tokens.size() < 2) {
        return WeftError{WeftError::InvalidArg,
            "token group needs at least two tokens, got " +
            std::to_string(tokens.size())};
    }
    if (std::any_of(tokens.begin(), tokens.end(),
                    [](const TokenPtr& t) { return !t; })) {
        return WeftError{WeftError::InvalidArg, "token group contains a null token"};
    }
    std::string value = join_values(tokens);
    if (!definition.matches(value)) {
        return rejected_value(definition, value);
    }
    return Result<TokenPtr>::ok(std::make_shared<TokenGroup>(
        Key{}, std::move(tokens), std::move(definition), std::move(value)));
}

Result<TokenPtr> TokenGroup::create(TokenList tokens) {
    std::string value;
    for (const auto& t : tokens) {
        if (t) value += t->value();
    }
    TokenDefinition def("group",
        [value](const std::string& v) { return v == value; });
    return create(std::move(tokens), std::move(def));
}

TokenPosition TokenGroup::start() const {
    return tokens_.front()->start();
}

TokenPosition TokenGroup::end() const {
    return tokens_.back()->end();
}

bool TokenGroup::equals(const Token& o) const {
    auto other = o.as_group();
    return o.kind() == TokenKind::Group && other &&
           same_tokens(tokens_, other->tokens_);
}

// ---------------------------------------------------------------------------
// Decorators
// ---------------------------------------------------------------------------

AnnotatedToken::AnnotatedToken(Key, TokenPtr token, TokenMetadata metadata)
    : token_(std::move(token)), metadata_(std::move(metadata)) {}

Result<TokenPtr> AnnotatedToken::create(TokenPtr token, TokenMetadata metadata) {
    if (!token) {
        return WeftError{WeftError::InvalidArg, "cannot annotate a null token"};
    }
    return Result<TokenPtr>::ok(std::make_shared<AnnotatedToken>(
        Key{}, std::move(token), std::move(metadata)));
}

bool AnnotatedToken::equals(const Token& o) const {
    if (o.kind() != TokenKind::Annotated) return false;
    auto& other = static_cast<const AnnotatedToken&>(o);
    return metadata_ == other.metadata_ && token_->equals(*other.token_);
}

std::string AnnotatedToken::get(const std::string& key) const {
    auto it = metadata_.find(key);
    return it == metadata_.end() ? std::string() : it->second;
}

IndexedToken::IndexedToken(Key, TokenPtr token, int index)
    : token_(std::move(token)), index_(index) {}

Result<TokenPtr> IndexedToken::create(TokenPtr token, int index) {
    if (!token) {
        return WeftError{WeftError::InvalidArg, "cannot index a null token"};
    }
    if (index < 0) {
        return WeftError{WeftError::InvalidArg,
            "token index must not be negative, got " + std::to_string(index)};
    }
    return Result<TokenPtr>::ok(std::make_shared<IndexedToken>(Key{}, std::move(token), index));
}

bool IndexedToken::equals(const Token& o) const {
    if (o.kind() != TokenKind::Indexed) return false;
    auto& other = static_cast<const IndexedToken&>(o);
    return index_ == other.index_ && token_->equals(*other.token_);
}

} // namespace weft
