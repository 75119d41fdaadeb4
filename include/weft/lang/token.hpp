#pragma once

#include <weft/result.hpp>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace weft {

// Zero-based source position. Default-constructed positions are unpositioned.
struct TokenPosition {
    int line = -1;
    int character = -1;
    int absolute = -1;

    static TokenPosition unpositioned() { return TokenPosition{}; }
    static Result<TokenPosition> create(int line, int character, int absolute);

    bool is_positioned() const { return line >= 0; }
    std::string to_string() const;

    bool operator==(const TokenPosition& o) const;
    bool operator!=(const TokenPosition& o) const;
};

// Named predicate classifying token values.
class TokenDefinition {
public:
    using Predicate = std::function<bool(const std::string&)>;

    TokenDefinition(std::string name, Predicate predicate);

    static TokenDefinition literal(const std::string& text, bool ignore_case = false);
    static Result<TokenDefinition> pattern(const std::string& regex);
    static TokenDefinition any();

    const std::string& name() const { return name_; }
    bool matches(const std::string& value) const;

private:
    std::string name_;
    Predicate predicate_;
};

enum class TokenKind {
    Simple,
    Escaped,
    Group,
    Annotated,
    Indexed
};

const char* token_kind_name(TokenKind k);

class Token;
class TokenGroup;

using TokenPtr = std::shared_ptr<const Token>;
using TokenList = std::vector<TokenPtr>;

// ---------------------------------------------------------------------------
// Token: immutable lexical unit. Every factory checks that the definition
// accepts the value.
// ---------------------------------------------------------------------------

class Token {
public:
    virtual ~Token() = default;

    virtual TokenKind kind() const = 0;
    virtual const TokenDefinition& definition() const = 0;
    virtual const std::string& value() const = 0;
    virtual TokenPosition start() const = 0;
    virtual TokenPosition end() const = 0;

    bool is_positioned() const;

    // The composite view of this token, looking through decorators.
    virtual const TokenGroup* as_group() const { return nullptr; }

    // Structural equality; decorators and groups compare their contents.
    virtual bool equals(const Token& o) const;

    std::string to_string() const;
};

bool operator==(const Token& a, const Token& b);
bool operator!=(const Token& a, const Token& b);

// Element-wise equality of two token lists (by value, not by pointer).
bool same_tokens(const TokenList& a, const TokenList& b);

// Concatenated values of all tokens.
std::string join_values(const TokenList& tokens);

class SimpleToken : public Token {
    // Constructor tag only the factories can name.
    struct Key {
        explicit Key() = default;
    };

public:
    SimpleToken(Key, TokenDefinition definition, std::string value,
                TokenPosition start, TokenPosition end);

    static Result<TokenPtr> create(TokenDefinition definition, std::string value,
                                   TokenPosition start, TokenPosition end);
    // End position is derived from the start and the value length.
    static Result<TokenPtr> create(TokenDefinition definition, std::string value,
                                   TokenPosition start);
    static Result<TokenPtr> unpositioned(TokenDefinition definition, std::string value);

    // Unpositioned token classified by a literal definition of its own value.
    static TokenPtr of(const std::string& value);

    TokenKind kind() const override { return TokenKind::Simple; }
    const TokenDefinition& definition() const override { return definition_; }
    const std::string& value() const override { return value_; }
    TokenPosition start() const override { return start_; }
    TokenPosition end() const override { return end_; }

private:
    TokenDefinition definition_;
    std::string value_;
    TokenPosition start_;
    TokenPosition end_;
};

// A backslash followed by exactly one character, e.g. "\n" as two chars.
class EscapedToken : public Token {
    struct Key {
        explicit Key() = default;
    };

public:
    EscapedToken(Key, TokenDefinition definition, std::string value,
                 TokenPosition start);

    static Result<TokenPtr> create(TokenDefinition definition, std::string value,
                                   TokenPosition start);

    TokenKind kind() const override { return TokenKind::Escaped; }
    const TokenDefinition& definition() const override { return definition_; }
    const std::string& value() const override { return value_; }
    TokenPosition start() const override { return start_; }
    TokenPosition end() const override { return end_; }

    // The escaped character itself.
    char escaped() const { return value_[1]; }

private:
    TokenDefinition definition_;
    std::string value_;
    TokenPosition start_;
    TokenPosition end_;
};

// Composite over two or more sub-tokens.
class TokenGroup : public Token {
    struct Key {
        explicit Key() = default;
    };

public:
    TokenGroup(Key, TokenList tokens, TokenDefinition definition, std::string value);

    static Result<TokenPtr> create(TokenList tokens, TokenDefinition definition);
    // Definition accepting exactly the concatenated value.
    static Result<TokenPtr> create(TokenList tokens);

    TokenKind kind() const override { return TokenKind::Group; }
    const TokenDefinition& definition() const override { return definition_; }
    const std::string& value() const override { return value_; }
    TokenPosition start() const override;
    TokenPosition end() const override;

    const TokenGroup* as_group() const override { return this; }
    bool equals(const Token& o) const override;

    const TokenList& tokens() const { return tokens_; }

private:
    TokenList tokens_;
    TokenDefinition definition_;
    std::string value_;
};

using TokenMetadata = std::map<std::string, std::string>;

class AnnotatedToken : public Token {
    struct Key {
        explicit Key() = default;
    };

public:
    AnnotatedToken(Key, TokenPtr token, TokenMetadata metadata);

    static Result<TokenPtr> create(TokenPtr token, TokenMetadata metadata);

    TokenKind kind() const override { return TokenKind::Annotated; }
    const TokenDefinition& definition() const override { return token_->definition(); }
    const std::string& value() const override { return token_->value(); }
    TokenPosition start() const override { return token_->start(); }
    TokenPosition end() const override { return token_->end(); }

    const TokenGroup* as_group() const override { return token_->as_group(); }
    bool equals(const Token& o) const override;

    const TokenPtr& token() const { return token_; }
    const TokenMetadata& metadata() const { return metadata_; }
    // Empty string when the key is absent.
    std::string get(const std::string& key) const;

private:
    TokenPtr token_;
    TokenMetadata metadata_;
};

class IndexedToken : public Token {
    struct Key {
        explicit Key() = default;
    };

public:
    IndexedToken(Key, TokenPtr token, int index);

    static Result<TokenPtr> create(TokenPtr token, int index);

    TokenKind kind() const override { return TokenKind::Indexed; }
    const TokenDefinition& definition() const override { return token_->definition(); }
    const std::string& value() const override { return token_->value(); }
    TokenPosition start() const override { return token_->start(); }
    TokenPosition end() const override { return token_->end(); }

    const TokenGroup* as_group() const override { return token_->as_group(); }
    bool equals(const Token& o) const override;

    const TokenPtr& token() const { return token_; }
    int index() const { return index_; }

private:
    TokenPtr token_;
    int index_;
};

} // namespace weft
