#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <cstddef>

namespace weft {

// Cursor over a read-only token list. Copies share the list, so a copy is a
// free lookahead: probe on the copy, then commit() it or drop it.
// The list must outlive every stream created over it.
class TokenStream {
public:
    explicit TokenStream(const TokenList& tokens);

    // Stream positioned at `index`; index must lie in [0, size].
    static Result<TokenStream> at(const TokenList& tokens, std::size_t index);

    const TokenList& tokens() const { return *tokens_; }
    std::size_t index() const { return pos_; }
    std::size_t size() const { return tokens_->size(); }
    bool empty() const { return tokens_->empty(); }
    bool has_more() const { return pos_ < tokens_->size(); }
    bool at_start() const { return pos_ == 0; }

    // Token at the cursor; OutOfRange once the stream is exhausted.
    Result<TokenPtr> current() const;

    // Token `offset` positions ahead of the cursor, or null.
    TokenPtr peek(std::size_t offset = 0) const;
    // Token just before the cursor, or null at the start.
    TokenPtr previous() const;

    // Move forward by `count`; OutOfRange (and no movement) past the end.
    Status advance(std::size_t count = 1);

    // Independent cursor at the same position.
    TokenStream lookahead() const { return *this; }

    // Adopt the position of a probe obtained from lookahead(). Probes over a
    // different list or behind this cursor are ignored.
    void commit(const TokenStream& probe);

    void reset() { pos_ = 0; }

    // Tokens in [from, to), clamped to the list.
    TokenList slice(std::size_t from, std::size_t to) const;

private:
    TokenStream(const TokenList& tokens, std::size_t index);

    const TokenList* tokens_;
    std::size_t pos_;
};

} // namespace weft
