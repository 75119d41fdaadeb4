#include <weft/lang/stream.hpp>
#include <algorithm>

namespace weft {

TokenStream::TokenStream(const TokenList& tokens)
    : tokens_(&tokens), pos_(0) {}

TokenStream::TokenStream(const TokenList& tokens, std::size_t index)
    : tokens_(&tokens), pos_(index) {}

Result<TokenStream> TokenStream::at(const TokenList& tokens, std::size_t index) {
    if (index > tokens.size()) {
        return WeftError{WeftError::OutOfRange,
            "stream index " + std::to_string(index) +
            " is outside [0, " + std::to_string(tokens.size()) + "]"};
    }
    return Result<TokenStream>::ok(TokenStream(tokens, index));
}

Result<TokenPtr> TokenStream::current() const {
    if (!has_more()) {
        return WeftError{WeftError::OutOfRange,
            "no current token at index " + std::to_string(pos_) +
            " of " + std::to_string(size())};
    }
    return Result<TokenPtr>::ok((*tokens_)[pos_]);
}

TokenPtr TokenStream::peek(std::size_t offset) const {
    std::size_t idx = pos_ + offset;
    if (idx >= tokens_->size()) return nullptr;
    return (*tokens_)[idx];
}

TokenPtr TokenStream::previous() const {
    if (pos_ == 0 || pos_ > tokens_->size()) return nullptr;
    return (*tokens_)[pos_ - 1];
}

Status TokenStream::advance(std::size_t count) {
    if (count > tokens_->size() - pos_) {
        return WeftError{WeftError::OutOfRange,
            "cannot advance " + std::to_string(count) + " tokens from index " +
            std::to_string(pos_) + " of " + std::to_string(size())};
    }
    pos_ += count;
    return ok_status();
}

void TokenStream::commit(const TokenStream& probe) {
    if (probe.tokens_ != tokens_ || probe.pos_ < pos_) return;
    pos_ = probe.pos_;
}

TokenList TokenStream::slice(std::size_t from, std::size_t to) const {
    to = std::min(to, tokens_->size());
    if (from >= to) return {};
    return TokenList(tokens_->begin() + static_cast<std::ptrdiff_t>(from),
                     tokens_->begin() + static_cast<std::ptrdiff_t>(to));
}

} // namespace weft
