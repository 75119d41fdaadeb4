#pragma once

#include <catch2/catch.hpp>
#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <weft/rule/context.hpp>
#include <weft/rule/rule.hpp>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace weft::testing {

// Value of an Ok result; fails the running test case on Err.
template<typename T>
T unwrap(Result<T> r) {
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

inline TokenList tokens_of(std::initializer_list<const char*> values) {
    TokenList out;
    for (const char* v : values) out.push_back(SimpleToken::of(v));
    return out;
}

inline std::vector<std::string> values_of(const TokenList& tokens) {
    std::vector<std::string> out;
    for (const auto& t : tokens) out.push_back(t->value());
    return out;
}

// Match `rule` at `index` with a fresh context.
inline std::optional<TokenRuleMatch> match_at(const TokenRulePtr& rule,
                                              const TokenList& tokens,
                                              std::size_t index = 0) {
    TokenRuleContext ctx;
    auto stream = unwrap(TokenStream::at(tokens, index));
    return rule->match(stream, ctx);
}

} // namespace weft::testing
