#pragma once

#include <weft/lang/stream.hpp>
#include <weft/lang/token.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace weft {

class TokenRule;
class TokenRuleContext;

using TokenRulePtr = std::shared_ptr<const TokenRule>;

// Successful match of a rule. Consuming matches carry end - start tokens;
// zero-width matches have start == end and no tokens.
struct TokenRuleMatch {
    std::size_t start = 0;
    std::size_t end = 0;
    TokenList tokens;
    TokenRulePtr rule;

    static TokenRuleMatch empty(std::size_t index, TokenRulePtr rule);

    bool is_zero_width() const { return start == end; }
    std::size_t length() const { return end - start; }
};

enum class RuleKind {
    AlwaysMatch,
    NeverMatch,
    AnyToken,
    Value,
    Pattern,
    Length,
    Custom,
    Negated,
    Sequence,
    AnyOf,
    AllOf,
    Optional,
    Repeated,
    Lookahead,
    Lookbehind,
    Anchor,
    Boundary,
    Reference,
    Capture,
    Group
};

const char* rule_kind_name(RuleKind k);

// ---------------------------------------------------------------------------
// TokenRule: one matcher over a token stream.
//
// match() either returns a match and leaves the stream at match.end, or
// returns nullopt and leaves the stream untouched. Rules are immutable and
// must be owned by a shared_ptr (negate() hands out shared_from_this()).
// ---------------------------------------------------------------------------

class TokenRule : public std::enable_shared_from_this<TokenRule> {
public:
    virtual ~TokenRule() = default;

    virtual RuleKind kind() const = 0;

    virtual std::optional<TokenRuleMatch> match(TokenStream& stream,
                                                TokenRuleContext& ctx) const = 0;

    // Rule with the opposite outcome. The default is a zero-width assertion
    // that succeeds where this rule fails. negate()->negate() is this rule.
    virtual TokenRulePtr negate() const;

    // Direct sub-rules, for structural walks over a grammar.
    virtual std::vector<TokenRulePtr> children() const { return {}; }

protected:
    TokenRulePtr self() const { return shared_from_this(); }

    // Consume the token under the cursor as a one-token match of this rule.
    std::optional<TokenRuleMatch> consume_one(TokenStream& stream) const;
    // Match covering [start, probe.index()) after committing the probe.
    TokenRuleMatch commit_span(TokenStream& stream, const TokenStream& probe,
                               std::size_t start) const;
};

} // namespace weft
