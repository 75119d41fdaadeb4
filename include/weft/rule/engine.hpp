#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <weft/rule/action.hpp>
#include <weft/rule/context.hpp>
#include <weft/rule/rule.hpp>
#include <vector>

namespace weft {

struct RuleBinding {
    TokenRulePtr rule;
    TokenActionPtr action;
};

// ---------------------------------------------------------------------------
// TokenRuleEngine: one left-to-right pass over a token list.
//
// At every position the bound rules are tried in registration order and the
// first match is replaced by its action's output. Unmatched tokens are
// copied through. A zero-width match emits its output and then copies the
// current token, so each step consumes at least one token.
// ---------------------------------------------------------------------------

class TokenRuleEngine {
public:
    TokenRuleEngine() = default;
    explicit TokenRuleEngine(TokenRuleContext context);

    // InvalidArg for a null rule or action.
    Status add_rule(TokenRulePtr rule, TokenActionPtr action);

    const std::vector<RuleBinding>& rules() const { return rules_; }
    const TokenRuleContext& context() const { return context_; }

    // Each pass runs on its own copy of the context and returns a new list.
    Result<TokenList> process(const TokenList& tokens) const;

private:
    std::vector<RuleBinding> rules_;
    TokenRuleContext context_;
};

} // namespace weft
