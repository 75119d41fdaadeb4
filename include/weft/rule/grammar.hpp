#pragma once

#include <weft/config.hpp>
#include <weft/result.hpp>
#include <weft/rule/action.hpp>
#include <weft/rule/context.hpp>
#include <weft/rule/engine.hpp>
#include <string>
#include <vector>

namespace weft {

// Sealed set of active rules plus the named rules they refer to. parse()
// works on private copies, so one grammar can serve concurrent callers.
class Grammar {
public:
    Result<TokenList> parse(const TokenList& tokens) const;

    const std::vector<RuleBinding>& rules() const { return rules_; }
    const TokenRuleContext& context() const { return context_; }

private:
    friend class GrammarBuilder;
    Grammar(std::vector<RuleBinding> rules, TokenRuleContext context);

    std::vector<RuleBinding> rules_;
    TokenRuleContext context_;
};

class GrammarBuilder {
public:
    GrammarBuilder() = default;

    // Named rule for Recursive/Reference lookups. Not tried by the engine.
    Status define(const std::string& name, TokenRulePtr rule);

    // Active rule. With `wrap` set and a grouping action, the rule is
    // extended so that spans this grammar already grouped match again.
    Status add_rule(TokenRulePtr rule, TokenActionPtr action = actions::identity(),
                    bool wrap = true);

    void set_options(const EngineOptions& options);

    // NotFound when a rule-type reference names an undefined rule. The
    // builder is empty afterwards.
    Result<Grammar> build();

private:
    std::vector<RuleBinding> rules_;
    TokenRuleContext context_;
};

} // namespace weft
