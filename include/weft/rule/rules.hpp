#pragma once

#include <weft/result.hpp>
#include <weft/rule/context.hpp>
#include <weft/rule/rule.hpp>
#include <climits>
#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <vector>

namespace weft {

// ---------------------------------------------------------------------------
// Rule variants. Construct them through the weft::rules factories, which
// validate parameters and hand out shared ownership.
// ---------------------------------------------------------------------------

// AlwaysMatch and NeverMatch negate to each other.
class AlwaysMatchTokenRule : public TokenRule {
public:
    explicit AlwaysMatchTokenRule(TokenRulePtr negation_of = nullptr);

    RuleKind kind() const override { return RuleKind::AlwaysMatch; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    TokenRulePtr negate() const override;

private:
    TokenRulePtr negation_of_;
};

class NeverMatchTokenRule : public TokenRule {
public:
    explicit NeverMatchTokenRule(TokenRulePtr negation_of = nullptr);

    RuleKind kind() const override { return RuleKind::NeverMatch; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    TokenRulePtr negate() const override;

private:
    TokenRulePtr negation_of_;
};

// Base of the matchers that test exactly one token.
class SingleTokenRule : public TokenRule {
public:
    virtual bool accepts(const Token& token) const = 0;

    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    // Consumes one token wherever this rule rejects it.
    TokenRulePtr negate() const override;
};

class AnyTokenRule : public SingleTokenRule {
public:
    RuleKind kind() const override { return RuleKind::AnyToken; }
    bool accepts(const Token&) const override { return true; }
};

class ValueTokenRule : public SingleTokenRule {
public:
    ValueTokenRule(std::string value, bool ignore_case);

    RuleKind kind() const override { return RuleKind::Value; }
    bool accepts(const Token& token) const override;

    const std::string& value() const { return value_; }
    bool ignore_case() const { return ignore_case_; }

private:
    std::string value_;
    bool ignore_case_;
};

class PatternTokenRule : public SingleTokenRule {
public:
    PatternTokenRule(std::string source, std::regex regex);

    RuleKind kind() const override { return RuleKind::Pattern; }
    bool accepts(const Token& token) const override;

    const std::string& source() const { return source_; }

private:
    std::string source_;
    std::regex regex_;
};

class LengthTokenRule : public SingleTokenRule {
public:
    LengthTokenRule(std::size_t min, std::size_t max);

    RuleKind kind() const override { return RuleKind::Length; }
    bool accepts(const Token& token) const override;

private:
    std::size_t min_;
    std::size_t max_;
};

class CustomTokenRule : public SingleTokenRule {
public:
    using Predicate = std::function<bool(const Token&)>;

    explicit CustomTokenRule(Predicate predicate);

    RuleKind kind() const override { return RuleKind::Custom; }
    bool accepts(const Token& token) const override;

private:
    Predicate predicate_;
};

// Inverse of another rule. Single-token inversions consume the rejected
// token; all others are zero-width assertions.
class NegatedTokenRule : public TokenRule {
public:
    NegatedTokenRule(TokenRulePtr original, bool single_token);

    RuleKind kind() const override { return RuleKind::Negated; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    TokenRulePtr negate() const override { return original_; }
    std::vector<TokenRulePtr> children() const override { return {original_}; }

    const TokenRulePtr& original() const { return original_; }
    bool single_token() const { return single_token_; }

private:
    TokenRulePtr original_;
    bool single_token_;
};

class SequenceTokenRule : public TokenRule {
public:
    explicit SequenceTokenRule(std::vector<TokenRulePtr> rules);

    RuleKind kind() const override { return RuleKind::Sequence; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return rules_; }

private:
    std::vector<TokenRulePtr> rules_;
};

class AnyOfTokenRule : public TokenRule {
public:
    explicit AnyOfTokenRule(std::vector<TokenRulePtr> rules);

    RuleKind kind() const override { return RuleKind::AnyOf; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return rules_; }

    const std::vector<TokenRulePtr>& alternatives() const { return rules_; }

private:
    std::vector<TokenRulePtr> rules_;
};

class AllOfTokenRule : public TokenRule {
public:
    explicit AllOfTokenRule(std::vector<TokenRulePtr> rules);

    RuleKind kind() const override { return RuleKind::AllOf; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return rules_; }

private:
    std::vector<TokenRulePtr> rules_;
};

class OptionalTokenRule : public TokenRule {
public:
    // `negation_of` is the rule this one was negated from, if any.
    OptionalTokenRule(TokenRulePtr rule, TokenRulePtr negation_of = nullptr);

    RuleKind kind() const override { return RuleKind::Optional; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    TokenRulePtr negate() const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    const TokenRulePtr& rule() const { return rule_; }

private:
    TokenRulePtr rule_;
    TokenRulePtr negation_of_;
};

class RepeatedTokenRule : public TokenRule {
public:
    static constexpr int UNBOUNDED = INT_MAX;

    RepeatedTokenRule(TokenRulePtr rule, int min, int max,
                      TokenRulePtr negation_of = nullptr);

    RuleKind kind() const override { return RuleKind::Repeated; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    TokenRulePtr negate() const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    const TokenRulePtr& rule() const { return rule_; }
    int min() const { return min_; }
    int max() const { return max_; }

private:
    TokenRulePtr rule_;
    int min_;
    int max_;
    TokenRulePtr negation_of_;
};

enum class LookMode { Positive, Negative };

class LookaheadTokenRule : public TokenRule {
public:
    LookaheadTokenRule(TokenRulePtr rule, LookMode mode);

    RuleKind kind() const override { return RuleKind::Lookahead; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    LookMode mode() const { return mode_; }

private:
    TokenRulePtr rule_;
    LookMode mode_;
};

// Succeeds (Positive) when some match of the rule ends exactly at the
// current index. Every earlier start is tried, nearest first.
class LookbehindTokenRule : public TokenRule {
public:
    LookbehindTokenRule(TokenRulePtr rule, LookMode mode);

    RuleKind kind() const override { return RuleKind::Lookbehind; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    LookMode mode() const { return mode_; }

private:
    TokenRulePtr rule_;
    LookMode mode_;
};

enum class AnchorKind { Start, End };
enum class AnchorScope { Document, Line };

class AnchorTokenRule : public TokenRule {
public:
    AnchorTokenRule(AnchorKind kind, AnchorScope scope);

    RuleKind kind() const override { return RuleKind::Anchor; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;

    AnchorKind anchor() const { return anchor_; }
    AnchorScope scope() const { return scope_; }

private:
    bool holds(const TokenStream& stream) const;

    AnchorKind anchor_;
    AnchorScope scope_;
};

// open, then body repeatedly until close matches, then close. Close is
// tried before body at each step. Running out of tokens or a body match
// that consumes nothing fails the whole rule.
class BoundaryTokenRule : public TokenRule {
public:
    BoundaryTokenRule(TokenRulePtr open, TokenRulePtr body, TokenRulePtr close);

    RuleKind kind() const override { return RuleKind::Boundary; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override {
        return {open_, body_, close_};
    }

private:
    TokenRulePtr open_;
    TokenRulePtr body_;
    TokenRulePtr close_;
};

// Named rule or captured tokens, resolved through the context at match
// time. Holding the name rather than the rule keeps recursive grammars free
// of ownership cycles.
class ReferenceTokenRule : public TokenRule {
public:
    ReferenceTokenRule(std::string name, ReferenceType type);

    RuleKind kind() const override { return RuleKind::Reference; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;

    const std::string& name() const { return name_; }
    ReferenceType type() const { return type_; }

private:
    std::optional<TokenRuleMatch> match_rule(const TokenRulePtr& rule,
                                             TokenStream& stream,
                                             TokenRuleContext& ctx) const;
    std::optional<TokenRuleMatch> match_tokens(const TokenList& captured,
                                               TokenStream& stream) const;

    std::string name_;
    ReferenceType type_;
};

class CaptureTokenRule : public TokenRule {
public:
    CaptureTokenRule(std::string name, TokenRulePtr rule);

    RuleKind kind() const override { return RuleKind::Capture; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    TokenRulePtr rule_;
};

// One TokenGroup token whose sub-tokens match the inner rule from their
// first token. Also marks a rule as group-aware for the grammar builder.
class GroupTokenRule : public TokenRule {
public:
    explicit GroupTokenRule(TokenRulePtr rule, TokenRulePtr negation_of = nullptr);

    RuleKind kind() const override { return RuleKind::Group; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext& ctx) const override;
    // A group token whose contents fail the inner rule.
    TokenRulePtr negate() const override;
    std::vector<TokenRulePtr> children() const override { return {rule_}; }

    const TokenRulePtr& rule() const { return rule_; }

private:
    TokenRulePtr rule_;
    TokenRulePtr negation_of_;
};

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------

namespace rules {

TokenRulePtr always_match();
TokenRulePtr never_match();
TokenRulePtr any_token();

TokenRulePtr value(const std::string& text, bool ignore_case = false);
Result<TokenRulePtr> pattern(const std::string& regex);
Result<TokenRulePtr> length(int min, int max);
Result<TokenRulePtr> min_length(int min);
Result<TokenRulePtr> max_length(int max);
Result<TokenRulePtr> exact_length(int n);
Result<TokenRulePtr> custom(CustomTokenRule::Predicate predicate);

Result<TokenRulePtr> negate(const TokenRulePtr& rule);

Result<TokenRulePtr> sequence(std::vector<TokenRulePtr> rules);
Result<TokenRulePtr> any_of(std::vector<TokenRulePtr> rules);
Result<TokenRulePtr> all_of(std::vector<TokenRulePtr> rules);

Result<TokenRulePtr> optional(TokenRulePtr rule);
Result<TokenRulePtr> repeated(TokenRulePtr rule, int min, int max);
Result<TokenRulePtr> at_least(TokenRulePtr rule, int min);
Result<TokenRulePtr> at_most(TokenRulePtr rule, int max);
Result<TokenRulePtr> exactly(TokenRulePtr rule, int n);
Result<TokenRulePtr> zero_or_more(TokenRulePtr rule);
Result<TokenRulePtr> one_or_more(TokenRulePtr rule);

Result<TokenRulePtr> lookahead(TokenRulePtr rule);
Result<TokenRulePtr> negative_lookahead(TokenRulePtr rule);
Result<TokenRulePtr> lookbehind(TokenRulePtr rule);
Result<TokenRulePtr> negative_lookbehind(TokenRulePtr rule);

TokenRulePtr start_document();
TokenRulePtr end_document();
TokenRulePtr start_line();
TokenRulePtr end_line();

Result<TokenRulePtr> boundary(TokenRulePtr open, TokenRulePtr close);
Result<TokenRulePtr> boundary(TokenRulePtr open, TokenRulePtr body, TokenRulePtr close);

// Reference of type Rule; the usual way to express recursion.
Result<TokenRulePtr> recursive(const std::string& name);
Result<TokenRulePtr> reference(const std::string& name,
                               ReferenceType type = ReferenceType::Dynamic);

Result<TokenRulePtr> capture(const std::string& name, TokenRulePtr rule);
Result<TokenRulePtr> group(TokenRulePtr rule);

} // namespace rules

} // namespace weft
