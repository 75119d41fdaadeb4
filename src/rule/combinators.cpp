#include <weft/rule/rules.hpp>

namespace weft {

// ---------------------------------------------------------------------------
// Sequence / AnyOf / AllOf
// ---------------------------------------------------------------------------

SequenceTokenRule::SequenceTokenRule(std::vector<TokenRulePtr> rules)
    : rules_(std::move(rules)) {}

std::optional<TokenRuleMatch> SequenceTokenRule::match(TokenStream& stream,
                                                       TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    for (const auto& rule : rules_) {
        if (!rule->match(probe, ctx)) return std::nullopt;
    }
    return commit_span(stream, probe, start);
}

AnyOfTokenRule::AnyOfTokenRule(std::vector<TokenRulePtr> rules)
    : rules_(std::move(rules)) {}

std::optional<TokenRuleMatch> AnyOfTokenRule::match(TokenStream& stream,
                                                    TokenRuleContext& ctx) const {
    for (const auto& rule : rules_) {
        TokenStream probe = stream.lookahead();
        auto m = rule->match(probe, ctx);
        if (m) {
            stream.commit(probe);
            return m;
        }
    }
    return std::nullopt;
}

AllOfTokenRule::AllOfTokenRule(std::vector<TokenRulePtr> rules)
    : rules_(std::move(rules)) {}

std::optional<TokenRuleMatch> AllOfTokenRule::match(TokenStream& stream,
                                                    TokenRuleContext& ctx) const {
    std::size_t start = stream.index();
    TokenStream longest = stream.lookahead();
    for (const auto& rule : rules_) {
        TokenStream probe = stream.lookahead();
        if (!rule->match(probe, ctx)) return std::nullopt;
        if (probe.index() > longest.index()) longest = probe;
    }
    return commit_span(stream, longest, start);
}

// ---------------------------------------------------------------------------
// Optional / Repeated
// ---------------------------------------------------------------------------

OptionalTokenRule::OptionalTokenRule(TokenRulePtr rule, TokenRulePtr negation_of)
    : rule_(std::move(rule)), negation_of_(std::move(negation_of)) {}

std::optional<TokenRuleMatch> OptionalTokenRule::match(TokenStream& stream,
                                                       TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    if (rule_->match(probe, ctx)) return commit_span(stream, probe, start);
    return TokenRuleMatch::empty(start, self());
}

TokenRulePtr OptionalTokenRule::negate() const {
    if (negation_of_) return negation_of_;
    return std::make_shared<OptionalTokenRule>(rule_->negate(), self());
}

RepeatedTokenRule::RepeatedTokenRule(TokenRulePtr rule, int min, int max,
                                     TokenRulePtr negation_of)
    : rule_(std::move(rule)), min_(min), max_(max),
      negation_of_(std::move(negation_of)) {}

std::optional<TokenRuleMatch> RepeatedTokenRule::match(TokenStream& stream,
                                                       TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    int count = 0;
    while (count < max_) {
        TokenStream step = probe.lookahead();
        auto m = rule_->match(step, ctx);
        if (!m) break;
        probe.commit(step);
        ++count;
        // Further iterations would match the same empty span forever.
        if (m->is_zero_width()) break;
    }
    if (count < min_) return std::nullopt;
    return commit_span(stream, probe, start);
}

TokenRulePtr RepeatedTokenRule::negate() const {
    if (negation_of_) return negation_of_;
    return std::make_shared<RepeatedTokenRule>(rule_->negate(), min_, max_, self());
}

// ---------------------------------------------------------------------------
// Boundary
// ---------------------------------------------------------------------------

BoundaryTokenRule::BoundaryTokenRule(TokenRulePtr open, TokenRulePtr body,
                                     TokenRulePtr close)
    : open_(std::move(open)), body_(std::move(body)), close_(std::move(close)) {}

std::optional<TokenRuleMatch> BoundaryTokenRule::match(TokenStream& stream,
                                                       TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    if (!open_->match(probe, ctx)) return std::nullopt;

    for (;;) {
        TokenStream closing = probe.lookahead();
        if (close_->match(closing, ctx)) {
            probe.commit(closing);
            break;
        }
        if (!probe.has_more()) return std::nullopt;

        TokenStream inner = probe.lookahead();
        auto m = body_->match(inner, ctx);
        if (!m || m->is_zero_width()) return std::nullopt;
        probe.commit(inner);
    }
    return commit_span(stream, probe, start);
}

} // namespace weft
