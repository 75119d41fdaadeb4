#include <weft/rule/rules.hpp>
#include <weft/log.hpp>

namespace weft {

// ---------------------------------------------------------------------------
// Reference
// ---------------------------------------------------------------------------

namespace {

// Pairs TokenRuleContext::enter() with leave().
class DepthGuard {
public:
    explicit DepthGuard(TokenRuleContext& ctx) : ctx_(ctx), entered_(ctx.enter()) {}
    ~DepthGuard() { if (entered_) ctx_.leave(); }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

    explicit operator bool() const { return entered_; }

private:
    TokenRuleContext& ctx_;
    bool entered_;
};

} // namespace

ReferenceTokenRule::ReferenceTokenRule(std::string name, ReferenceType type)
    : name_(std::move(name)), type_(type) {}

std::optional<TokenRuleMatch> ReferenceTokenRule::match(TokenStream& stream,
                                                        TokenRuleContext& ctx) const {
    if (type_ != ReferenceType::Tokens) {
        if (auto rule = ctx.rule_reference(name_)) {
            return match_rule(rule, stream, ctx);
        }
        if (type_ == ReferenceType::Rule) {
            log::trace("reference '%s' names no rule", name_.c_str());
            return std::nullopt;
        }
    }
    const TokenList* captured = ctx.captured_tokens(name_);
    if (!captured) return std::nullopt;
    return match_tokens(*captured, stream);
}

std::optional<TokenRuleMatch> ReferenceTokenRule::match_rule(const TokenRulePtr& rule,
                                                             TokenStream& stream,
                                                             TokenRuleContext& ctx) const {
    DepthGuard guard(ctx);
    if (!guard) return std::nullopt;

    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    if (!rule->match(probe, ctx)) return std::nullopt;
    return commit_span(stream, probe, start);
}

// Captured tokens match by value, one stream token each.
std::optional<TokenRuleMatch> ReferenceTokenRule::match_tokens(const TokenList& captured,
                                                               TokenStream& stream) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    for (const auto& want : captured) {
        TokenPtr got = probe.peek();
        if (!got || got->value() != want->value()) return std::nullopt;
        if (probe.advance().is_err()) return std::nullopt;
    }
    return commit_span(stream, probe, start);
}

// ---------------------------------------------------------------------------
// Capture
// ---------------------------------------------------------------------------

CaptureTokenRule::CaptureTokenRule(std::string name, TokenRulePtr rule)
    : name_(std::move(name)), rule_(std::move(rule)) {}

std::optional<TokenRuleMatch> CaptureTokenRule::match(TokenStream& stream,
                                                      TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    std::size_t start = probe.index();
    if (!rule_->match(probe, ctx)) return std::nullopt;
    auto m = commit_span(stream, probe, start);
    ctx.capture_tokens(name_, m.tokens);
    return m;
}

// ---------------------------------------------------------------------------
// Group
// ---------------------------------------------------------------------------

GroupTokenRule::GroupTokenRule(TokenRulePtr rule, TokenRulePtr negation_of)
    : rule_(std::move(rule)), negation_of_(std::move(negation_of)) {}

TokenRulePtr GroupTokenRule::negate() const {
    if (negation_of_) return negation_of_;
    return std::make_shared<GroupTokenRule>(rule_->negate(), self());
}

std::optional<TokenRuleMatch> GroupTokenRule::match(TokenStream& stream,
                                                    TokenRuleContext& ctx) const {
    TokenPtr token = stream.peek();
    if (!token) return std::nullopt;
    const TokenGroup* group = token->as_group();
    if (!group) return std::nullopt;

    TokenStream inner(group->tokens());
    if (!rule_->match(inner, ctx)) return std::nullopt;
    return consume_one(stream);
}

} // namespace weft
