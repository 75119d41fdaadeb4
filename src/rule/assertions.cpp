#include <weft/rule/rules.hpp>

namespace weft {

LookaheadTokenRule::LookaheadTokenRule(TokenRulePtr rule, LookMode mode)
    : rule_(std::move(rule)), mode_(mode) {}

std::optional<TokenRuleMatch> LookaheadTokenRule::match(TokenStream& stream,
                                                        TokenRuleContext& ctx) const {
    TokenStream probe = stream.lookahead();
    bool found = rule_->match(probe, ctx).has_value();
    if (found != (mode_ == LookMode::Positive)) return std::nullopt;
    return TokenRuleMatch::empty(stream.index(), self());
}

LookbehindTokenRule::LookbehindTokenRule(TokenRulePtr rule, LookMode mode)
    : rule_(std::move(rule)), mode_(mode) {}

std::optional<TokenRuleMatch> LookbehindTokenRule::match(TokenStream& stream,
                                                         TokenRuleContext& ctx) const {
    const std::size_t here = stream.index();
    bool found = false;
    for (std::size_t from = here + 1; from-- > 0 && !found;) {
        auto probe = TokenStream::at(stream.tokens(), from);
        if (probe.is_err()) continue;
        auto m = rule_->match(probe.value(), ctx);
        found = m && m->end == here;
    }
    if (found != (mode_ == LookMode::Positive)) return std::nullopt;
    return TokenRuleMatch::empty(here, self());
}

// ---------------------------------------------------------------------------
// Anchors
// ---------------------------------------------------------------------------

AnchorTokenRule::AnchorTokenRule(AnchorKind kind, AnchorScope scope)
    : anchor_(kind), scope_(scope) {}

static bool ends_with_newline(const TokenPtr& token) {
    return token && !token->value().empty() && token->value().back() == '\n';
}

bool AnchorTokenRule::holds(const TokenStream& stream) const {
    if (anchor_ == AnchorKind::Start) {
        if (stream.at_start()) return true;
        if (scope_ == AnchorScope::Document) return false;

        TokenPtr prev = stream.previous();
        if (ends_with_newline(prev)) return true;
        TokenPtr current = stream.peek();
        return current && prev->is_positioned() && current->is_positioned() &&
               current->start().line > prev->end().line;
    }

    if (!stream.has_more()) return true;
    if (scope_ == AnchorScope::Document) return false;

    TokenPtr current = stream.peek();
    if (current->value().find('\n') != std::string::npos) return true;
    TokenPtr next = stream.peek(1);
    return next && current->is_positioned() && next->is_positioned() &&
           next->start().line > current->end().line;
}

std::optional<TokenRuleMatch> AnchorTokenRule::match(TokenStream& stream,
                                                     TokenRuleContext&) const {
    if (!holds(stream)) return std::nullopt;
    return TokenRuleMatch::empty(stream.index(), self());
}

} // namespace weft
