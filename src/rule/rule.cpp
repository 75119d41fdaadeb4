#include <weft/rule/rules.hpp>
#include <cctype>

namespace weft {

TokenRuleMatch TokenRuleMatch::empty(std::size_t index, TokenRulePtr rule) {
    return TokenRuleMatch{index, index, {}, std::move(rule)};
}

const char* rule_kind_name(RuleKind k) {
    switch (k) {
    case RuleKind::AlwaysMatch: return "always-match";
    case RuleKind::NeverMatch:  return "never-match";
    case RuleKind::AnyToken:    return "any-token";
    case RuleKind::Value:       return "value";
    case RuleKind::Pattern:     return "pattern";
    case RuleKind::Length:      return "length";
    case RuleKind::Custom:      return "custom";
    case RuleKind::Negated:     return "negated";
    case RuleKind::Sequence:    return "sequence";
    case RuleKind::AnyOf:       return "any-of";
    case RuleKind::AllOf:       return "all-of";
    case RuleKind::Optional:    return "optional";
    case RuleKind::Repeated:    return "repeated";
    case RuleKind::Lookahead:   return "lookahead";
    case RuleKind::Lookbehind:  return "lookbehind";
    case RuleKind::Anchor:      return "anchor";
    case RuleKind::Boundary:    return "boundary";
    case RuleKind::Reference:   return "reference";
    case RuleKind::Capture:     return "capture";
    case RuleKind::Group:       return "group";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// TokenRule
// ---------------------------------------------------------------------------

TokenRulePtr TokenRule::negate() const {
    return std::make_shared<NegatedTokenRule>(self(), false);
}

std::optional<TokenRuleMatch> TokenRule::consume_one(TokenStream& stream) const {
    auto token = stream.current();
    if (token.is_err()) return std::nullopt;
    std::size_t start = stream.index();
    if (stream.advance().is_err()) return std::nullopt;
    return TokenRuleMatch{start, stream.index(), {std::move(token).value()}, self()};
}

TokenRuleMatch TokenRule::commit_span(TokenStream& stream, const TokenStream& probe,
                                      std::size_t start) const {
    stream.commit(probe);
    return TokenRuleMatch{start, probe.index(), probe.slice(start, probe.index()),
                          self()};
}

AlwaysMatchTokenRule::AlwaysMatchTokenRule(TokenRulePtr negation_of)
    : negation_of_(std::move(negation_of)) {}

TokenRulePtr AlwaysMatchTokenRule::negate() const {
    if (negation_of_) return negation_of_;
    return std::make_shared<NeverMatchTokenRule>(self());
}

std::optional<TokenRuleMatch> AlwaysMatchTokenRule::match(TokenStream& stream,
                                                          TokenRuleContext&) const {
    return TokenRuleMatch::empty(stream.index(), self());
}

NeverMatchTokenRule::NeverMatchTokenRule(TokenRulePtr negation_of)
    : negation_of_(std::move(negation_of)) {}

TokenRulePtr NeverMatchTokenRule::negate() const {
    if (negation_of_) return negation_of_;
    return std::make_shared<AlwaysMatchTokenRule>(self());
}

std::optional<TokenRuleMatch> NeverMatchTokenRule::match(TokenStream&,
                                                         TokenRuleContext&) const {
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Single-token matchers
// ---------------------------------------------------------------------------

std::optional<TokenRuleMatch> SingleTokenRule::match(TokenStream& stream,
                                                     TokenRuleContext&) const {
    auto token = stream.peek();
    if (!token || !accepts(*token)) return std::nullopt;
    return consume_one(stream);
}

TokenRulePtr SingleTokenRule::negate() const {
    return std::make_shared<NegatedTokenRule>(self(), true);
}

static bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

ValueTokenRule::ValueTokenRule(std::string value, bool ignore_case)
    : value_(std::move(value)), ignore_case_(ignore_case) {}

bool ValueTokenRule::accepts(const Token& token) const {
    return ignore_case_ ? iequals(token.value(), value_) : token.value() == value_;
}

PatternTokenRule::PatternTokenRule(std::string source, std::regex regex)
    : source_(std::move(source)), regex_(std::move(regex)) {}

bool PatternTokenRule::accepts(const Token& token) const {
    return std::regex_match(token.value(), regex_);
}

LengthTokenRule::LengthTokenRule(std::size_t min, std::size_t max)
    : min_(min), max_(max) {}

bool LengthTokenRule::accepts(const Token& token) const {
    auto n = token.value().size();
    return n >= min_ && n <= max_;
}

CustomTokenRule::CustomTokenRule(Predicate predicate)
    : predicate_(std::move(predicate)) {}

bool CustomTokenRule::accepts(const Token& token) const {
    return predicate_(token);
}

// ---------------------------------------------------------------------------
// Negation
// ---------------------------------------------------------------------------

NegatedTokenRule::NegatedTokenRule(TokenRulePtr original, bool single_token)
    : original_(std::move(original)), single_token_(single_token) {}

std::optional<TokenRuleMatch> NegatedTokenRule::match(TokenStream& stream,
                                                      TokenRuleContext& ctx) const {
    if (single_token_ && !stream.has_more()) return std::nullopt;

    TokenStream probe = stream.lookahead();
    if (original_->match(probe, ctx)) return std::nullopt;

    if (single_token_) return consume_one(stream);
    return TokenRuleMatch::empty(stream.index(), self());
}

} // namespace weft
