#include <weft/rule/rules.hpp>

namespace weft {
namespace rules {

namespace {

Result<TokenRulePtr> made(TokenRulePtr rule) {
    return Result<TokenRulePtr>::ok(std::move(rule));
}

Status require_rule(const TokenRulePtr& rule, const char* what) {
    if (!rule) {
        return WeftError{WeftError::InvalidArg,
            std::string(what) + " rule must not be null"};
    }
    return ok_status();
}

Status require_rules(const std::vector<TokenRulePtr>& rules, const char* what) {
    if (rules.empty()) {
        return WeftError{WeftError::InvalidArg,
            std::string(what) + " needs at least one rule"};
    }
    for (const auto& r : rules) {
        WEFT_TRY(require_rule(r, what));
    }
    return ok_status();
}

Status require_name(const std::string& name, const char* what) {
    if (name.empty()) {
        return WeftError{WeftError::InvalidArg,
            std::string(what) + " name must not be empty"};
    }
    return ok_status();
}

} // namespace

TokenRulePtr always_match() { return std::make_shared<AlwaysMatchTokenRule>(); }
TokenRulePtr never_match() { return std::make_shared<NeverMatchTokenRule>(); }
TokenRulePtr any_token() { return std::make_shared<AnyTokenRule>(); }

TokenRulePtr value(const std::string& text, bool ignore_case) {
    return std::make_shared<ValueTokenRule>(text, ignore_case);
}

Result<TokenRulePtr> pattern(const std::string& regex) {
    std::regex re;
    try {
        re = std::regex(regex);
    } catch (const std::regex_error& e) {
        return WeftError{WeftError::Pattern,
            "invalid rule pattern '" + regex + "': " + e.what()};
    }
    return made(std::make_shared<PatternTokenRule>(regex, std::move(re)));
}

Result<TokenRulePtr> length(int min, int max) {
    if (min < 0 || max < 0) {
        return WeftError{WeftError::InvalidArg,
            "token length bounds must not be negative (" + std::to_string(min) +
            ", " + std::to_string(max) + ")"};
    }
    if (max < min) {
        return WeftError{WeftError::InvalidArg,
            "maximum token length " + std::to_string(max) +
            " is below the minimum " + std::to_string(min)};
    }
    return made(std::make_shared<LengthTokenRule>(static_cast<std::size_t>(min),
                                                  static_cast<std::size_t>(max)));
}

Result<TokenRulePtr> min_length(int min) { return length(min, INT_MAX); }
Result<TokenRulePtr> max_length(int max) { return length(0, max); }
Result<TokenRulePtr> exact_length(int n) { return length(n, n); }

Result<TokenRulePtr> custom(CustomTokenRule::Predicate predicate) {
    if (!predicate) {
        return WeftError{WeftError::InvalidArg, "custom rule predicate must be set"};
    }
    return made(std::make_shared<CustomTokenRule>(std::move(predicate)));
}

Result<TokenRulePtr> negate(const TokenRulePtr& rule) {
    WEFT_TRY(require_rule(rule, "negated"));
    return made(rule->negate());
}

Result<TokenRulePtr> sequence(std::vector<TokenRulePtr> rules) {
    WEFT_TRY(require_rules(rules, "sequence"));
    return made(std::make_shared<SequenceTokenRule>(std::move(rules)));
}

Result<TokenRulePtr> any_of(std::vector<TokenRulePtr> rules) {
    WEFT_TRY(require_rules(rules, "any-of"));
    return made(std::make_shared<AnyOfTokenRule>(std::move(rules)));
}

Result<TokenRulePtr> all_of(std::vector<TokenRulePtr> rules) {
    WEFT_TRY(require_rules(rules, "all-of"));
    return made(std::make_shared<AllOfTokenRule>(std::move(rules)));
}

Result<TokenRulePtr> optional(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "optional"));
    return made(std::make_shared<OptionalTokenRule>(std::move(rule)));
}

Result<TokenRulePtr> repeated(TokenRulePtr rule, int min, int max) {
    WEFT_TRY(require_rule(rule, "repeated"));
    if (min < 0) {
        return WeftError{WeftError::InvalidArg,
            "minimum repetitions must not be negative, got " + std::to_string(min)};
    }
    if (max < min) {
        return WeftError{WeftError::InvalidArg,
            "maximum repetitions " + std::to_string(max) +
            " is below the minimum " + std::to_string(min),
            "use RepeatedTokenRule::UNBOUNDED for no upper limit"};
    }
    return made(std::make_shared<RepeatedTokenRule>(std::move(rule), min, max));
}

Result<TokenRulePtr> at_least(TokenRulePtr rule, int min) {
    return repeated(std::move(rule), min, RepeatedTokenRule::UNBOUNDED);
}

Result<TokenRulePtr> at_most(TokenRulePtr rule, int max) {
    return repeated(std::move(rule), 0, max);
}

Result<TokenRulePtr> exactly(TokenRulePtr rule, int n) {
    return repeated(std::move(rule), n, n);
}

Result<TokenRulePtr> zero_or_more(TokenRulePtr rule) {
    return at_least(std::move(rule), 0);
}

Result<TokenRulePtr> one_or_more(TokenRulePtr rule) {
    return at_least(std::move(rule), 1);
}

Result<TokenRulePtr> lookahead(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "lookahead"));
    return made(std::make_shared<LookaheadTokenRule>(std::move(rule), LookMode::Positive));
}

Result<TokenRulePtr> negative_lookahead(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "lookahead"));
    return made(std::make_shared<LookaheadTokenRule>(std::move(rule), LookMode::Negative));
}

Result<TokenRulePtr> lookbehind(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "lookbehind"));
    return made(std::make_shared<LookbehindTokenRule>(std::move(rule), LookMode::Positive));
}

Result<TokenRulePtr> negative_lookbehind(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "lookbehind"));
    return made(std::make_shared<LookbehindTokenRule>(std::move(rule), LookMode::Negative));
}

TokenRulePtr start_document() {
    return std::make_shared<AnchorTokenRule>(AnchorKind::Start, AnchorScope::Document);
}

TokenRulePtr end_document() {
    return std::make_shared<AnchorTokenRule>(AnchorKind::End, AnchorScope::Document);
}

TokenRulePtr start_line() {
    return std::make_shared<AnchorTokenRule>(AnchorKind::Start, AnchorScope::Line);
}

TokenRulePtr end_line() {
    return std::make_shared<AnchorTokenRule>(AnchorKind::End, AnchorScope::Line);
}

Result<TokenRulePtr> boundary(TokenRulePtr open, TokenRulePtr close) {
    return boundary(std::move(open), any_token(), std::move(close));
}

Result<TokenRulePtr> boundary(TokenRulePtr open, TokenRulePtr body, TokenRulePtr close) {
    WEFT_TRY(require_rule(open, "boundary open"));
    WEFT_TRY(require_rule(body, "boundary body"));
    WEFT_TRY(require_rule(close, "boundary close"));
    return made(std::make_shared<BoundaryTokenRule>(std::move(open), std::move(body),
                                                    std::move(close)));
}

Result<TokenRulePtr> recursive(const std::string& name) {
    return reference(name, ReferenceType::Rule);
}

Result<TokenRulePtr> reference(const std::string& name, ReferenceType type) {
    WEFT_TRY(require_name(name, "reference"));
    return made(std::make_shared<ReferenceTokenRule>(name, type));
}

Result<TokenRulePtr> capture(const std::string& name, TokenRulePtr rule) {
    WEFT_TRY(require_name(name, "capture"));
    WEFT_TRY(require_rule(rule, "capture"));
    return made(std::make_shared<CaptureTokenRule>(name, std::move(rule)));
}

Result<TokenRulePtr> group(TokenRulePtr rule) {
    WEFT_TRY(require_rule(rule, "group"));
    return made(std::make_shared<GroupTokenRule>(std::move(rule)));
}

} // namespace rules
} // namespace weft
