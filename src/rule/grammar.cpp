#include <weft/rule/grammar.hpp>
#include <weft/rule/rules.hpp>
#include <weft/log.hpp>
#include <unordered_set>

namespace weft {

// ---------------------------------------------------------------------------
// Grammar
// ---------------------------------------------------------------------------

Grammar::Grammar(std::vector<RuleBinding> rules, TokenRuleContext context)
    : rules_(std::move(rules)), context_(std::move(context)) {}

Result<TokenList> Grammar::parse(const TokenList& tokens) const {
    TokenRuleEngine engine(context_);
    for (const auto& b : rules_) {
        WEFT_TRY(engine.add_rule(b.rule, b.action));
    }
    return engine.process(tokens);
}

// ---------------------------------------------------------------------------
// Auto-wrap
// ---------------------------------------------------------------------------

namespace {

bool is_group(const TokenRulePtr& rule) {
    return rule->kind() == RuleKind::Group;
}

// AnyOf([Group(r), r]): r over raw tokens or over one token it grouped before.
Result<TokenRulePtr> group_or_raw(const TokenRulePtr& rule) {
    auto grouped = rules::group(rule);
    if (grouped.is_err()) return std::move(grouped).error();
    return rules::any_of({std::move(grouped).value(), rule});
}

Result<TokenRulePtr> auto_wrap(const TokenRulePtr& rule) {
    if (rule->kind() != RuleKind::AnyOf) return group_or_raw(rule);

    auto& any = static_cast<const AnyOfTokenRule&>(*rule);
    std::size_t marked = 0;
    for (const auto& alt : any.alternatives()) {
        if (is_group(alt)) ++marked;
    }
    if (marked == 0) return group_or_raw(rule);
    if (marked == 1) return Result<TokenRulePtr>::ok(rule);

    std::vector<TokenRulePtr> inner;
    inner.reserve(any.alternatives().size());
    for (const auto& alt : any.alternatives()) {
        if (is_group(alt)) {
            inner.push_back(static_cast<const GroupTokenRule&>(*alt).rule());
        } else {
            inner.push_back(alt);
        }
    }
    auto unwrapped = rules::any_of(std::move(inner));
    if (unwrapped.is_err()) return std::move(unwrapped).error();
    return group_or_raw(unwrapped.value());
}

void collect_rule_references(const TokenRulePtr& rule,
                             std::unordered_set<const TokenRule*>& seen,
                             std::vector<std::string>& names) {
    if (!rule || !seen.insert(rule.get()).second) return;
    if (rule->kind() == RuleKind::Reference) {
        auto& ref = static_cast<const ReferenceTokenRule&>(*rule);
        if (ref.type() == ReferenceType::Rule) names.push_back(ref.name());
    }
    for (const auto& child : rule->children()) {
        collect_rule_references(child, seen, names);
    }
}

} // namespace

// ---------------------------------------------------------------------------
// GrammarBuilder
// ---------------------------------------------------------------------------

Status GrammarBuilder::define(const std::string& name, TokenRulePtr rule) {
    WEFT_TRY(context_.define_rule(name, std::move(rule)));
    log::debug("grammar: defined rule '%s'", name.c_str());
    return ok_status();
}

Status GrammarBuilder::add_rule(TokenRulePtr rule, TokenActionPtr action, bool wrap) {
    if (!rule) {
        return WeftError{WeftError::InvalidArg, "grammar rule must not be null"};
    }
    if (!action) {
        return WeftError{WeftError::InvalidArg, "grammar action must not be null"};
    }
    if (wrap && action->kind() == ActionKind::Grouping) {
        auto wrapped = auto_wrap(rule);
        if (wrapped.is_err()) return std::move(wrapped).error();
        rule = std::move(wrapped).value();
    }
    log::debug("grammar: active rule #%zu (%s -> %s)", rules_.size(),
               rule_kind_name(rule->kind()), action_kind_name(action->kind()));
    rules_.push_back(RuleBinding{std::move(rule), std::move(action)});
    return ok_status();
}

void GrammarBuilder::set_options(const EngineOptions& options) {
    context_.set_max_depth(options.max_recursion_depth);
}

Result<Grammar> GrammarBuilder::build() {
    std::unordered_set<const TokenRule*> seen;
    std::vector<std::string> names;
    for (const auto& b : rules_) collect_rule_references(b.rule, seen, names);
    for (std::size_t id = 0; id < context_.rule_count(); ++id) {
        collect_rule_references(context_.rule_at(id), seen, names);
    }
    for (const auto& name : names) {
        if (!context_.rule_reference(name)) {
            return WeftError{WeftError::NotFound,
                "rule '" + name + "' is referenced but never defined",
                "define it with GrammarBuilder::define() before build()"};
        }
    }

    Grammar grammar(std::move(rules_), std::move(context_));
    rules_.clear();
    context_ = TokenRuleContext();
    log::debug("grammar: built with %zu active and %zu named rules",
               grammar.rules().size(), grammar.context().rule_count());
    return Result<Grammar>::ok(std::move(grammar));
}

} // namespace weft
