#include "helpers.hpp"
#include <weft/rule/rules.hpp>

using namespace weft;
using namespace weft::testing;

TEST_CASE("negated single-token rule consumes rejected tokens", "[negate]") {
    auto list = tokens_of({"a", "b"});
    auto not_a = rules::value("a")->negate();
    REQUIRE(not_a->kind() == RuleKind::Negated);
    REQUIRE_FALSE(match_at(not_a, list, 0));

    auto m = match_at(not_a, list, 1);
    REQUIRE(m);
    REQUIRE(m->length() == 1);
    REQUIRE(m->tokens.front()->value() == "b");

    REQUIRE_FALSE(match_at(not_a, list, 2));
}

TEST_CASE("negated composite rule is a zero-width assertion", "[negate]") {
    auto list = tokens_of({"a", "c"});
    auto ab = unwrap(rules::sequence({rules::value("a"), rules::value("b")}));
    auto not_ab = unwrap(rules::negate(ab));
    auto m = match_at(not_ab, list);
    REQUIRE(m);
    REQUIRE(m->is_zero_width());

    auto list2 = tokens_of({"a", "b"});
    REQUIRE_FALSE(match_at(not_ab, list2));
}

TEST_CASE("negated anchors invert the position test", "[negate]") {
    auto list = tokens_of({"a"});
    auto not_start = rules::start_document()->negate();
    REQUIRE_FALSE(match_at(not_start, list, 0));
    auto m = match_at(not_start, list, 1);
    REQUIRE(m);
    REQUIRE(m->is_zero_width());
}

TEST_CASE("negated lookahead behaves like a negative lookahead", "[negate]") {
    auto list = tokens_of({"a"});
    auto ahead = unwrap(rules::lookahead(rules::value("a")));
    REQUIRE_FALSE(match_at(ahead->negate(), list));
    REQUIRE(match_at(ahead->negate(), tokens_of({"b"})));
}

TEST_CASE("negated optional wraps the negated inner rule", "[negate]") {
    auto opt = unwrap(rules::optional(rules::value("a")));
    auto neg = opt->negate();
    REQUIRE(neg->kind() == RuleKind::Optional);

    auto m = match_at(neg, tokens_of({"b"}));
    REQUIRE(m);
    REQUIRE(m->length() == 1);
    auto z = match_at(neg, tokens_of({"a"}));
    REQUIRE(z);
    REQUIRE(z->is_zero_width());
}

TEST_CASE("negated repeated keeps its bounds", "[negate]") {
    auto rep = unwrap(rules::repeated(rules::value("a"), 1, 2));
    auto neg = rep->negate();
    REQUIRE(neg->kind() == RuleKind::Repeated);
    auto& r = static_cast<const RepeatedTokenRule&>(*neg);
    REQUIRE(r.min() == 1);
    REQUIRE(r.max() == 2);
    REQUIRE(match_at(neg, tokens_of({"x", "y", "z"}))->length() == 2);
    REQUIRE_FALSE(match_at(neg, tokens_of({"a"})));
}

TEST_CASE("always and never match negate to each other", "[negate]") {
    auto list = tokens_of({"a"});
    auto never = rules::always_match()->negate();
    REQUIRE(never->kind() == RuleKind::NeverMatch);
    REQUIRE_FALSE(match_at(never, list));

    auto always = rules::never_match()->negate();
    REQUIRE(always->kind() == RuleKind::AlwaysMatch);
    REQUIRE(match_at(always, list)->is_zero_width());
}

TEST_CASE("negated group consumes a group whose contents fail", "[negate]") {
    auto ab = unwrap(TokenGroup::create(tokens_of({"a", "b"})));
    auto xy = unwrap(TokenGroup::create(tokens_of({"x", "y"})));
    TokenList list{ab, xy, SimpleToken::of("z")};

    auto not_a = unwrap(rules::group(rules::value("a")))->negate();
    REQUIRE(not_a->kind() == RuleKind::Group);
    REQUIRE_FALSE(match_at(not_a, list, 0));
    auto m = match_at(not_a, list, 1);
    REQUIRE(m);
    REQUIRE(m->length() == 1);
    REQUIRE_FALSE(match_at(not_a, list, 2));

    auto never = unwrap(rules::group(rules::always_match()))->negate();
    REQUIRE_FALSE(match_at(never, list, 0));
    REQUIRE_FALSE(match_at(never, list, 1));
}

TEST_CASE("double negation returns the original instance", "[negate]") {
    std::vector<TokenRulePtr> all = {
        rules::always_match(),
        rules::never_match(),
        rules::any_token(),
        rules::value("a"),
        unwrap(rules::pattern("[a-z]+")),
        unwrap(rules::length(1, 2)),
        unwrap(rules::custom([](const Token&) { return true; })),
        unwrap(rules::sequence({rules::value("a")})),
        unwrap(rules::any_of({rules::value("a")})),
        unwrap(rules::all_of({rules::value("a")})),
        unwrap(rules::optional(rules::value("a"))),
        unwrap(rules::repeated(rules::value("a"), 0, 3)),
        unwrap(rules::lookahead(rules::value("a"))),
        unwrap(rules::negative_lookbehind(rules::value("a"))),
        rules::start_line(),
        rules::end_document(),
        unwrap(rules::boundary(rules::value("("), rules::value(")"))),
        unwrap(rules::recursive("expr")),
        unwrap(rules::capture("x", rules::any_token())),
        unwrap(rules::group(rules::any_token())),
    };
    for (const auto& rule : all) {
        INFO(rule_kind_name(rule->kind()));
        auto once = rule->negate();
        REQUIRE(once != rule);
        REQUIRE(once->negate() == rule);
    }

    auto neg = rules::value("a")->negate();
    auto original = neg->negate();
    REQUIRE(original->kind() == RuleKind::Value);
    REQUIRE(original->negate() != neg);
}

TEST_CASE("negate factory rejects null", "[negate]") {
    auto r = rules::negate(nullptr);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::InvalidArg);
}
