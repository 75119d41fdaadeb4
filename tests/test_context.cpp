#include "helpers.hpp"
#include <weft/rule/context.hpp>
#include <weft/rule/rules.hpp>

using namespace weft;
using namespace weft::testing;

// ===== Definitions =====

TEST_CASE("define_rule assigns ids in order", "[context]") {
    TokenRuleContext ctx;
    REQUIRE(ctx.define_rule("first", rules::any_token()).is_ok());
    REQUIRE(ctx.define_rule("second", rules::value("x")).is_ok());
    REQUIRE(ctx.rule_count() == 2);
    REQUIRE(ctx.rule_id("first").value() == 0);
    REQUIRE(ctx.rule_id("second").value() == 1);
    REQUIRE(ctx.rule_at(1)->kind() == RuleKind::Value);
    REQUIRE(ctx.rule_names() == std::vector<std::string>{"first", "second"});
    REQUIRE_FALSE(ctx.rule_id("third"));
    REQUIRE(ctx.rule_at(2) == nullptr);
    REQUIRE(ctx.rule_reference("third") == nullptr);
}

TEST_CASE("define_rule rejects bad names and duplicates", "[context]") {
    TokenRuleContext ctx;
    auto empty = ctx.define_rule("", rules::any_token());
    REQUIRE(empty.is_err());
    REQUIRE(empty.error().code == WeftError::InvalidArg);

    REQUIRE(ctx.define_rule("x", nullptr).is_err());

    REQUIRE(ctx.define_rule("x", rules::any_token()).is_ok());
    auto dup = ctx.define_rule("x", rules::value("y"));
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == WeftError::Duplicate);
    REQUIRE(ctx.rule_reference("x")->kind() == RuleKind::AnyToken);
}

TEST_CASE("captures overwrite and can be cleared", "[context]") {
    TokenRuleContext ctx;
    REQUIRE(ctx.captured_tokens("n") == nullptr);
    ctx.capture_tokens("n", tokens_of({"a"}));
    ctx.capture_tokens("n", tokens_of({"b", "c"}));
    REQUIRE(values_of(*ctx.captured_tokens("n")) == std::vector<std::string>{"b", "c"});
    ctx.clear_captures();
    REQUIRE(ctx.captured_tokens("n") == nullptr);
}

// ===== References =====

TEST_CASE("recursive resolves a named rule at match time", "[context]") {
    TokenRuleContext ctx;
    auto ref = unwrap(rules::recursive("word"));
    auto list = tokens_of({"hello"});
    TokenStream s(list);
    REQUIRE_FALSE(ref->match(s, ctx));

    REQUIRE(ctx.define_rule("word", unwrap(rules::pattern("[a-z]+"))).is_ok());
    auto m = ref->match(s, ctx);
    REQUIRE(m);
    REQUIRE(m->length() == 1);
    REQUIRE(s.index() == 1);
}

TEST_CASE("recursive rules match nested structure", "[context]") {
    // nested := "(" nested? ")"
    TokenRuleContext ctx;
    auto inner = unwrap(rules::optional(unwrap(rules::recursive("nested"))));
    auto nested = unwrap(rules::sequence({rules::value("("), inner, rules::value(")")}));
    REQUIRE(ctx.define_rule("nested", nested).is_ok());

    auto list = tokens_of({"(", "(", "(", ")", ")", ")"});
    TokenStream s(list);
    auto m = nested->match(s, ctx);
    REQUIRE(m);
    REQUIRE(m->length() == 6);
    REQUIRE(ctx.depth() == 0);

    auto unbalanced = tokens_of({"(", "(", ")"});
    TokenStream u(unbalanced);
    REQUIRE_FALSE(nested->match(u, ctx));
    REQUIRE(u.index() == 0);
}

TEST_CASE("recursion past the depth limit is a non-match", "[context]") {
    // loop := loop   (left recursion never terminates on its own)
    TokenRuleContext ctx(8);
    auto loop = unwrap(rules::recursive("loop"));
    REQUIRE(ctx.define_rule("loop", loop).is_ok());

    auto list = tokens_of({"a"});
    TokenStream s(list);
    REQUIRE_FALSE(loop->match(s, ctx));
    REQUIRE(ctx.depth() == 0);
    REQUIRE(s.index() == 0);
}

TEST_CASE("enter and leave track depth", "[context]") {
    TokenRuleContext ctx(2);
    REQUIRE(ctx.enter());
    REQUIRE(ctx.enter());
    REQUIRE_FALSE(ctx.enter());
    REQUIRE(ctx.depth() == 2);
    ctx.leave();
    ctx.leave();
    ctx.leave();
    REQUIRE(ctx.depth() == 0);
}

TEST_CASE("capture then replay the same tokens", "[context]") {
    // tag := "<" capture(name, any) ">" ... "</" ref(name) ">"
    TokenRuleContext ctx;
    auto name = unwrap(rules::capture("name", rules::any_token()));
    auto again = unwrap(rules::reference("name", ReferenceType::Tokens));
    auto rule = unwrap(rules::sequence({rules::value("<"), name, rules::value(">"),
                                        rules::value("</"), again, rules::value(">")}));

    auto good = tokens_of({"<", "b", ">", "</", "b", ">"});
    TokenStream s(good);
    REQUIRE(rule->match(s, ctx));
    REQUIRE(values_of(*ctx.captured_tokens("name")) == std::vector<std::string>{"b"});

    auto bad = tokens_of({"<", "b", ">", "</", "i", ">"});
    TokenStream t(bad);
    REQUIRE_FALSE(rule->match(t, ctx));
}

TEST_CASE("token reference without a capture fails", "[context]") {
    TokenRuleContext ctx;
    auto ref = unwrap(rules::reference("missing", ReferenceType::Tokens));
    auto list = tokens_of({"a"});
    TokenStream s(list);
    REQUIRE_FALSE(ref->match(s, ctx));
}

TEST_CASE("dynamic reference prefers rules over captures", "[context]") {
    TokenRuleContext ctx;
    auto ref = unwrap(rules::reference("x"));
    auto list = tokens_of({"a", "b"});

    ctx.capture_tokens("x", tokens_of({"a", "b"}));
    TokenStream s(list);
    REQUIRE(ref->match(s, ctx)->length() == 2);

    REQUIRE(ctx.define_rule("x", rules::value("a")).is_ok());
    TokenStream t(list);
    REQUIRE(ref->match(t, ctx)->length() == 1);
}

TEST_CASE("reference factories reject empty names", "[context]") {
    REQUIRE(rules::recursive("").is_err());
    REQUIRE(rules::reference("").is_err());
    REQUIRE(rules::capture("", rules::any_token()).is_err());
    REQUIRE(rules::capture("x", nullptr).is_err());
}
