#include "helpers.hpp"
#include <weft/rule/engine.hpp>
#include <weft/rule/rules.hpp>

using namespace weft;
using namespace weft::testing;

TEST_CASE("engine without rules copies the input", "[engine]") {
    TokenRuleEngine engine;
    auto list = tokens_of({"a", "b"});
    auto out = unwrap(engine.process(list));
    REQUIRE(out == list);
    REQUIRE(unwrap(engine.process({})).empty());
}

TEST_CASE("add_rule rejects null inputs", "[engine]") {
    TokenRuleEngine engine;
    auto r1 = engine.add_rule(nullptr, actions::identity());
    REQUIRE(r1.is_err());
    REQUIRE(r1.error().code == WeftError::InvalidArg);
    REQUIRE(engine.add_rule(rules::any_token(), nullptr).is_err());
    REQUIRE(engine.rules().empty());
}

TEST_CASE("first registered rule wins", "[engine]") {
    TokenRuleEngine engine;
    auto drop_all = unwrap(actions::skip([](const Token&) { return true; }));
    REQUIRE(engine.add_rule(rules::value("a"), drop_all).is_ok());
    REQUIRE(engine.add_rule(rules::value("a"), actions::identity()).is_ok());

    auto out = unwrap(engine.process(tokens_of({"a", "b", "a"})));
    REQUIRE(values_of(out) == std::vector<std::string>{"b"});
}

TEST_CASE("consuming matches are replaced by the action output", "[engine]") {
    TokenRuleEngine engine;
    auto pair = unwrap(rules::sequence({rules::value("a"), rules::value("b")}));
    REQUIRE(engine.add_rule(pair, actions::grouping()).is_ok());

    auto out = unwrap(engine.process(tokens_of({"x", "a", "b", "a", "c"})));
    REQUIRE(values_of(out) == std::vector<std::string>{"x", "ab", "a", "c"});
    REQUIRE(out[1]->kind() == TokenKind::Group);
}

TEST_CASE("zero-width match emits its output then copies one token", "[engine]") {
    TokenRuleEngine engine;
    auto marker = unwrap(actions::transform([](const TokenList&) {
        return Result<TokenList>::ok(TokenList{SimpleToken::of("|")});
    }));
    REQUIRE(engine.add_rule(rules::start_line(), marker).is_ok());

    auto out = unwrap(engine.process(tokens_of({"a", "b", "\n", "c"})));
    REQUIRE(values_of(out) == std::vector<std::string>{"|", "a", "b", "\n", "|", "c"});
}

TEST_CASE("always-matching rule still terminates", "[engine]") {
    TokenRuleEngine engine;
    REQUIRE(engine.add_rule(rules::always_match(), actions::identity()).is_ok());
    auto list = tokens_of({"a", "b", "c"});
    auto out = unwrap(engine.process(list));
    REQUIRE(out == list);
}

TEST_CASE("action errors abort the pass", "[engine]") {
    TokenRuleEngine engine;
    auto failing = unwrap(actions::transform([](const TokenList&) -> Result<TokenList> {
        return WeftError{WeftError::InvalidArg, "no b allowed"};
    }));
    REQUIRE(engine.add_rule(rules::value("b"), failing).is_ok());

    auto r = engine.process(tokens_of({"a", "b"}));
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "no b allowed");
}

TEST_CASE("process leaves the input untouched and returns a new list", "[engine]") {
    TokenRuleEngine engine;
    REQUIRE(engine.add_rule(unwrap(rules::one_or_more(rules::any_token())),
                            actions::grouping()).is_ok());
    auto list = tokens_of({"a", "b"});
    auto out = unwrap(engine.process(list));
    REQUIRE(out.size() == 1);
    REQUIRE(list.size() == 2);
    REQUIRE(list[0]->value() == "a");
}

TEST_CASE("captures do not leak between passes", "[engine]") {
    TokenRuleContext ctx;
    TokenRuleEngine engine(ctx);
    auto ref = unwrap(rules::reference("seen", ReferenceType::Tokens));
    auto cap = unwrap(rules::capture("seen", rules::value("a")));
    auto drop = unwrap(actions::skip([](const Token&) { return true; }));
    REQUIRE(engine.add_rule(ref, drop).is_ok());
    REQUIRE(engine.add_rule(cap, actions::identity()).is_ok());

    auto first = unwrap(engine.process(tokens_of({"a", "a"})));
    REQUIRE(values_of(first) == std::vector<std::string>{"a"});
    REQUIRE(engine.context().captured_tokens("seen") == nullptr);

    auto second = unwrap(engine.process(tokens_of({"a"})));
    REQUIRE(values_of(second) == std::vector<std::string>{"a"});
}

// Reports a one-token match on "x" but leaves the stream where it was.
class ReportOnlyRule : public TokenRule {
public:
    RuleKind kind() const override { return RuleKind::Custom; }
    std::optional<TokenRuleMatch> match(TokenStream& stream,
                                        TokenRuleContext&) const override {
        TokenPtr token = stream.peek();
        if (!token || token->value() != "x") return std::nullopt;
        return TokenRuleMatch{stream.index(), stream.index() + 1, {token}, self()};
    }
};

TEST_CASE("engine advances to the reported end of a match", "[engine]") {
    TokenRuleEngine engine;
    auto marked = actions::annotate({{"seen", "yes"}});
    REQUIRE(engine.add_rule(std::make_shared<ReportOnlyRule>(), marked).is_ok());

    auto out = unwrap(engine.process(tokens_of({"x", "y", "x"})));
    REQUIRE(values_of(out) == std::vector<std::string>{"x", "y", "x"});
    REQUIRE(out[0]->kind() == TokenKind::Annotated);
    REQUIRE(out[1]->kind() == TokenKind::Simple);
    REQUIRE(out[2]->kind() == TokenKind::Annotated);
}
