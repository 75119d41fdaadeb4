#include "helpers.hpp"
#include <weft/lang/stream.hpp>

using namespace weft;
using namespace weft::testing;

TEST_CASE("empty stream has nothing to read", "[stream]") {
    TokenList none;
    TokenStream s(none);
    REQUIRE(s.empty());
    REQUIRE_FALSE(s.has_more());
    REQUIRE(s.peek() == nullptr);
    REQUIRE(s.previous() == nullptr);
    auto cur = s.current();
    REQUIRE(cur.is_err());
    REQUIRE(cur.error().code == WeftError::OutOfRange);
}

TEST_CASE("advance walks forward and stops at the end", "[stream]") {
    auto list = tokens_of({"a", "b", "c"});
    TokenStream s(list);
    REQUIRE(s.current().value()->value() == "a");
    REQUIRE(s.advance().is_ok());
    REQUIRE(s.index() == 1);
    REQUIRE(s.previous()->value() == "a");
    REQUIRE(s.peek(1)->value() == "c");
    REQUIRE(s.peek(2) == nullptr);

    auto past = s.advance(3);
    REQUIRE(past.is_err());
    REQUIRE(past.error().code == WeftError::OutOfRange);
    REQUIRE(s.index() == 1);

    REQUIRE(s.advance(2).is_ok());
    REQUIRE_FALSE(s.has_more());
    REQUIRE(s.index() == s.size());
}

TEST_CASE("at() accepts [0, size] only", "[stream]") {
    auto list = tokens_of({"a", "b"});
    REQUIRE(TokenStream::at(list, 0).is_ok());
    auto end = TokenStream::at(list, 2);
    REQUIRE(end.is_ok());
    REQUIRE_FALSE(end.value().has_more());
    auto bad = TokenStream::at(list, 3);
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == WeftError::OutOfRange);
}

TEST_CASE("lookahead probes independently and commit adopts", "[stream]") {
    auto list = tokens_of({"a", "b", "c"});
    TokenStream s(list);
    TokenStream probe = s.lookahead();
    REQUIRE(probe.advance(2).is_ok());
    REQUIRE(s.index() == 0);

    s.commit(probe);
    REQUIRE(s.index() == 2);

    TokenStream behind = unwrap(TokenStream::at(list, 1));
    s.commit(behind);
    REQUIRE(s.index() == 2);

    auto other = tokens_of({"a", "b", "c"});
    TokenStream foreign = unwrap(TokenStream::at(other, 3));
    s.commit(foreign);
    REQUIRE(s.index() == 2);
}

TEST_CASE("reset returns to the start", "[stream]") {
    auto list = tokens_of({"a", "b"});
    TokenStream s(list);
    REQUIRE(s.advance(2).is_ok());
    s.reset();
    REQUIRE(s.at_start());
    REQUIRE(s.current().value()->value() == "a");
}

TEST_CASE("slice clamps to the list", "[stream]") {
    auto list = tokens_of({"a", "b", "c"});
    TokenStream s(list);
    REQUIRE(values_of(s.slice(1, 3)) == std::vector<std::string>{"b", "c"});
    REQUIRE(values_of(s.slice(2, 10)) == std::vector<std::string>{"c"});
    REQUIRE(s.slice(2, 2).empty());
    REQUIRE(s.slice(3, 1).empty());
}
