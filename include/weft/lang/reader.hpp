#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <string>
#include <vector>

namespace weft {

// Splits text into positioned tokens. Words are maximal runs of
// non-separator characters, each separator character is a token of its own
// and a backslash escapes the next character into an EscapedToken. Each
// token takes the first definition that accepts it, otherwise a catch-all.
class TokenReader {
public:
    static constexpr const char* DEFAULT_SEPARATORS = " \t\r\n";

    // InvalidArg when the separators contain the escape character.
    static Result<TokenReader> create(std::vector<TokenDefinition> definitions,
                                      std::string separators = DEFAULT_SEPARATORS);

    // Parse error for a backslash at the very end of the text.
    Result<TokenList> read(const std::string& text) const;

    const std::string& separators() const { return separators_; }

private:
    TokenReader(std::vector<TokenDefinition> definitions, std::string separators);

    const TokenDefinition& classify(const std::string& value,
                                    const TokenDefinition& fallback) const;

    std::vector<TokenDefinition> definitions_;
    std::string separators_;
    TokenDefinition word_;
    TokenDefinition separator_;
    TokenDefinition escape_;
};

} // namespace weft
