#include <weft/lang/reader.hpp>
#include <weft/log.hpp>

namespace weft {

namespace {

TokenDefinition accept_all(const char* name) {
    return TokenDefinition(name, [](const std::string&) { return true; });
}

// ---------------------------------------------------------------------------
// Scanner state
// ---------------------------------------------------------------------------

struct Scanner {
    const std::string& text;
    size_t pos = 0;
    int line = 0;
    int col = 0;

    explicit Scanner(const std::string& t) : text(t) {}

    bool at_end() const { return pos >= text.size(); }
    char peek() const { return at_end() ? '\0' : text[pos]; }

    char advance() {
        char c = text[pos++];
        if (c == '\n') {
            ++line;
            col = 0;
        } else {
            ++col;
        }
        return c;
    }

    TokenPosition here() const {
        return TokenPosition{line, col, static_cast<int>(pos)};
    }
};

} // namespace

TokenReader::TokenReader(std::vector<TokenDefinition> definitions, std::string separators)
    : definitions_(std::move(definitions)), separators_(std::move(separators)),
      word_(accept_all("word")), separator_(accept_all("separator")),
      escape_(accept_all("escape")) {}

Result<TokenReader> TokenReader::create(std::vector<TokenDefinition> definitions,
                                        std::string separators) {
    if (separators.find('\\') != std::string::npos) {
        return WeftError{WeftError::InvalidArg,
            "the backslash escape character cannot be a separator"};
    }
    return Result<TokenReader>::ok(TokenReader(std::move(definitions),
                                               std::move(separators)));
}

const TokenDefinition& TokenReader::classify(const std::string& value,
                                             const TokenDefinition& fallback) const {
    for (const auto& def : definitions_) {
        if (def.matches(value)) return def;
    }
    return fallback;
}

Result<TokenList> TokenReader::read(const std::string& text) const {
    Scanner s(text);
    TokenList tokens;
    std::string word;
    TokenPosition word_start;
    TokenPosition word_end;

    auto flush_word = [&]() -> Status {
        if (word.empty()) return ok_status();
        auto tok = SimpleToken::create(classify(word, word_), word, word_start, word_end);
        if (tok.is_err()) return std::move(tok).error();
        tokens.push_back(std::move(tok).value());
        word.clear();
        return ok_status();
    };

    while (!s.at_end()) {
        char c = s.peek();

        if (c == '\\') {
            WEFT_TRY(flush_word());
            TokenPosition start = s.here();
            s.advance();
            if (s.at_end()) {
                return WeftError{WeftError::Parse,
                    "dangling escape at " + start.to_string(),
                    "escape the backslash itself as \\\\"};
            }
            std::string value{'\\', s.advance()};
            auto tok = EscapedToken::create(classify(value, escape_), value, start);
            if (tok.is_err()) return std::move(tok).error();
            tokens.push_back(std::move(tok).value());
            continue;
        }

        if (separators_.find(c) != std::string::npos) {
            WEFT_TRY(flush_word());
            TokenPosition start = s.here();
            std::string value(1, s.advance());
            auto tok = SimpleToken::create(classify(value, separator_), value,
                                           start, start);
            if (tok.is_err()) return std::move(tok).error();
            tokens.push_back(std::move(tok).value());
            continue;
        }

        if (word.empty()) word_start = s.here();
        word_end = s.here();
        word += s.advance();
    }
    WEFT_TRY(flush_word());

    log::debug("reader: %zu chars -> %zu tokens", text.size(), tokens.size());
    return Result<TokenList>::ok(std::move(tokens));
}

} // namespace weft
