#include <weft/config.hpp>
#include <weft/lang/reader.hpp>
#include <weft/rule/grammar.hpp>
#include <weft/rule/rules.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace weft;

static bool is_comment(const Token& t) {
    if (!t.as_group()) return false;
    const std::string& v = t.value();
    return v.rfind("//", 0) == 0 || v.rfind("/*", 0) == 0;
}

// Pass 1 groups every C-style comment into one token.
static Result<Grammar> comment_grammar(const EngineOptions& options) {
    auto slash = rules::value("/");
    auto star = rules::value("*");
    auto newline = rules::value("\n");

    auto line_open = rules::sequence({slash, slash});
    if (line_open.is_err()) return std::move(line_open).error();
    auto at_newline = rules::lookahead(newline);
    if (at_newline.is_err()) return std::move(at_newline).error();
    auto line_close = rules::any_of({at_newline.value(), rules::end_document()});
    if (line_close.is_err()) return std::move(line_close).error();
    auto line_comment = rules::boundary(line_open.value(), line_close.value());
    if (line_comment.is_err()) return std::move(line_comment).error();

    auto block_open = rules::sequence({slash, star});
    if (block_open.is_err()) return std::move(block_open).error();
    auto block_close = rules::sequence({star, slash});
    if (block_close.is_err()) return std::move(block_close).error();
    auto block_comment = rules::boundary(block_open.value(), block_close.value());
    if (block_comment.is_err()) return std::move(block_comment).error();

    auto comment = rules::any_of({line_comment.value(), block_comment.value()});
    if (comment.is_err()) return std::move(comment).error();

    GrammarBuilder builder;
    builder.set_options(options);
    WEFT_TRY(builder.define("comment", comment.value()));
    auto ref = rules::recursive("comment");
    if (ref.is_err()) return std::move(ref).error();
    WEFT_TRY(builder.add_rule(ref.value(), actions::grouping()));
    return builder.build();
}

// Pass 2 moves the grouped comments into `sink`.
static Result<Grammar> extract_grammar(const EngineOptions& options,
                                       std::shared_ptr<TokenList> sink) {
    auto grouped = rules::custom(is_comment);
    if (grouped.is_err()) return std::move(grouped).error();
    auto extract = actions::extract(is_comment, std::move(sink));
    if (extract.is_err()) return std::move(extract).error();

    GrammarBuilder builder;
    builder.set_options(options);
    WEFT_TRY(builder.add_rule(grouped.value(), extract.value(), false));
    return builder.build();
}

static int fail(const WeftError& e) {
    std::cerr << e.format() << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: weft-strip <file> [--config file.toml]\n";
        return 1;
    }

    std::string path = argv[1];
    Config config;
    if (argc > 3 && std::string(argv[2]) == "--config") {
        auto loaded = Config::load(argv[3]);
        if (loaded.is_err()) return fail(loaded.error());
        config = std::move(loaded).value();
    }
    config.apply_logging();

    std::ifstream f(path);
    if (!f) {
        std::cerr << "error: cannot open " << path << "\n";
        return 1;
    }
    std::ostringstream ss;
    ss << f.rdbuf();

    auto reader = TokenReader::create({}, " \t\r\n/*;,(){}[]");
    if (reader.is_err()) return fail(reader.error());
    auto tokens = reader.value().read(ss.str());
    if (tokens.is_err()) return fail(tokens.error());

    auto comments = comment_grammar(config.engine);
    if (comments.is_err()) return fail(comments.error());
    auto grouped = comments.value().parse(tokens.value());
    if (grouped.is_err()) return fail(grouped.error());

    auto sink = std::make_shared<TokenList>();
    auto extractor = extract_grammar(config.engine, sink);
    if (extractor.is_err()) return fail(extractor.error());
    auto stripped = extractor.value().parse(grouped.value());
    if (stripped.is_err()) return fail(stripped.error());

    std::cout << "--- " << path << " ---\n";
    std::cout << "Tokens: " << tokens.value().size()
              << "  Comments: " << sink->size() << "\n\n";

    for (const auto& c : *sink) {
        std::cout << c->start().to_string() << "  " << c->value() << "\n";
    }

    std::cout << "\n-- Code --\n" << join_values(stripped.value());
    return 0;
}
