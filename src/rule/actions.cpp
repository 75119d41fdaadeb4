#include <weft/rule/action.hpp>
#include <climits>
#include <regex>

namespace weft {

const char* action_kind_name(ActionKind k) {
    switch (k) {
    case ActionKind::Identity:  return "identity";
    case ActionKind::Transform: return "transform";
    case ActionKind::Convert:   return "convert";
    case ActionKind::Filter:    return "filter";
    case ActionKind::Skip:      return "skip";
    case ActionKind::Grouping:  return "grouping";
    case ActionKind::Wrap:      return "wrap";
    case ActionKind::Extract:   return "extract";
    case ActionKind::Annotate:  return "annotate";
    case ActionKind::Index:     return "index";
    case ActionKind::Split:     return "split";
    }
    return "?";
}

namespace {

Result<TokenList> emit(TokenList tokens) {
    return Result<TokenList>::ok(std::move(tokens));
}

class IdentityAction : public TokenAction {
public:
    ActionKind kind() const override { return ActionKind::Identity; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        return emit(m.tokens);
    }
};

class TransformAction : public TokenAction {
public:
    explicit TransformAction(actions::TransformFn fn) : fn_(std::move(fn)) {}

    ActionKind kind() const override { return ActionKind::Transform; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        return fn_(m.tokens);
    }

private:
    actions::TransformFn fn_;
};

class ConvertAction : public TokenAction {
public:
    explicit ConvertAction(actions::ConvertFn fn) : fn_(std::move(fn)) {}

    ActionKind kind() const override { return ActionKind::Convert; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        out.reserve(m.tokens.size());
        for (const auto& t : m.tokens) {
            auto converted = fn_(t);
            if (converted.is_err()) return std::move(converted).error();
            if (!converted.value()) {
                return WeftError{WeftError::InvalidArg,
                    "convert action produced a null token for '" + t->value() + "'"};
            }
            out.push_back(std::move(converted).value());
        }
        return emit(std::move(out));
    }

private:
    actions::ConvertFn fn_;
};

// Filter and Skip: keep tokens where pred(token) == keep_when.
class SelectAction : public TokenAction {
public:
    SelectAction(TokenPredicate pred, bool keep_when)
        : pred_(std::move(pred)), keep_when_(keep_when) {}

    ActionKind kind() const override {
        return keep_when_ ? ActionKind::Filter : ActionKind::Skip;
    }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        for (const auto& t : m.tokens) {
            if (pred_(*t) == keep_when_) out.push_back(t);
        }
        return emit(std::move(out));
    }

private:
    TokenPredicate pred_;
    bool keep_when_;
};

void flatten_into(const TokenPtr& token, TokenList& out) {
    if (const TokenGroup* g = token->as_group()) {
        for (const auto& child : g->tokens()) flatten_into(child, out);
        return;
    }
    out.push_back(token);
}

class GroupingAction : public TokenAction {
public:
    explicit GroupingAction(GroupingMode mode) : mode_(mode) {}

    ActionKind kind() const override { return ActionKind::Grouping; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        if (m.tokens.size() < 2) return emit(m.tokens);

        TokenList members;
        if (mode_ == GroupingMode::All) {
            for (const auto& t : m.tokens) flatten_into(t, members);
        } else {
            members = m.tokens;
        }
        auto group = TokenGroup::create(std::move(members));
        if (group.is_err()) return std::move(group).error();
        return emit({std::move(group).value()});
    }

private:
    GroupingMode mode_;
};

class WrapAction : public TokenAction {
public:
    WrapAction(TokenPtr prefix, TokenPtr suffix)
        : prefix_(std::move(prefix)), suffix_(std::move(suffix)) {}

    ActionKind kind() const override { return ActionKind::Wrap; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        out.reserve(m.tokens.size() + 2);
        out.push_back(prefix_);
        out.insert(out.end(), m.tokens.begin(), m.tokens.end());
        out.push_back(suffix_);
        return emit(std::move(out));
    }

private:
    TokenPtr prefix_;
    TokenPtr suffix_;
};

class ExtractAction : public TokenAction {
public:
    ExtractAction(TokenPredicate pred, std::shared_ptr<TokenList> sink)
        : pred_(std::move(pred)), sink_(std::move(sink)) {}

    ActionKind kind() const override { return ActionKind::Extract; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        for (const auto& t : m.tokens) {
            if (pred_(*t)) {
                sink_->push_back(t);
            } else {
                out.push_back(t);
            }
        }
        return emit(std::move(out));
    }

private:
    TokenPredicate pred_;
    std::shared_ptr<TokenList> sink_;
};

class AnnotateAction : public TokenAction {
public:
    explicit AnnotateAction(TokenMetadata metadata) : metadata_(std::move(metadata)) {}

    ActionKind kind() const override { return ActionKind::Annotate; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        out.reserve(m.tokens.size());
        for (const auto& t : m.tokens) {
            TokenPtr inner = t;
            TokenMetadata merged = metadata_;
            if (t->kind() == TokenKind::Annotated) {
                auto& existing = static_cast<const AnnotatedToken&>(*t);
                inner = existing.token();
                // insert() keeps the new values on key clashes
                merged.insert(existing.metadata().begin(), existing.metadata().end());
            }
            auto annotated = AnnotatedToken::create(std::move(inner), std::move(merged));
            if (annotated.is_err()) return std::move(annotated).error();
            out.push_back(std::move(annotated).value());
        }
        return emit(std::move(out));
    }

private:
    TokenMetadata metadata_;
};

class IndexAction : public TokenAction {
public:
    explicit IndexAction(int start) : start_(start) {}

    ActionKind kind() const override { return ActionKind::Index; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        if (m.tokens.size() > static_cast<std::size_t>(INT_MAX - start_) + 1) {
            return WeftError{WeftError::OutOfRange,
                "cannot index " + std::to_string(m.tokens.size()) +
                " tokens from " + std::to_string(start_) + " without passing INT_MAX"};
        }
        TokenList out;
        out.reserve(m.tokens.size());
        int next = start_;
        for (const auto& t : m.tokens) {
            int number = next;
            if (next < INT_MAX) ++next;
            if (t->kind() == TokenKind::Indexed) {
                out.push_back(t);
                continue;
            }
            auto indexed = IndexedToken::create(t, number);
            if (indexed.is_err()) return std::move(indexed).error();
            out.push_back(std::move(indexed).value());
        }
        return emit(std::move(out));
    }

private:
    int start_;
};

// Position of the character after `text` when `text` starts at `pos`.
TokenPosition step_over(TokenPosition pos, const std::string& text) {
    for (char c : text) {
        if (c == '\n') {
            ++pos.line;
            pos.character = 0;
        } else {
            ++pos.character;
        }
        ++pos.absolute;
    }
    return pos;
}

class SplitAction : public TokenAction {
public:
    explicit SplitAction(std::regex delimiter) : delimiter_(std::move(delimiter)) {}

    ActionKind kind() const override { return ActionKind::Split; }
    Result<TokenList> apply(const TokenRuleMatch& m) const override {
        TokenList out;
        for (const auto& t : m.tokens) {
            auto pieces = split_token(t);
            if (pieces.is_err()) return std::move(pieces).error();
            out.insert(out.end(), pieces.value().begin(), pieces.value().end());
        }
        return emit(std::move(out));
    }

private:
    Result<TokenList> split_token(const TokenPtr& token) const {
        if (token->kind() == TokenKind::Annotated) {
            auto& annotated = static_cast<const AnnotatedToken&>(*token);
            return redecorate(annotated.token(), [&](TokenPtr piece) {
                return AnnotatedToken::create(std::move(piece), annotated.metadata());
            });
        }
        if (token->kind() == TokenKind::Indexed) {
            auto& indexed = static_cast<const IndexedToken&>(*token);
            return redecorate(indexed.token(), [&](TokenPtr piece) {
                return IndexedToken::create(std::move(piece), indexed.index());
            });
        }
        return split_value(*token);
    }

    template<typename Decorate>
    Result<TokenList> redecorate(const TokenPtr& inner, Decorate decorate) const {
        auto pieces = split_token(inner);
        if (pieces.is_err()) return std::move(pieces).error();
        TokenList out;
        out.reserve(pieces.value().size());
        for (auto& piece : pieces.value()) {
            auto wrapped = decorate(std::move(piece));
            if (wrapped.is_err()) return std::move(wrapped).error();
            out.push_back(std::move(wrapped).value());
        }
        return emit(std::move(out));
    }

    Result<TokenList> split_value(const Token& token) const {
        const std::string& value = token.value();
        const bool positioned = token.is_positioned();
        TokenPosition cursor = token.start();
        std::size_t consumed = 0;
        TokenList out;

        auto add_piece = [&](std::size_t from, std::size_t to) -> Status {
            if (positioned) cursor = step_over(cursor, value.substr(consumed, from - consumed));
            consumed = from;
            if (from == to) return ok_status();

            std::string piece = value.substr(from, to - from);
            TokenPosition start = TokenPosition::unpositioned();
            TokenPosition end = TokenPosition::unpositioned();
            if (positioned) {
                start = cursor;
                end = step_over(cursor, piece.substr(0, piece.size() - 1));
            }
            auto tok = SimpleToken::create(TokenDefinition::literal(piece), piece, start, end);
            if (tok.is_err()) return std::move(tok).error();
            out.push_back(std::move(tok).value());
            return ok_status();
        };

        std::size_t from = 0;
        for (std::sregex_iterator it(value.begin(), value.end(), delimiter_), last;
             it != last; ++it) {
            auto at = static_cast<std::size_t>(it->position());
            if (it->length() == 0) continue;
            WEFT_TRY(add_piece(from, at));
            from = at + static_cast<std::size_t>(it->length());
        }
        WEFT_TRY(add_piece(from, value.size()));
        return emit(std::move(out));
    }

    std::regex delimiter_;
};

Result<TokenActionPtr> made(TokenActionPtr action) {
    return Result<TokenActionPtr>::ok(std::move(action));
}

WeftError unset(const char* what) {
    return WeftError{WeftError::InvalidArg, std::string(what) + " must be set"};
}

} // namespace

namespace actions {

TokenActionPtr identity() {
    return std::make_shared<IdentityAction>();
}

Result<TokenActionPtr> transform(TransformFn fn) {
    if (!fn) return unset("transform function");
    return made(std::make_shared<TransformAction>(std::move(fn)));
}

Result<TokenActionPtr> convert(ConvertFn fn) {
    if (!fn) return unset("convert function");
    return made(std::make_shared<ConvertAction>(std::move(fn)));
}

Result<TokenActionPtr> filter(TokenPredicate keep) {
    if (!keep) return unset("filter predicate");
    return made(std::make_shared<SelectAction>(std::move(keep), true));
}

Result<TokenActionPtr> skip(TokenPredicate drop) {
    if (!drop) return unset("skip predicate");
    return made(std::make_shared<SelectAction>(std::move(drop), false));
}

TokenActionPtr grouping(GroupingMode mode) {
    return std::make_shared<GroupingAction>(mode);
}

Result<TokenActionPtr> wrap(TokenPtr prefix, TokenPtr suffix) {
    if (!prefix || !suffix) return unset("wrap prefix and suffix");
    return made(std::make_shared<WrapAction>(std::move(prefix), std::move(suffix)));
}

Result<TokenActionPtr> extract(TokenPredicate pred, std::shared_ptr<TokenList> sink) {
    if (!pred) return unset("extract predicate");
    if (!sink) return unset("extract sink");
    return made(std::make_shared<ExtractAction>(std::move(pred), std::move(sink)));
}

TokenActionPtr annotate(TokenMetadata metadata) {
    return std::make_shared<AnnotateAction>(std::move(metadata));
}

Result<TokenActionPtr> index(int start) {
    if (start < 0) {
        return WeftError{WeftError::InvalidArg,
            "index start must not be negative, got " + std::to_string(start)};
    }
    return made(std::make_shared<IndexAction>(start));
}

Result<TokenActionPtr> split(const std::string& regex) {
    std::regex delimiter;
    try {
        delimiter = std::regex(regex);
    } catch (const std::regex_error& e) {
        return WeftError{WeftError::Pattern,
            "invalid split pattern '" + regex + "': " + e.what()};
    }
    return made(std::make_shared<SplitAction>(std::move(delimiter)));
}

} // namespace actions

} // namespace weft
