#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <weft/rule/rule.hpp>
#include <functional>
#include <memory>

namespace weft {

enum class ActionKind {
    Identity,
    Transform,
    Convert,
    Filter,
    Skip,
    Grouping,
    Wrap,
    Extract,
    Annotate,
    Index,
    Split
};

const char* action_kind_name(ActionKind k);

// Turns a match into the tokens the engine emits in its place. An error
// aborts the processing pass.
class TokenAction {
public:
    virtual ~TokenAction() = default;

    virtual ActionKind kind() const = 0;
    virtual Result<TokenList> apply(const TokenRuleMatch& match) const = 0;
};

using TokenActionPtr = std::shared_ptr<const TokenAction>;

enum class GroupingMode {
    Matched,   // group the tokens as matched
    All        // flatten nested groups to their leaf tokens first
};

using TokenPredicate = std::function<bool(const Token&)>;

namespace actions {

using TransformFn = std::function<Result<TokenList>(const TokenList&)>;
using ConvertFn = std::function<Result<TokenPtr>(const TokenPtr&)>;

TokenActionPtr identity();
Result<TokenActionPtr> transform(TransformFn fn);
Result<TokenActionPtr> convert(ConvertFn fn);
Result<TokenActionPtr> filter(TokenPredicate keep);
Result<TokenActionPtr> skip(TokenPredicate drop);

// One TokenGroup over the span. A single token is emitted unchanged and a
// zero-width match emits nothing.
TokenActionPtr grouping(GroupingMode mode = GroupingMode::Matched);

Result<TokenActionPtr> wrap(TokenPtr prefix, TokenPtr suffix);

// Moves tokens accepted by `pred` into `sink`. The sink is shared with the
// caller, so concurrent passes over the same grammar need their own sinks.
Result<TokenActionPtr> extract(TokenPredicate pred, std::shared_ptr<TokenList> sink);

// New keys override existing annotations of the same name.
TokenActionPtr annotate(TokenMetadata metadata);

// Numbers tokens from `start`; already indexed tokens keep their number.
// apply() fails with OutOfRange when a span would number past INT_MAX.
Result<TokenActionPtr> index(int start = 0);

// Splits every token's value on `regex` and drops empty pieces. Pieces of
// positioned tokens get their own positions, and annotated or indexed tokens
// keep their decoration on each piece. Pattern error for a malformed regex.
Result<TokenActionPtr> split(const std::string& regex);

} // namespace actions

} // namespace weft
