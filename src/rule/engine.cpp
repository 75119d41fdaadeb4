#include <weft/rule/engine.hpp>
#include <weft/log.hpp>
#include <algorithm>

namespace weft {

TokenRuleEngine::TokenRuleEngine(TokenRuleContext context)
    : context_(std::move(context)) {}

Status TokenRuleEngine::add_rule(TokenRulePtr rule, TokenActionPtr action) {
    if (!rule) {
        return WeftError{WeftError::InvalidArg, "engine rule must not be null"};
    }
    if (!action) {
        return WeftError{WeftError::InvalidArg,
            std::string("action for ") + rule_kind_name(rule->kind()) +
            " rule must not be null"};
    }
    rules_.push_back(RuleBinding{std::move(rule), std::move(action)});
    return ok_status();
}

Result<TokenList> TokenRuleEngine::process(const TokenList& tokens) const {
    TokenRuleContext ctx = context_;
    TokenStream stream(tokens);
    TokenList out;
    out.reserve(tokens.size());
    std::size_t matches = 0;

    while (stream.has_more()) {
        const std::size_t here = stream.index();
        std::optional<TokenRuleMatch> found;
        const RuleBinding* binding = nullptr;
        for (const auto& b : rules_) {
            TokenStream probe = stream.lookahead();
            found = b.rule->match(probe, ctx);
            if (found) {
                stream.commit(probe);
                binding = &b;
                break;
            }
        }

        if (found) {
            ++matches;
            log::trace("%s rule matched [%zu, %zu) -> %s",
                       rule_kind_name(binding->rule->kind()), found->start,
                       found->end, action_kind_name(binding->action->kind()));
            auto emitted = binding->action->apply(*found);
            if (emitted.is_err()) {
                log::debug("%s action failed at token %zu",
                           action_kind_name(binding->action->kind()), found->start);
                return std::move(emitted).error();
            }
            const auto& produced = emitted.value();
            out.insert(out.end(), produced.begin(), produced.end());

            // Rules may report an end past where they left the stream.
            std::size_t end = std::min(found->end, stream.size());
            if (end > stream.index()) WEFT_TRY(stream.advance(end - stream.index()));
            if (stream.index() > here) continue;
        }

        auto current = stream.current();
        if (current.is_err()) return std::move(current).error();
        out.push_back(std::move(current).value());
        WEFT_TRY(stream.advance());
    }

    log::debug("engine pass: %zu tokens in, %zu out, %zu matches",
               tokens.size(), out.size(), matches);
    return Result<TokenList>::ok(std::move(out));
}

} // namespace weft
