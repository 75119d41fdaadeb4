#pragma once

#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <weft/rule/rule.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace weft {

// How a named reference is resolved at match time.
enum class ReferenceType {
    Rule,     // a rule defined in the context
    Tokens,   // the tokens captured under the name
    Dynamic   // the rule if one is defined, otherwise the captured tokens
};

const char* reference_type_name(ReferenceType t);

// ---------------------------------------------------------------------------
// TokenRuleContext: named rules and captured tokens.
//
// Rules live in an arena indexed by definition order; names map to ids.
// Rule definitions are append-only. Captures and the recursion counter are
// scratch state for one processing pass, which is why engines copy the
// context they are given.
// ---------------------------------------------------------------------------

class TokenRuleContext {
public:
    static constexpr std::size_t DEFAULT_MAX_DEPTH = 256;

    TokenRuleContext() = default;
    explicit TokenRuleContext(std::size_t max_depth);

    // InvalidArg for an empty name or null rule, Duplicate for a known name.
    Status define_rule(const std::string& name, TokenRulePtr rule);

    // Null when the name is not defined.
    TokenRulePtr rule_reference(const std::string& name) const;
    std::optional<std::size_t> rule_id(const std::string& name) const;
    TokenRulePtr rule_at(std::size_t id) const;
    std::size_t rule_count() const { return arena_.size(); }
    const std::vector<std::string>& rule_names() const { return names_; }

    // Later captures under the same name replace earlier ones.
    void capture_tokens(const std::string& name, TokenList tokens);
    // Null when nothing was captured under the name.
    const TokenList* captured_tokens(const std::string& name) const;
    void clear_captures();

    // Recursion guard around reference resolution. enter() fails once
    // max_depth() resolutions are nested; every successful enter() must be
    // paired with leave().
    bool enter();
    void leave();
    std::size_t depth() const { return depth_; }
    std::size_t max_depth() const { return max_depth_; }
    void set_max_depth(std::size_t depth) { max_depth_ = depth; }

private:
    std::vector<TokenRulePtr> arena_;
    std::vector<std::string> names_;
    std::unordered_map<std::string, std::size_t> ids_;
    std::unordered_map<std::string, TokenList> captures_;
    std::size_t depth_ = 0;
    std::size_t max_depth_ = DEFAULT_MAX_DEPTH;
    bool depth_warned_ = false;
};

} // namespace weft
