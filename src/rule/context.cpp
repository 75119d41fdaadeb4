#include <weft/rule/context.hpp>
#include <weft/log.hpp>

namespace weft {

const char* reference_type_name(ReferenceType t) {
    switch (t) {
    case ReferenceType::Rule:    return "rule";
    case ReferenceType::Tokens:  return "tokens";
    case ReferenceType::Dynamic: return "dynamic";
    }
    return "?";
}

TokenRuleContext::TokenRuleContext(std::size_t max_depth)
    : max_depth_(max_depth) {}

Status TokenRuleContext::define_rule(const std::string& name, TokenRulePtr rule) {
    if (name.empty()) {
        return WeftError{WeftError::InvalidArg, "rule name must not be empty"};
    }
    if (!rule) {
        return WeftError{WeftError::InvalidArg,
            "rule '" + name + "' must not be null"};
    }
    if (ids_.count(name)) {
        return WeftError{WeftError::Duplicate,
            "rule '" + name + "' is already defined",
            "each named rule can be defined once"};
    }
    ids_.emplace(name, arena_.size());
    names_.push_back(name);
    arena_.push_back(std::move(rule));
    return ok_status();
}

TokenRulePtr TokenRuleContext::rule_reference(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) return nullptr;
    return arena_[it->second];
}

std::optional<std::size_t> TokenRuleContext::rule_id(const std::string& name) const {
    auto it = ids_.find(name);
    if (it == ids_.end()) return std::nullopt;
    return it->second;
}

TokenRulePtr TokenRuleContext::rule_at(std::size_t id) const {
    if (id >= arena_.size()) return nullptr;
    return arena_[id];
}

void TokenRuleContext::capture_tokens(const std::string& name, TokenList tokens) {
    captures_[name] = std::move(tokens);
}

const TokenList* TokenRuleContext::captured_tokens(const std::string& name) const {
    auto it = captures_.find(name);
    if (it == captures_.end()) return nullptr;
    return &it->second;
}

void TokenRuleContext::clear_captures() {
    captures_.clear();
}

bool TokenRuleContext::enter() {
    if (depth_ >= max_depth_) {
        if (!depth_warned_) {
            log::warn("rule recursion deeper than %zu levels, treating as no match",
                      max_depth_);
            depth_warned_ = true;
        }
        return false;
    }
    ++depth_;
    return true;
}

void TokenRuleContext::leave() {
    if (depth_ > 0) --depth_;
}

} // namespace weft
