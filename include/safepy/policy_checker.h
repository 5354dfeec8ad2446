#pragma once

#include "api_export.h"
#include "syntax_tree.h"
#include <string>
#include <unordered_set>

namespace safepy {

struct PolicyConfig {
    // Bare function names callable in restricted mode
    std::unordered_set<std::string> allowed_functions{
        "create",
        "save",
        "search",
        "CodeSkill"
    };

    // A call is also allowed when its callee text contains one of these,
    // anywhere in the text
    std::unordered_set<std::string> allowed_methods{
        ".show",
        ".test",
        ".run",
        "__add__",
        "__gt__",
        "__lt__",
        "__annotations__"
    };
};

struct PolicyDecision {
    bool allowed = true;
    std::string reason;      // Why the source was rejected
    std::string construct;   // Offending node type or call text

    static PolicyDecision Allow() { return PolicyDecision{}; }
    static PolicyDecision Reject(const std::string& reason, const std::string& construct) {
        PolicyDecision decision;
        decision.allowed = false;
        decision.reason = reason;
        decision.construct = construct;
        return decision;
    }
};

/**
 * PolicyChecker - static gate run before any execution
 *
 * Unrestricted checks always pass. Restricted checks parse the source and
 * reject imports, function and class definitions, and every call that is
 * neither an allowed bare function nor an allowed method. Parse failures are
 * rejections. Checking never executes the source and has no side effects.
 *
 * Method fragments match anywhere in the callee's source text, not only as
 * its final attribute. A callee such as `[open, '.run'][0]` therefore
 * passes, so the method list must only name fragments that are safe to
 * appear in any callee expression.
 */
class SAFEPY_API PolicyChecker {
public:
    PolicyChecker();
    explicit PolicyChecker(const PolicyConfig& config);

    PolicyDecision Check(const std::string& source, bool restricted) const;

    // Check an already parsed tree (restricted rules)
    PolicyDecision CheckTree(const SyntaxNode& root) const;

    bool IsAllowedFunction(const SyntaxNode& call) const;
    bool IsAllowedMethod(const SyntaxNode& call) const;

    void SetConfig(const PolicyConfig& config) { config_ = config; }
    const PolicyConfig& GetConfig() const { return config_; }

private:
    PolicyConfig config_;
};

} // namespace safepy
