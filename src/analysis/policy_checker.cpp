#include "safepy/policy_checker.h"
#include <spdlog/spdlog.h>

namespace safepy {

namespace {

// Stops at the first node the policy forbids
class RestrictedVisitor : public SyntaxVisitor {
public:
    explicit RestrictedVisitor(const PolicyChecker& checker)
        : checker_(checker)
    {
    }

    bool Visit(const SyntaxNode& node) override {
        switch (node.kind) {
            case NodeKind::Import:
            case NodeKind::FunctionDef:
            case NodeKind::ClassDef:
                decision_ = PolicyDecision::Reject(
                    "Usage of " + node.type_name + " nodes is not allowed",
                    node.type_name);
                return false;

            case NodeKind::Call:
                if (checker_.IsAllowedFunction(node) || checker_.IsAllowedMethod(node)) {
                    return true;
                }
                decision_ = PolicyDecision::Reject(
                    "Usage of disallowed function/method: " + node.text,
                    node.text);
                return false;

            case NodeKind::Other:
                return true;
        }
        return true;
    }

    const PolicyDecision& Decision() const { return decision_; }

private:
    const PolicyChecker& checker_;
    PolicyDecision decision_;
};

} // anonymous namespace

PolicyChecker::PolicyChecker() = default;

PolicyChecker::PolicyChecker(const PolicyConfig& config)
    : config_(config)
{
}

bool PolicyChecker::IsAllowedFunction(const SyntaxNode& call) const {
    return call.kind == NodeKind::Call
        && !call.callee_name.empty()
        && config_.allowed_functions.count(call.callee_name) > 0;
}

bool PolicyChecker::IsAllowedMethod(const SyntaxNode& call) const {
    if (call.kind != NodeKind::Call) {
        return false;
    }
    for (const auto& fragment : config_.allowed_methods) {
        if (call.callee_text.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

PolicyDecision PolicyChecker::CheckTree(const SyntaxNode& root) const {
    RestrictedVisitor visitor(*this);
    Walk(root, visitor);
    return visitor.Decision();
}

PolicyDecision PolicyChecker::Check(const std::string& source, bool restricted) const {
    if (!restricted) {
        return PolicyDecision::Allow();
    }

    SyntaxNode root;
    std::string parse_error;
    if (!SyntaxParser::Parse(source, root, parse_error)) {
        spdlog::warn("Policy check rejected unparsable source: {}", parse_error);
        return PolicyDecision::Reject(parse_error, "parse");
    }

    PolicyDecision decision = CheckTree(root);
    if (!decision.allowed) {
        spdlog::warn("Policy violation: {}", decision.reason);
    }
    return decision;
}

} // namespace safepy
