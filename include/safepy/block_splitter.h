#pragma once

#include "api_export.h"
#include <string>
#include <vector>

namespace safepy {

// Source split into top-level statement groups, last one held apart
struct CodeBlock {
    std::vector<std::string> body;  // Executed as statements, in order
    std::string tail;               // Evaluated as an expression when possible

    bool Empty() const { return body.empty() && tail.empty(); }
};

// Split source at top-level statement boundaries. Decorators stay with the
// statement they decorate; statements joined by ';' become separate groups.
// Source that does not parse comes back whole as a single group so the
// fault surfaces when it runs. Blank or comment-only source yields nothing.
SAFEPY_API std::vector<std::string> SplitStatements(const std::string& source);

// SplitStatements() with the final group popped into CodeBlock::tail
SAFEPY_API CodeBlock SplitCodeBlocks(const std::string& source);

} // namespace safepy
