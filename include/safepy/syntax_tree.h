#pragma once

#include "api_export.h"
#include <string>
#include <vector>
#include <cstddef>

namespace safepy {

// Closed set of node categories the policy cares about.
// Everything else collapses into Other.
enum class NodeKind {
    Import,       // import x / from x import y
    FunctionDef,  // def / async def
    ClassDef,     // class
    Call,         // f(...) / obj.m(...)
    Other
};

SAFEPY_API const char* GetNodeKindName(NodeKind kind);

// Lines are 1-based, columns are 0-based byte offsets into the line.
struct SourceSpan {
    int begin_line = 0;
    int begin_col = 0;
    int end_line = 0;
    int end_col = 0;

    bool IsValid() const { return begin_line > 0 && end_line >= begin_line; }
};

/**
 * SyntaxNode - language-neutral view of one parser node
 *
 * Only calls carry source text; other nodes keep their kind, the host
 * parser's class name and a span.
 */
struct SyntaxNode {
    NodeKind kind = NodeKind::Other;
    std::string type_name;       // Host parser class, e.g. "ImportFrom"
    std::string text;            // Source text of a call, e.g. "open('/etc/passwd')"
    std::string callee_name;     // Bare function name when the callee is a plain name
    std::string callee_text;     // Source text of the called expression, e.g. "skill.run"
    SourceSpan span;
    std::vector<SyntaxNode> children;

    bool IsCall() const { return kind == NodeKind::Call; }
};

class SyntaxVisitor {
public:
    virtual ~SyntaxVisitor() = default;

    // Return false to stop the walk
    virtual bool Visit(const SyntaxNode& node) = 0;
};

// Pre-order walk over root and all descendants.
// Returns false if the visitor stopped early.
SAFEPY_API bool Walk(const SyntaxNode& root, SyntaxVisitor& visitor);

// Total number of nodes in the tree (root included)
SAFEPY_API size_t CountNodes(const SyntaxNode& root);

class SAFEPY_API SyntaxParser {
public:
    // Parse source with the embedded interpreter's parser.
    // On failure returns false and sets error to "<ErrorType>: <message>".
    // Acquires the GIL itself; the interpreter must be initialized.
    static bool Parse(const std::string& source, SyntaxNode& root, std::string& error);
};

// Byte offset of (line, col) inside source, or std::string::npos when the
// position lies outside it. Understands \n and \r\n line endings.
SAFEPY_API size_t OffsetOf(const std::string& source, int line, int col);

} // namespace safepy
