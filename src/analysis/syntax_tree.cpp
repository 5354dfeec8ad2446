#include "safepy/syntax_tree.h"
#include <pybind11/embed.h>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace py = pybind11;

namespace {

/**
 * Converts a tree produced by Python's ast module into SyntaxNode values.
 * Must run with the GIL held.
 */
class AstConverter {
public:
    explicit AstConverter(const py::module_& ast)
        : iter_child_nodes_(ast.attr("iter_child_nodes"))
        , unparse_(ast.attr("unparse"))
        , import_(ast.attr("Import"))
        , import_from_(ast.attr("ImportFrom"))
        , function_def_(ast.attr("FunctionDef"))
        , async_function_def_(ast.attr("AsyncFunctionDef"))
        , class_def_(ast.attr("ClassDef"))
        , call_(ast.attr("Call"))
        , name_(ast.attr("Name"))
    {
    }

    safepy::SyntaxNode Convert(const py::handle& node) {
        safepy::SyntaxNode out;
        out.type_name = py::str(node.attr("__class__").attr("__name__"));
        out.kind = Classify(node);
        out.span = SpanOf(node);

        if (out.kind == safepy::NodeKind::Call) {
            py::object func = node.attr("func");
            out.text = py::str(unparse_(node));
            out.callee_text = py::str(unparse_(func));
            if (py::isinstance(func, name_)) {
                out.callee_name = py::str(func.attr("id"));
            }
        }

        for (auto child : iter_child_nodes_(node)) {
            out.children.push_back(Convert(child));
        }
        return out;
    }

private:
    safepy::NodeKind Classify(const py::handle& node) const {
        if (py::isinstance(node, import_) || py::isinstance(node, import_from_)) {
            return safepy::NodeKind::Import;
        }
        if (py::isinstance(node, function_def_) || py::isinstance(node, async_function_def_)) {
            return safepy::NodeKind::FunctionDef;
        }
        if (py::isinstance(node, class_def_)) {
            return safepy::NodeKind::ClassDef;
        }
        if (py::isinstance(node, call_)) {
            return safepy::NodeKind::Call;
        }
        return safepy::NodeKind::Other;
    }

    static int IntAttr(const py::handle& node, const char* name) {
        if (!py::hasattr(node, name)) {
            return -1;
        }
        py::object value = node.attr(name);
        if (value.is_none()) {
            return -1;
        }
        return value.cast<int>();
    }

    static safepy::SourceSpan SpanOf(const py::handle& node) {
        safepy::SourceSpan span;
        int begin_line = IntAttr(node, "lineno");
        int end_line = IntAttr(node, "end_lineno");
        if (begin_line <= 0 || end_line <= 0) {
            return span;
        }

        span.begin_line = begin_line;
        span.begin_col = IntAttr(node, "col_offset");
        span.end_line = end_line;
        span.end_col = IntAttr(node, "end_col_offset");

        // Decorators sit above the statement they belong to; the '@' is one
        // byte before the decorator expression.
        if (py::hasattr(node, "decorator_list")) {
            for (auto decorator : node.attr("decorator_list")) {
                int line = IntAttr(decorator, "lineno");
                int col = std::max(IntAttr(decorator, "col_offset") - 1, 0);
                if (line > 0 && (line < span.begin_line ||
                                 (line == span.begin_line && col < span.begin_col))) {
                    span.begin_line = line;
                    span.begin_col = col;
                }
            }
        }
        return span;
    }

    py::object iter_child_nodes_;
    py::object unparse_;
    py::object import_;
    py::object import_from_;
    py::object function_def_;
    py::object async_function_def_;
    py::object class_def_;
    py::object call_;
    py::object name_;
};

bool WalkImpl(const safepy::SyntaxNode& node, safepy::SyntaxVisitor& visitor) {
    if (!visitor.Visit(node)) {
        return false;
    }
    for (const auto& child : node.children) {
        if (!WalkImpl(child, visitor)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

namespace safepy {

const char* GetNodeKindName(NodeKind kind) {
    switch (kind) {
        case NodeKind::Import: return "Import";
        case NodeKind::FunctionDef: return "FunctionDef";
        case NodeKind::ClassDef: return "ClassDef";
        case NodeKind::Call: return "Call";
        case NodeKind::Other: return "Other";
    }
    return "Unknown";
}

bool Walk(const SyntaxNode& root, SyntaxVisitor& visitor) {
    return WalkImpl(root, visitor);
}

size_t CountNodes(const SyntaxNode& root) {
    size_t count = 1;
    for (const auto& child : root.children) {
        count += CountNodes(child);
    }
    return count;
}

bool SyntaxParser::Parse(const std::string& source, SyntaxNode& root, std::string& error) {
    if (!Py_IsInitialized()) {
        error = "RuntimeError: Python interpreter is not initialized";
        return false;
    }

    py::gil_scoped_acquire acquire;

    try {
        py::module_ ast = py::module_::import("ast");

        py::object tree;
        try {
            tree = ast.attr("parse")(source, "<sandbox>", "exec");
        } catch (const py::error_already_set& e) {
            // SyntaxError, IndentationError, ValueError (null bytes), RecursionError
            std::string type_name = py::str(e.type().attr("__name__"));
            std::string message = py::str(e.value());
            error = type_name + ": " + message;
            spdlog::debug("Parse failed: {}", error);
            return false;
        }

        AstConverter converter(ast);
        root = converter.Convert(tree);
        return true;

    } catch (const py::error_already_set& e) {
        error = std::string("RuntimeError: syntax tree conversion failed: ") + e.what();
        spdlog::error("{}", error);
        return false;
    }
}

size_t OffsetOf(const std::string& source, int line, int col) {
    if (line < 1 || col < 0) {
        return std::string::npos;
    }

    size_t offset = 0;
    for (int current = 1; current < line; ++current) {
        size_t newline = source.find('\n', offset);
        if (newline == std::string::npos) {
            return std::string::npos;
        }
        offset = newline + 1;
    }

    size_t position = offset + static_cast<size_t>(col);
    if (position > source.size()) {
        return std::string::npos;
    }
    return position;
}

} // namespace safepy
