#include "safepy/block_splitter.h"
#include "safepy/syntax_tree.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace safepy {

namespace {

bool IsBlank(const std::string& source) {
    return std::all_of(source.begin(), source.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

std::vector<std::string> SplitStatements(const std::string& source) {
    std::vector<std::string> groups;
    if (IsBlank(source)) {
        return groups;
    }

    SyntaxNode module;
    std::string error;
    if (!SyntaxParser::Parse(source, module, error)) {
        spdlog::debug("Splitting unparsable source as one block ({})", error);
        groups.push_back(source);
        return groups;
    }

    for (const auto& statement : module.children) {
        if (!statement.span.IsValid()) {
            continue;
        }

        size_t begin = OffsetOf(source, statement.span.begin_line, statement.span.begin_col);
        size_t end = OffsetOf(source, statement.span.end_line, statement.span.end_col);
        if (begin == std::string::npos || end == std::string::npos || end <= begin) {
            // Spans always map back into the parsed text; bail out to a single block
            spdlog::warn("Statement span {}:{}-{}:{} outside source, keeping source whole",
                statement.span.begin_line, statement.span.begin_col,
                statement.span.end_line, statement.span.end_col);
            groups.assign(1, source);
            return groups;
        }

        groups.push_back(source.substr(begin, end - begin));
    }

    return groups;
}

CodeBlock SplitCodeBlocks(const std::string& source) {
    CodeBlock block;
    block.body = SplitStatements(source);
    if (!block.body.empty()) {
        block.tail = std::move(block.body.back());
        block.body.pop_back();
    }
    return block;
}

} // namespace safepy
