#include <catch2/catch_test_macros.hpp>
#include <safepy/block_splitter.h>
#include <string>
#include <vector>

using namespace safepy;

TEST_CASE("SplitStatements on empty input", "[block_splitter]") {
    REQUIRE(SplitStatements("").empty());
    REQUIRE(SplitStatements("  \n\t\n").empty());

    CodeBlock block = SplitCodeBlocks("\n\n");
    REQUIRE(block.Empty());
    REQUIRE(block.tail.empty());
}

TEST_CASE("SplitStatements returns one group per top-level statement", "[block_splitter]") {
    std::vector<std::string> groups = SplitStatements("x = 5\ny = x * 2\nx + y\n");

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == "x = 5");
    REQUIRE(groups[1] == "y = x * 2");
    REQUIRE(groups[2] == "x + y");
}

TEST_CASE("Compound statements stay whole", "[block_splitter]") {
    SECTION("function with a body") {
        std::vector<std::string> groups = SplitStatements(
            "def f(a):\n    b = a + 1\n    return b\nf(1)\n");

        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0] == "def f(a):\n    b = a + 1\n    return b");
        REQUIRE(groups[1] == "f(1)");
    }

    SECTION("loop with else") {
        std::vector<std::string> groups = SplitStatements(
            "for i in range(3):\n    pass\nelse:\n    done = True\n");

        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0] == "for i in range(3):\n    pass\nelse:\n    done = True");
    }

    SECTION("multi-line expression") {
        std::vector<std::string> groups = SplitStatements("values = [\n    1,\n    2,\n]\nvalues\n");

        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0] == "values = [\n    1,\n    2,\n]");
    }

    SECTION("decorators belong to their definition") {
        std::vector<std::string> groups = SplitStatements(
            "@wrap\n@other(1)\ndef f():\n    return 1\n");

        REQUIRE(groups.size() == 1);
        REQUIRE(groups[0] == "@wrap\n@other(1)\ndef f():\n    return 1");
    }
}

TEST_CASE("Semicolon-separated statements are split", "[block_splitter]") {
    std::vector<std::string> groups = SplitStatements("a = 1; b = 2; a + b");

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == "a = 1");
    REQUIRE(groups[1] == "b = 2");
    REQUIRE(groups[2] == "a + b");
}

TEST_CASE("Comments between statements are dropped", "[block_splitter]") {
    std::vector<std::string> groups = SplitStatements("# setup\nx = 1  # one\n# done\nx\n");

    REQUIRE(groups.size() == 2);
    REQUIRE(groups[0] == "x = 1");
    REQUIRE(groups[1] == "x");
}

TEST_CASE("Unparsable source is kept as one group", "[block_splitter]") {
    const std::string source = "x = 1\ny = (\n";
    std::vector<std::string> groups = SplitStatements(source);

    REQUIRE(groups.size() == 1);
    REQUIRE(groups[0] == source);
}

TEST_CASE("SplitCodeBlocks separates the tail", "[block_splitter]") {
    SECTION("several statements") {
        CodeBlock block = SplitCodeBlocks("x = 5\nx + 1\n");
        REQUIRE(block.body.size() == 1);
        REQUIRE(block.body[0] == "x = 5");
        REQUIRE(block.tail == "x + 1");
    }

    SECTION("single statement") {
        CodeBlock block = SplitCodeBlocks("print('hi')");
        REQUIRE(block.body.empty());
        REQUIRE(block.tail == "print('hi')");
        REQUIRE_FALSE(block.Empty());
    }

    SECTION("tail may be a statement") {
        CodeBlock block = SplitCodeBlocks("x = 1\nif x:\n    y = 2\n");
        REQUIRE(block.body.size() == 1);
        REQUIRE(block.tail == "if x:\n    y = 2");
    }
}

TEST_CASE("Non-ASCII source keeps byte-exact slices", "[block_splitter]") {
    std::vector<std::string> groups = SplitStatements("s = \"h\xC3\xA9llo\"; t = s\nt\n");

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == "s = \"h\xC3\xA9llo\"");
    REQUIRE(groups[1] == "t = s");
}
