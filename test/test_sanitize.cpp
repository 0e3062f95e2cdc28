#include <catch2/catch_all.hpp>
#include <tl/sanitize.h>
#include <string>

using namespace tl;

TEST_CASE("dangling comma before a closer becomes a space", "[sanitize][commas]") {
    REQUIRE(strip_dangling_commas("[1,2,]") == "[1,2 ]");
    REQUIRE(strip_dangling_commas(R"({"a":1,})") == R"({"a":1 })");
    REQUIRE(strip_dangling_commas("[1,2,\n  ]") == "[1,2 \n  ]");
    REQUIRE(strip_dangling_commas("{\"a\": [1,\t],\r\n}") == "{\"a\": [1 \t] \r\n}");
}

TEST_CASE("only the comma nearest the closer is rewritten", "[sanitize][commas]") {
    REQUIRE(strip_dangling_commas("[1,2,,]") == "[1,2, ]");
    REQUIRE(strip_dangling_commas("[,]") == "[ ]");
    REQUIRE(strip_dangling_commas("[1, , ]") == "[1,   ]");
}

TEST_CASE("ordinary separators are left alone", "[sanitize][commas]") {
    std::string s = R"({"a": 1, "b": [1, 2, 3], "c": {"d": null}})";
    REQUIRE(strip_dangling_commas(s) == s);
    REQUIRE(strip_dangling_commas("[1 , 2]") == "[1 , 2]");
}

TEST_CASE("text without quotes or trailing commas is unchanged", "[sanitize][commas]") {
    for (std::string s : {std::string(""), std::string("   "), std::string("abc"), std::string("[1,2]"),
                          std::string("{}"), std::string("a,b,c"), std::string(", x ]"),
                          std::string("]]],,,x"), std::string("{ a: 1 }")}) {
        INFO(s);
        REQUIRE(strip_dangling_commas(s) == s);
    }
}

TEST_CASE("commas inside strings are never rewritten", "[sanitize][commas]") {
    REQUIRE(strip_dangling_commas(R"({"a,":1,})") == R"({"a,":1 })");
    REQUIRE(strip_dangling_commas(R"(["x,]"])") == R"(["x,]"])");
    REQUIRE(strip_dangling_commas(R"(["a", "b,  ]", ])") == R"(["a", "b,  ]"  ])");
}

TEST_CASE("escaped quotes toggle string mode by backslash parity", "[sanitize][commas][escape]") {
    SECTION("one backslash escapes the quote") {
        // the string never closes, so nothing after it is rewritten
        std::string s = R"({"a\":1},})";
        REQUIRE(strip_dangling_commas(s) == s);
    }
    SECTION("two backslashes are an escaped backslash followed by a real quote") {
        REQUIRE(strip_dangling_commas(R"({"a\\":1,})") == R"({"a\\":1 })");
    }
    SECTION("three backslashes escape the quote again") {
        REQUIRE(strip_dangling_commas(R"(["a\\\",]", 1,])") == R"(["a\\\",]", 1 ])");
    }
    SECTION("a quote at position zero is handled") {
        REQUIRE(strip_dangling_commas(R"("x",])") == R"("x" ])");
    }
}

TEST_CASE("an unterminated string swallows the rest of the input", "[sanitize][commas]") {
    std::string s = R"({"a": "oops, 1,})";
    REQUIRE(strip_dangling_commas(s) == s);
}

TEST_CASE("a non-space character cancels the candidate comma", "[sanitize][commas]") {
    REQUIRE(strip_dangling_commas("[1,x]") == "[1,x]");
    REQUIRE(strip_dangling_commas(R"([1,"a"])") == R"([1,"a"])");
}

TEST_CASE("Unicode whitespace between comma and closer is skipped", "[sanitize][commas]") {
    // U+00A0 and U+2028 between the comma and the bracket
    REQUIRE(strip_dangling_commas("[1,\xC2\xA0]") == "[1 \xC2\xA0]");
    REQUIRE(strip_dangling_commas("[1,\xE2\x80\xA8]") == "[1 \xE2\x80\xA8]");
}

TEST_CASE("output keeps the input length", "[sanitize][commas]") {
    std::string s = "{\n  \"files\": [\"a.ts\", \"b.ts\",],\n  \"compilerOptions\": {\"strict\": true,},\n}";
    auto out = strip_dangling_commas(s);
    REQUIRE(out.size() == s.size());
    REQUIRE(out == "{\n  \"files\": [\"a.ts\", \"b.ts\" ],\n  \"compilerOptions\": {\"strict\": true } \n}");
}

TEST_CASE("strip_bom removes only a leading byte order mark", "[sanitize][bom]") {
    REQUIRE(strip_bom("\xEF\xBB\xBF{}") == "{}");
    REQUIRE(strip_bom("{}") == "{}");
    REQUIRE(strip_bom("") == "");
    REQUIRE(strip_bom(" \xEF\xBB\xBF{}") == " \xEF\xBB\xBF{}");
}

TEST_CASE("strip_comments blanks comments and keeps offsets", "[sanitize][comments]") {
    SECTION("line comment") {
        std::string s = "{\"a\": 1} // trailing\n";
        auto out = strip_comments(s);
        REQUIRE(out == "{\"a\": 1}" + std::string(12, ' ') + "\n");
        REQUIRE(out.size() == s.size());
    }
    SECTION("line comment ended by CRLF") {
        REQUIRE(strip_comments("1 //x\r\n2") == "1" + std::string(4, ' ') + "\r\n2");
    }
    SECTION("block comment keeps its newlines") {
        REQUIRE(strip_comments("/* a\n b */{}") == std::string(4, ' ') + "\n" + std::string(5, ' ') + "{}");
    }
    SECTION("inline block comment") {
        REQUIRE(strip_comments(R"({/*c*/"c":3})") == "{" + std::string(5, ' ') + R"("c":3})");
    }
    SECTION("comment markers inside strings are text") {
        std::string s = R"({"url": "http://example.com/*x*/"})";
        REQUIRE(strip_comments(s) == s);
    }
    SECTION("escaped quote does not end the string") {
        std::string s = R"({"a": "say \"//hi\""})";
        REQUIRE(strip_comments(s) == s);
    }
    SECTION("unterminated block comment runs to the end") {
        REQUIRE(strip_comments("[1] /* open") == "[1]" + std::string(8, ' '));
    }
    SECTION("comment at end of input without newline") {
        REQUIRE(strip_comments("{} //") == "{}" + std::string(3, ' '));
    }
}

TEST_CASE("is_blank accepts only whitespace", "[sanitize][blank]") {
    REQUIRE(is_blank(""));
    REQUIRE(is_blank("   \n\t\r"));
    REQUIRE(is_blank("\xEF\xBB\xBF \xC2\xA0"));
    REQUIRE_FALSE(is_blank(" x "));
    REQUIRE_FALSE(is_blank("{}"));
    // a truncated multi-byte sequence is not whitespace
    REQUIRE_FALSE(is_blank("\xC2"));
}

TEST_CASE("is_escaped counts consecutive backslashes", "[sanitize][escape]") {
    REQUIRE_FALSE(is_escaped("\"", 0));
    REQUIRE(is_escaped(R"(\")", 1));
    REQUIRE_FALSE(is_escaped(R"(\\")", 2));
    REQUIRE(is_escaped(R"(\\\")", 3));
    REQUIRE_FALSE(is_escaped(R"(a\b")", 3));
}
