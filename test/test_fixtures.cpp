#include <catch2/catch_all.hpp>
#include <tl/tsconfig.h>
#include <filesystem>

namespace fs = std::filesystem;

static fs::path fixture(const std::string& name) {
    return fs::path(TSLOAD_FIXTURES_DIR) / name;
}

TEST_CASE("every fixture file parses") {
    fs::path fixtures = TSLOAD_FIXTURES_DIR;
    REQUIRE(fs::exists(fixtures));

    int count = 0;
    for (auto const& e : fs::directory_iterator(fixtures)) {
        if (!e.is_regular_file()) continue;
        if (e.path().extension() != ".json") continue;
        try {
            auto v = tl::read_file(e.path());
            REQUIRE(v.isDict());
            ++count;
        } catch (const std::exception& ex) {
            FAIL("Failed to parse " + e.path().string() + ": " + ex.what());
        }
    }
    REQUIRE(count >= 6);
}

TEST_CASE("fixture: basic") {
    auto v = tl::read_file(fixture("basic.json"));
    REQUIRE(v.at("compilerOptions").at("target").asString() == "es2017");
    REQUIRE(v.at("files").asStrings() == std::vector<std::string>{"src/index.ts"});
}

TEST_CASE("fixture: comments") {
    auto v = tl::read_file(fixture("commented.json"));
    REQUIRE(v.at("compilerOptions").at("lib").size() == 2);
    REQUIRE(v.at("compilerOptions").at("paths").at("@app/*").at(0).asString() == "src/app/*");
    REQUIRE(v.at("include").at(0).asString() == "src/**/*.ts");
}

TEST_CASE("fixture: trailing commas") {
    auto v = tl::read_file(fixture("trailing_commas.json"));
    REQUIRE(v.at("compilerOptions").size() == 2);
    REQUIRE(v.at("exclude").asStrings() == std::vector<std::string>{"node_modules", "dist"});
}

TEST_CASE("fixture: byte order mark and CRLF") {
    auto v = tl::read_file(fixture("bom_crlf.json"));
    REQUIRE(v.at("compilerOptions").at("newLine").asString() == "crlf");
}

TEST_CASE("fixture: blank file") {
    auto v = tl::read_file(fixture("empty.json"));
    REQUIRE(v == tl::Value::object());
}

TEST_CASE("fixture: escapes and comment markers inside strings") {
    auto v = tl::read_file(fixture("escapes.json"));
    REQUIRE(v.at("compilerOptions").at("rootDir").asString() == "C:\\src\\");
    REQUIRE(v.at("compilerOptions").at("outFile").asString() == "out\\\"quoted\",].js");
    REQUIRE(v.at("files").asStrings() == std::vector<std::string>{"a,b.ts", "c//d.ts", "e/*f*/.ts"});
}

TEST_CASE("fixtures directory is found by load with an explicit file") {
    auto result = tl::load(TSLOAD_FIXTURES_DIR, "basic.json");
    REQUIRE(result.path.has_value());
    REQUIRE(result.path->filename() == "basic.json");
}
