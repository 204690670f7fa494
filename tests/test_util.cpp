#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include "path.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <filesystem>
#include <set>

using namespace largefile;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  def hello():\t\n") == "def hello():");
}

TEST_CASE("trim: all whitespace becomes empty", "[util]") {
    REQUIRE(trim(" \t\r\n ").empty());
    REQUIRE(trim("").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim("a  b") == "a  b");
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex characters", "[util]") {
    auto id = generate_id();
    REQUIRE(id.size() == 16);
    REQUIRE(id.find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("generate_id: unique across calls", "[util]") {
    std::set<std::string> ids;
    for (int i = 0; i < 100; i++) ids.insert(generate_id());
    REQUIRE(ids.size() == 100);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/notes.txt") == std::string(home) + "/notes.txt");
    REQUIRE(expand_home("~") == std::string(home));
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/tmp/x") == "/tmp/x");
    REQUIRE(expand_home("relative/x") == "relative/x");
    REQUIRE(expand_home("~other/x") == "~other/x");
}

// ── to_lower ─────────────────────────────────────────────────────

TEST_CASE("to_lower: ASCII letters only", "[util]") {
    REQUIRE(to_lower("UTF-8") == "utf-8");
    REQUIRE(to_lower("\xc3\x89t\xc3\xa9") == "\xc3\x89t\xc3\xa9");
}

// ── epoch_seconds ────────────────────────────────────────────────

TEST_CASE("epoch_seconds: after 2020", "[util]") {
    REQUIRE(epoch_seconds() > 1577836800ULL);
}

// ── resolve_path ─────────────────────────────────────────────────

TEST_CASE("resolve_path: normalizes dot segments", "[util]") {
    REQUIRE(resolve_path("/tmp/a/../b/./c.txt") == "/tmp/b/c.txt");
}

TEST_CASE("resolve_path: relative paths become absolute", "[util]") {
    auto cwd = std::filesystem::current_path().string();
    REQUIRE(resolve_path("x.txt") == (std::filesystem::path(cwd) / "x.txt").lexically_normal().string());
}

TEST_CASE("resolve_path: strips trailing separator", "[util]") {
    REQUIRE(resolve_path("/tmp/dir/") == "/tmp/dir");
    REQUIRE(resolve_path("/") == "/");
}

TEST_CASE("resolve_path: same file through different spellings", "[util]") {
    REQUIRE(resolve_path("/tmp//x/../y.txt") == resolve_path("/tmp/y.txt"));
}

TEST_CASE("resolve_path: symlinked file resolves to its target", "[util]") {
    TempDir tmp;
    write_file(tmp.file("real.txt"), "x\n");
    std::filesystem::create_symlink(tmp.file("real.txt"), tmp.file("alias.txt"));

    REQUIRE(resolve_path(tmp.file("alias.txt")) == resolve_path(tmp.file("real.txt")));
}

TEST_CASE("resolve_path: dot-dot after a directory symlink follows the link", "[util]") {
    TempDir tmp;
    std::filesystem::create_directories(tmp.file("a/b"));
    write_file(tmp.file("a/target.txt"), "x\n");
    std::filesystem::create_directory_symlink(tmp.file("a/b"), tmp.file("link"));

    auto resolved = resolve_path(tmp.file("link/../target.txt"));
    REQUIRE(resolved == resolve_path(tmp.file("a/target.txt")));
    REQUIRE(std::filesystem::exists(resolved));
}

TEST_CASE("resolve_path: missing tail under a symlinked directory", "[util]") {
    TempDir tmp;
    std::filesystem::create_directories(tmp.file("a"));
    std::filesystem::create_directory_symlink(tmp.file("a"), tmp.file("link"));

    REQUIRE(resolve_path(tmp.file("link/new/file.txt")) ==
            resolve_path(tmp.file("a")) + "/new/file.txt");
}
