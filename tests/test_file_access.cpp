#include <catch2/catch_test_macros.hpp>
#include "file_access.hpp"
#include "encoding.hpp"
#include "errors.hpp"
#include "mock_file_mapper.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

using namespace largefile;

static FileReader default_reader(uint32_t chunk = 8192) {
    return FileReader(StrategySelector(52428800, 524288000), chunk);
}

// ── StrategySelector ────────────────────────────────────────────

TEST_CASE("StrategySelector: memory threshold boundary", "[file_access]") {
    StrategySelector sel(52428800, 524288000);
    REQUIRE(sel.select(0) == AccessStrategy::Memory);
    REQUIRE(sel.select(52428799) == AccessStrategy::Memory);
    REQUIRE(sel.select(52428800) == AccessStrategy::Mapped);
}

TEST_CASE("StrategySelector: mmap threshold boundary", "[file_access]") {
    StrategySelector sel(52428800, 524288000);
    REQUIRE(sel.select(524287999) == AccessStrategy::Mapped);
    REQUIRE(sel.select(524288000) == AccessStrategy::Streaming);
    REQUIRE(sel.select(5ULL * 1024 * 1024 * 1024) == AccessStrategy::Streaming);
}

TEST_CASE("strategy_name: lowercase names", "[file_access]") {
    REQUIRE(std::string(strategy_name(AccessStrategy::Memory)) == "memory");
    REQUIRE(std::string(strategy_name(AccessStrategy::Mapped)) == "mapped");
    REQUIRE(std::string(strategy_name(AccessStrategy::Streaming)) == "streaming");
}

// ── split_lines / strip_line_ending ─────────────────────────────

TEST_CASE("split_lines: keeps terminators and trailing partial line", "[file_access]") {
    auto lines = split_lines("a\nb\r\nc");
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0] == "a\n");
    REQUIRE(lines[1] == "b\r\n");
    REQUIRE(lines[2] == "c");
}

TEST_CASE("split_lines: empty content has no lines", "[file_access]") {
    REQUIRE(split_lines("").empty());
    REQUIRE(split_lines("\n").size() == 1);
}

TEST_CASE("strip_line_ending: LF and CRLF", "[file_access]") {
    REQUIRE(strip_line_ending("x\n") == "x");
    REQUIRE(strip_line_ending("x\r\n") == "x");
    REQUIRE(strip_line_ending("x") == "x");
}

// ── FileReader ──────────────────────────────────────────────────

TEST_CASE("FileReader: stat reports size and strategy", "[file_access]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    write_file(dir.file("a.txt"), "0123456789");

    FileReader small(StrategySelector(5, 100), 8192);
    auto info = small.stat(dir.file("a.txt"));
    REQUIRE(info.size == 10);
    REQUIRE(info.strategy == AccessStrategy::Mapped);

    FileReader tiny(StrategySelector(5, 8), 8192);
    REQUIRE(tiny.stat(dir.file("a.txt")).strategy == AccessStrategy::Streaming);
}

TEST_CASE("FileReader: every strategy yields identical content", "[file_access]") {
    TempDir dir;
    std::string content;
    for (int i = 0; i < 200; i++) {
        content += "line " + std::to_string(i) + " caf\xc3\xa9 \xe2\x98\x83\n";
    }
    write_file(dir.file("multi.txt"), content);

    auto reader = default_reader(7);  // chunks split multi-byte characters
    auto path = dir.file("multi.txt");
    REQUIRE(reader.read(path, "utf-8", AccessStrategy::Memory) == content);
    REQUIRE(reader.read(path, "utf-8", AccessStrategy::Mapped) == content);
    REQUIRE(reader.read(path, "utf-8", AccessStrategy::Streaming) == content);

    auto mem_lines = reader.read_lines(path, "utf-8", AccessStrategy::Memory);
    auto stream_lines = reader.read_lines(path, "utf-8", AccessStrategy::Streaming);
    REQUIRE(mem_lines.size() == 200);
    REQUIRE(mem_lines == stream_lines);
}

TEST_CASE("FileReader: streaming decodes utf-16 across chunks", "[file_access]") {
    TempDir dir;
    std::string text = "first \xe2\x98\x83\nsecond\nthird";
    write_file(dir.file("wide.txt"), encode(text, Encoding::Utf16));

    auto reader = default_reader(3);
    REQUIRE(reader.read(dir.file("wide.txt"), "utf-16", AccessStrategy::Streaming) == text);
    auto lines = reader.read_lines(dir.file("wide.txt"), "utf-16", AccessStrategy::Streaming);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[2] == "third");
}

TEST_CASE("FileReader: mapped read of an empty file", "[file_access]") {
    TempDir dir;
    write_file(dir.file("empty.txt"), "");
    auto reader = default_reader();
    REQUIRE(reader.read(dir.file("empty.txt"), "utf-8", AccessStrategy::Mapped).empty());
    REQUIRE(reader.read_lines(dir.file("empty.txt"), "utf-8").empty());
}

TEST_CASE("FileReader: failed mapping falls back to a memory read", "[file_access]") {
    TempDir dir;
    std::string content;
    for (int i = 0; i < 100; i++) content += "row " + std::to_string(i) + " caf\xc3\xa9\n";
    write_file(dir.file("big.txt"), content);

    auto mapper = std::make_shared<MockFileMapper>();
    mapper->fail = true;
    FileReader reader(StrategySelector(16, 1 << 20), 8192, mapper);
    REQUIRE(reader.stat(dir.file("big.txt")).strategy == AccessStrategy::Mapped);

    REQUIRE(reader.read(dir.file("big.txt"), "utf-8") == content);
    REQUIRE(reader.read_lines(dir.file("big.txt"), "utf-8").size() == 100);
    REQUIRE(mapper->map_calls == 2);
    REQUIRE(mapper->unmap_calls == 0);
}

TEST_CASE("FileReader: mapped region released after decoding", "[file_access]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "alpha\nbeta\n");

    auto mapper = std::make_shared<MockFileMapper>();
    FileReader reader(StrategySelector(0, 1 << 20), 8192, mapper);
    REQUIRE(reader.read(dir.file("a.txt"), "utf-8") == "alpha\nbeta\n");
    REQUIRE(mapper->map_calls == 1);
    REQUIRE(mapper->unmap_calls == 1);

    // A decode failure still releases the mapping
    write_file(dir.file("bad.txt"), "ok\xff\n");
    REQUIRE_THROWS_AS(reader.read(dir.file("bad.txt"), "utf-8"), AccessError);
    REQUIRE(mapper->unmap_calls == 2);
}

TEST_CASE("FileReader: for_each_line stops early", "[file_access]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "1\n2\n3\n4\n");
    auto reader = default_reader(2);

    std::vector<std::string> seen;
    reader.for_each_line(dir.file("a.txt"), "utf-8", [&](const std::string& line) {
        seen.push_back(line);
        return seen.size() < 2;
    });
    REQUIRE(seen.size() == 2);
    REQUIRE(seen[1] == "2\n");
}

TEST_CASE("FileReader: read_line_range is 1-based inclusive", "[file_access]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "1\n2\n3\n4\n5");
    auto reader = default_reader();

    auto mid = reader.read_line_range(dir.file("a.txt"), "utf-8", 2, 4);
    REQUIRE(mid == std::vector<std::string>{"2\n", "3\n", "4\n"});

    auto tail = reader.read_line_range(dir.file("a.txt"), "utf-8", 4, 99);
    REQUIRE(tail == std::vector<std::string>{"4\n", "5"});

    REQUIRE(reader.read_line_range(dir.file("a.txt"), "utf-8", 3, 2).empty());
}

TEST_CASE("FileReader: read_bytes skips decoding", "[file_access]") {
    TempDir dir;
    std::string raw("\xff\x00\xfe", 3);
    write_file(dir.file("bin"), raw);
    REQUIRE(default_reader().read_bytes(dir.file("bin")) == raw);
}

TEST_CASE("FileReader: missing file is NotFound", "[file_access]") {
    TempDir dir;
    auto reader = default_reader();
    try {
        reader.read(dir.file("nope.txt"), "utf-8");
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::NotFound);
        REQUIRE(e.path() == dir.file("nope.txt"));
    }
}

TEST_CASE("FileReader: directory is rejected", "[file_access]") {
    TempDir dir;
    auto reader = default_reader();
    try {
        reader.stat(dir.path);
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::Io);
    }
}

TEST_CASE("FileReader: unreadable file is PermissionDenied", "[file_access]") {
    if (geteuid() == 0) SKIP("root ignores file permissions");
    TempDir dir;
    write_file(dir.file("secret.txt"), "x");
    chmod(dir.file("secret.txt").c_str(), 0);

    try {
        default_reader().read(dir.file("secret.txt"), "utf-8");
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::PermissionDenied);
    }
}

TEST_CASE("FileReader: undecodable content is DecodeFailed", "[file_access]") {
    TempDir dir;
    write_file(dir.file("bad.txt"), "ok\n\xff\xfe\xfd\n");
    auto reader = default_reader();
    for (auto strategy : {AccessStrategy::Memory, AccessStrategy::Mapped,
                          AccessStrategy::Streaming}) {
        try {
            reader.read(dir.file("bad.txt"), "utf-8", strategy);
            FAIL("expected AccessError");
        } catch (const AccessError& e) {
            REQUIRE(e.kind() == AccessError::Kind::DecodeFailed);
        }
    }
}

TEST_CASE("FileReader: unsupported encoding is DecodeFailed", "[file_access]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "x");
    try {
        default_reader().read(dir.file("a.txt"), "ebcdic");
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::DecodeFailed);
    }
}

TEST_CASE("FileReader: write then read per encoding", "[file_access]") {
    TempDir dir;
    auto reader = default_reader(5);
    const std::string unicode = "caf\xc3\xa9 \xe2\x98\x83\nline two\n";
    const std::string latin = "caf\xc3\xa9\nna\xc3\xafve\n";
    const std::string ascii = "plain\ntext\n";

    struct Case { const char* enc; const std::string* text; };
    for (const auto& c : {Case{"utf-8", &unicode}, Case{"ascii", &ascii},
                          Case{"latin-1", &latin}, Case{"utf-16le", &unicode},
                          Case{"utf-16be", &unicode}, Case{"utf-16", &unicode}}) {
        auto path = dir.file(std::string("rt-") + c.enc + ".txt");
        reader.write(path, *c.text, c.enc);
        for (auto strategy : {AccessStrategy::Memory, AccessStrategy::Mapped,
                              AccessStrategy::Streaming}) {
            INFO(c.enc << " / " << strategy_name(strategy));
            REQUIRE(reader.read(path, c.enc, strategy) == *c.text);
        }
    }
}

TEST_CASE("FileReader: write rejects unrepresentable text", "[file_access]") {
    TempDir dir;
    auto path = dir.file("a.txt");
    write_file(path, "original");
    try {
        default_reader().write(path, "\xe2\x98\x83", "latin-1");
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::WriteFailed);
    }
    REQUIRE(read_file(path) == "original");
}

// ── atomic_write ────────────────────────────────────────────────

TEST_CASE("atomic_write: replaces content and leaves no temp files", "[file_access]") {
    TempDir dir;
    auto path = dir.file("a.txt");
    write_file(path, "old");
    atomic_write(path, "new content");
    REQUIRE(read_file(path) == "new content");
    REQUIRE(count_files(dir.path) == 1);
}

TEST_CASE("atomic_write: keeps file permissions", "[file_access]") {
    TempDir dir;
    auto path = dir.file("script.sh");
    write_file(path, "#!/bin/sh\n");
    chmod(path.c_str(), 0750);

    atomic_write(path, "#!/bin/sh\necho hi\n");
    struct stat st;
    REQUIRE(::stat(path.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0750);
}

TEST_CASE("atomic_write: missing directory fails cleanly", "[file_access]") {
    TempDir dir;
    auto path = dir.file("no/such/dir/a.txt");
    try {
        atomic_write(path, "x");
        FAIL("expected AccessError");
    } catch (const AccessError& e) {
        REQUIRE(e.kind() == AccessError::Kind::WriteFailed);
    }
    REQUIRE_FALSE(std::filesystem::exists(path));
}

TEST_CASE("atomic_write: directory target rejected without leftovers", "[file_access]") {
    TempDir dir;
    std::filesystem::create_directory(dir.file("sub"));
    REQUIRE_THROWS_AS(atomic_write(dir.file("sub"), "x"), AccessError);
    REQUIRE(std::filesystem::is_directory(dir.file("sub")));
    REQUIRE(count_files(dir.path) == 0);
}

TEST_CASE("atomic_write: read-only target replaced with its mode intact", "[file_access]") {
    TempDir dir;
    auto path = dir.file("ro.txt");
    write_file(path, "old");
    chmod(path.c_str(), 0400);

    atomic_write(path, "new");
    REQUIRE(read_file(path) == "new");
    struct stat st;
    REQUIRE(::stat(path.c_str(), &st) == 0);
    REQUIRE((st.st_mode & 0777) == 0400);
    REQUIRE(count_files(dir.path) == 1);
}
