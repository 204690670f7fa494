#include <catch2/catch_test_macros.hpp>
#include "session.hpp"
#include "errors.hpp"
#include "hash.hpp"
#include "path.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace largefile;

static FileReader make_reader() {
    return FileReader(StrategySelector(52428800, 524288000), 8192);
}

// ── Sha256 ──────────────────────────────────────────────────────

TEST_CASE("sha256_hex: known digests", "[session]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Sha256: incremental updates match one-shot", "[session]") {
    Sha256 sha;
    sha.update("a");
    sha.update(std::string("bc"));
    REQUIRE(sha.hex_digest() == sha256_hex("abc"));
}

// ── SessionCache ────────────────────────────────────────────────

TEST_CASE("SessionCache: builds metadata for a file", "[session]") {
    TempDir dir;
    REQUIRE_FALSE(dir.path.empty());
    write_file(dir.file("a.py"), "def hello():\n    return 1\n\nprint(hello())");

    auto reader = make_reader();
    SessionCache cache(reader, 1000, std::make_shared<BomEncodingDetector>());
    auto s = cache.load(dir.file("a.py"));

    REQUIRE(s != nullptr);
    REQUIRE(s->canonical_path == resolve_path(dir.file("a.py")));
    REQUIRE(s->line_count == 4);
    REQUIRE(s->file_size == 41);
    REQUIRE(s->encoding == "utf-8");
    REQUIRE(s->strategy == AccessStrategy::Memory);
    REQUIRE(s->chunk_size == 8192);
    REQUIRE_FALSE(s->has_long_lines);
    REQUIRE(s->content_hash == sha256_hex(read_file(dir.file("a.py"))));
}

TEST_CASE("SessionCache: hash stable while file unchanged", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "one\ntwo\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    auto first = cache.load(dir.file("a.txt"));
    auto second = cache.load(dir.file("a.txt"));

    REQUIRE(first == second);
    REQUIRE(first->content_hash == second->content_hash);
    REQUIRE(cache.build_count() == 1);
}

TEST_CASE("SessionCache: modified file gets a new session", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "one\ntwo\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    auto before = cache.load(dir.file("a.txt"));

    write_file(dir.file("a.txt"), "one\ntwo\nthree\n");
    auto after = cache.load(dir.file("a.txt"));

    REQUIRE(before->content_hash != after->content_hash);
    REQUIRE(after->line_count == 3);
    REQUIRE(before->line_count == 2);  // old snapshot untouched
}

TEST_CASE("SessionCache: different spellings share a session", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "x\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    auto a = cache.load(dir.file("a.txt"));
    auto b = cache.load(dir.path + "/./sub/../a.txt");
    REQUIRE(a == b);
}

TEST_CASE("SessionCache: get does not build", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "x\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    REQUIRE(cache.get(dir.file("a.txt")) == nullptr);
    REQUIRE(cache.build_count() == 0);

    cache.load(dir.file("a.txt"));
    REQUIRE(cache.get(dir.file("a.txt")) != nullptr);
}

TEST_CASE("SessionCache: invalidate drops every session of the path", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "v1\n");
    write_file(dir.file("b.txt"), "other\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    cache.load(dir.file("a.txt"));
    write_file(dir.file("a.txt"), "v2\n");
    cache.load(dir.file("a.txt"));
    cache.load(dir.file("b.txt"));
    REQUIRE(cache.size() == 3);

    cache.invalidate(dir.file("a.txt"));
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get(dir.file("b.txt")) != nullptr);
}

TEST_CASE("SessionCache: long lines detected anywhere in the file", "[session]") {
    TempDir dir;
    std::string content;
    for (int i = 0; i < 500; i++) content += "short\n";
    content += std::string(30, 'x') + "\n";
    write_file(dir.file("a.txt"), content);

    auto reader = make_reader();
    SessionCache strict(reader, 20);
    REQUIRE(strict.load(dir.file("a.txt"))->has_long_lines);

    SessionCache lenient(reader, 30);
    REQUIRE_FALSE(lenient.load(dir.file("a.txt"))->has_long_lines);
}

TEST_CASE("SessionCache: long line limit counts characters", "[session]") {
    TempDir dir;
    // 10 snowmen: 30 bytes, 10 characters
    std::string line;
    for (int i = 0; i < 10; i++) line += "\xe2\x98\x83";
    write_file(dir.file("a.txt"), line + "\n");

    auto reader = make_reader();
    SessionCache cache(reader, 10);
    REQUIRE_FALSE(cache.load(dir.file("a.txt"))->has_long_lines);
}

TEST_CASE("SessionCache: detected encoding recorded", "[session]") {
    TempDir dir;
    write_file(dir.file("latin.txt"), "caf\xe9\nna\xefve\n");

    auto reader = make_reader();
    SessionCache with_detector(reader, 1000, std::make_shared<BomEncodingDetector>());
    auto s = with_detector.load(dir.file("latin.txt"));
    REQUIRE(s->encoding == "latin-1");
    REQUIRE(s->line_count == 2);
}

TEST_CASE("SessionCache: missing file throws and caches nothing", "[session]") {
    TempDir dir;
    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    REQUIRE_THROWS_AS(cache.load(dir.file("missing.txt")), AccessError);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("SessionCache: undecodable file leaves no session behind", "[session]") {
    TempDir dir;
    write_file(dir.file("bad.txt"), "ok\n\xff\n");

    auto reader = make_reader();
    SessionCache cache(reader, 1000);  // no detector: utf-8 assumed
    REQUIRE_THROWS_AS(cache.load(dir.file("bad.txt")), AccessError);
    REQUIRE(cache.size() == 0);
}

TEST_CASE("SessionCache: concurrent loads build once", "[session]") {
    TempDir dir;
    std::string content;
    for (int i = 0; i < 20000; i++) content += "line " + std::to_string(i) + "\n";
    write_file(dir.file("big.txt"), content);

    auto reader = make_reader();
    SessionCache cache(reader, 1000);

    std::vector<std::shared_ptr<const FileSession>> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&, i]() { results[i] = cache.load(dir.file("big.txt")); });
    }
    for (auto& t : threads) t.join();

    REQUIRE(cache.build_count() == 1);
    for (const auto& r : results) {
        REQUIRE(r == results[0]);
        REQUIRE(r->line_count == 20000);
    }
}

namespace {

// Rewrites the file the first time it is asked, between the cache's hash
// and its scan of the content.
struct RewritingDetector : EncodingDetector {
    std::string path;
    std::string replacement;
    bool done = false;

    EncodingGuess detect(const std::string&) override {
        if (!done) {
            write_file(path, replacement);
            done = true;
        }
        return {"utf-8", 1.0};
    }
};

} // namespace

TEST_CASE("SessionCache: file rewritten during a build", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "one\n");
    std::string updated = "one\ntwo\nthree\n";

    auto detector = std::make_shared<RewritingDetector>();
    detector->path = dir.file("a.txt");
    detector->replacement = updated;

    auto reader = make_reader();
    SessionCache cache(reader, 1000, detector);
    auto s = cache.load(dir.file("a.txt"));

    // Every field describes the same content
    REQUIRE(s->content_hash == sha256_hex(updated));
    REQUIRE(s->file_size == updated.size());
    REQUIRE(s->line_count == 3);

    // Stored under the hash of what it describes
    REQUIRE(cache.size() == 1);
    REQUIRE(cache.get(dir.file("a.txt")) == s);
    REQUIRE(cache.load(dir.file("a.txt")) == s);
    REQUIRE(cache.build_count() == 1);
}

TEST_CASE("SessionCache: clear empties the cache", "[session]") {
    TempDir dir;
    write_file(dir.file("a.txt"), "x\n");
    auto reader = make_reader();
    SessionCache cache(reader, 1000);
    cache.load(dir.file("a.txt"));
    cache.clear();
    REQUIRE(cache.size() == 0);
}
