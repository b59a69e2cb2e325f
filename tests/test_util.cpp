#include <catch2/catch.hpp>
#include "util.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace strucache;

// ── sha256_hex ───────────────────────────────────────────────────

TEST_CASE("sha256_hex: known digest of empty string", "[util]") {
    REQUIRE(sha256_hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("sha256_hex: known digest of abc", "[util]") {
    REQUIRE(sha256_hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("sha256_hex: binary input with embedded NUL", "[util]") {
    std::string a("a\0b", 3);
    std::string b("a\0c", 3);
    REQUIRE(sha256_hex(a).size() == 64);
    REQUIRE(sha256_hex(a) != sha256_hex(b));
}

// ── to_lower / trim ──────────────────────────────────────────────

TEST_CASE("to_lower: mixed case", "[util]") {
    REQUIRE(to_lower("Gemini-2.5-FLASH") == "gemini-2.5-flash");
    REQUIRE(to_lower("").empty());
}

TEST_CASE("trim: strips surrounding whitespace", "[util]") {
    REQUIRE(trim("  sqlite \n") == "sqlite");
    REQUIRE(trim("   ").empty());
}

// ── epoch clock ──────────────────────────────────────────────────

TEST_CASE("epoch_seconds_precise: unix seconds, non-decreasing", "[util]") {
    double a = epoch_seconds_precise();
    double b = epoch_seconds_precise();
    REQUIRE(a > 1.0e9);
    REQUIRE(b >= a);
}

// ── generate_id ──────────────────────────────────────────────────

TEST_CASE("generate_id: 16 hex chars, unique", "[util]") {
    auto a = generate_id();
    auto b = generate_id();
    REQUIRE(a.size() == 16);
    REQUIRE(a != b);
}

// ── atomic_write_file ────────────────────────────────────────────

TEST_CASE("atomic_write_file: writes and replaces content", "[util]") {
    std::string dir = "/tmp/strucache_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "second");

    // No temp files left behind
    size_t files = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir + "/nested")) {
        (void)e;
        files++;
    }
    REQUIRE(files == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("atomic_write_file: fails when parent is a file", "[util]") {
    std::string blocker = "/tmp/strucache_test_blocker_" + std::to_string(getpid());
    {
        std::ofstream out(blocker);
        out << "x";
    }
    REQUIRE_FALSE(atomic_write_file(blocker + "/child.txt", "data"));
    std::filesystem::remove(blocker);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: leaves absolute paths alone", "[util]") {
    REQUIRE(expand_home("/var/cache") == "/var/cache");
}

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    }
}
