/**
 * @file test_loader.cpp
 * @brief Tests for file reading and structured file loading (Catch2)
 *
 * Tests cover:
 * - read_text_file() for existing, missing and binary files
 * - JSON, TOML and YAML parameter files
 * - extension detection and unsupported extensions
 */

#include <catch2/catch_all.hpp>
#include "yedit/Loader.hpp"
#include "yedit/Errors.hpp"

#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

using namespace yedit;

// ============================================================================
// Test fixtures and helpers
// ============================================================================

namespace {

/**
 * @brief RAII helper for creating temporary files.
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("yedit_test_" + std::to_string(std::rand()) + extension)) {
        std::ofstream out(path_, std::ios::binary);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

// ============================================================================
// Raw file reading
// ============================================================================

TEST_CASE("read_text_file", "[loader]") {
    SECTION("Returns contents unchanged") {
        TempFile file("a: 1\r\nb: \"x\"\n", ".yml");
        CHECK(read_text_file(file.path()) == "a: 1\r\nb: \"x\"\n");
    }

    SECTION("Empty file") {
        TempFile file("", ".yml");
        CHECK(read_text_file(file.path()).empty());
    }

    SECTION("Missing file throws FileNotFoundError") {
        CHECK_THROWS_AS(read_text_file("/nonexistent/doc.yml"), FileNotFoundError);
    }

    SECTION("Directory is not a file") {
        CHECK_FALSE(file_exists(fs::temp_directory_path().string()));
        CHECK_THROWS_AS(read_text_file(fs::temp_directory_path().string()), FileNotFoundError);
    }
}

TEST_CASE("get_file_extension", "[loader]") {
    CHECK(get_file_extension("params.JSON") == ".json");
    CHECK(get_file_extension("/etc/app/params.Yml") == ".yml");
    CHECK(get_file_extension("archive.tar.toml") == ".toml");
    CHECK(get_file_extension("noext").empty());
}

// ============================================================================
// JSON
// ============================================================================

TEST_CASE("load_json_file", "[loader][json]") {
    SECTION("Keeps key order and types") {
        TempFile file(R"({"zeta": 1, "alpha": [true, null, "x"], "mid": {"f": 1.5}})");

        Value result = load_json_file(file.path());

        REQUIRE(result.is_object());
        CHECK(result.begin().key() == "zeta");
        CHECK(result["alpha"][0] == true);
        CHECK(result["alpha"][1].is_null());
        CHECK(result["mid"]["f"] == 1.5);
    }

    SECTION("Empty file is an empty mapping") {
        TempFile file("");
        Value result = load_json_file(file.path());
        CHECK(result.is_object());
        CHECK(result.empty());
    }

    SECTION("Invalid JSON throws DocumentParseError") {
        TempFile file("{ invalid json }");
        CHECK_THROWS_AS(load_json_file(file.path()), DocumentParseError);
    }

    SECTION("Missing file throws FileNotFoundError") {
        CHECK_THROWS_AS(load_json_file("/nonexistent/params.json"), FileNotFoundError);
    }
}

// ============================================================================
// TOML
// ============================================================================

TEST_CASE("load_toml_file", "[loader][toml]") {
    SECTION("Scalars and tables") {
        TempFile file(R"(
src = "/etc/app.yml"
backup = true
index = 2
ratio = 0.5

[content]
name = "demo"
)", ".toml");

        Value result = load_toml_file(file.path());

        CHECK(result["src"] == "/etc/app.yml");
        CHECK(result["backup"] == true);
        CHECK(result["index"] == 2);
        CHECK(result["ratio"] == 0.5);
        CHECK(result["content"]["name"] == "demo");
    }

    SECTION("Array of tables becomes a list of edits") {
        TempFile file(R"(
src = "app.yml"

[[edits]]
key = "a.b"
value = "1"

[[edits]]
key = "list"
value = "x"
action = "append"
)", ".toml");

        Value result = load_toml_file(file.path());

        REQUIRE(result["edits"].is_array());
        REQUIRE(result["edits"].size() == 2);
        CHECK(result["edits"][0]["key"] == "a.b");
        CHECK(result["edits"][1]["action"] == "append");
    }

    SECTION("Dates become text") {
        TempFile file("when = 2024-01-02\n", ".toml");
        Value result = load_toml_file(file.path());
        CHECK(result["when"] == "2024-01-02");
    }

    SECTION("Invalid TOML throws DocumentParseError") {
        TempFile file("key = [unclosed\n", ".toml");
        CHECK_THROWS_AS(load_toml_file(file.path()), DocumentParseError);
    }
}

// ============================================================================
// YAML
// ============================================================================

TEST_CASE("load_yaml_file", "[loader][yaml]") {
    SECTION("Block mapping") {
        TempFile file("state: absent\nkey: a.b\nindex: 3\n", ".yaml");

        Value result = load_yaml_file(file.path());

        CHECK(result["state"] == "absent");
        CHECK(result["key"] == "a.b");
        CHECK(result["index"] == 3);
    }

    SECTION("Quoted numbers stay text") {
        TempFile file("value: '5'\n", ".yml");
        CHECK(load_yaml_file(file.path())["value"] == "5");
    }

    SECTION("Empty file is an empty mapping") {
        TempFile file("", ".yml");
        Value result = load_yaml_file(file.path());
        CHECK(result.is_object());
        CHECK(result.empty());
    }

    SECTION("Malformed YAML throws DocumentParseError") {
        TempFile file("a: [1, 2\n", ".yml");
        CHECK_THROWS_AS(load_yaml_file(file.path()), DocumentParseError);
    }
}

// ============================================================================
// Auto-detection
// ============================================================================

TEST_CASE("load_structured_file", "[loader]") {
    SECTION("Dispatches on extension") {
        TempFile json_file(R"({"from": "json"})", ".json");
        TempFile toml_file("from = \"toml\"\n", ".toml");
        TempFile yaml_file("from: yaml\n", ".yaml");
        TempFile yml_file("from: yml\n", ".YML");

        CHECK(load_structured_file(json_file.path())["from"] == "json");
        CHECK(load_structured_file(toml_file.path())["from"] == "toml");
        CHECK(load_structured_file(yaml_file.path())["from"] == "yaml");
        CHECK(load_structured_file(yml_file.path())["from"] == "yml");
    }

    SECTION("Unsupported extension throws ParameterError") {
        TempFile file("a=1\n", ".ini");
        CHECK_THROWS_AS(load_structured_file(file.path()), ParameterError);
    }

    SECTION("Missing file throws FileNotFoundError") {
        CHECK_THROWS_AS(load_structured_file("/nonexistent/params.yml"), FileNotFoundError);
    }
}
