#include <catch2/catch_test_macros.hpp>
#include "cleaner/input_discovery.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <fstream>

using namespace logcleaner;
namespace fs = std::filesystem;

namespace {

// RAII temporary directory
struct TmpDir {
    fs::path path;
    TmpDir() : path(fs::temp_directory_path() / ("logcleaner_inputs_" + utils::generate_uuid())) {
        fs::create_directories(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string touch(const std::string& name) {
        auto p = path / name;
        std::ofstream f(p);
        return p.string();
    }
};

} // namespace

TEST_CASE("InputDiscovery: explicit paths only, sorted and unique", "[inputs]") {
    InputConfig input;
    input.paths = {"/logs/b.log", "/logs/a.log", "/logs/b.log"};

    auto result = discover_inputs(input);
    REQUIRE(result.is_ok());
    CHECK(result.value() == std::vector<std::string>{"/logs/a.log", "/logs/b.log"});
}

TEST_CASE("InputDiscovery: directory scan applies the name pattern", "[inputs]") {
    TmpDir tmp;
    const auto a = tmp.touch("accounts-1.log");
    const auto b = tmp.touch("accounts-2.log");
    tmp.touch("accounts-1.log.20230601T000000Z.bak");
    tmp.touch("notes.txt");
    fs::create_directories(tmp.path / "nested.log");

    InputConfig input;
    input.directory = tmp.path.string();

    auto result = discover_inputs(input);
    REQUIRE(result.is_ok());
    CHECK(result.value() == std::vector<std::string>{a, b});
}

TEST_CASE("InputDiscovery: custom pattern and overlap with explicit paths", "[inputs]") {
    TmpDir tmp;
    const auto a = tmp.touch("accounts-1.log");
    tmp.touch("audit.log");

    InputConfig input;
    input.directory = tmp.path.string();
    input.pattern = R"(accounts-\d+\.log)";
    input.paths = {a};

    auto result = discover_inputs(input);
    REQUIRE(result.is_ok());
    CHECK(result.value() == std::vector<std::string>{a});
}

TEST_CASE("InputDiscovery: missing directory is an I/O error", "[inputs]") {
    InputConfig input;
    input.directory = "/nonexistent/logcleaner/dir";

    auto result = discover_inputs(input);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::IO_ERROR);
}

TEST_CASE("InputDiscovery: invalid pattern is a config error", "[inputs]") {
    TmpDir tmp;
    InputConfig input;
    input.directory = tmp.path.string();
    input.pattern = "([unclosed";

    auto result = discover_inputs(input);
    REQUIRE(result.is_error());
    CHECK(result.error_category() == ErrorCategory::CONFIG_ERROR);
}
