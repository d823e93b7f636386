#include <catch2/catch_test_macros.hpp>
#include "writer/atomic_writer.hpp"
#include "core/utils.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace logcleaner;
namespace fs = std::filesystem;

namespace {

// RAII temporary directory
struct TmpDir {
    fs::path path;
    TmpDir() : path(fs::temp_directory_path() / ("logcleaner_writer_" + utils::generate_uuid())) {
        fs::create_directories(path);
    }
    ~TmpDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
    std::string file(const std::string& name, const std::string& content) {
        auto p = path / name;
        std::ofstream f(p, std::ios::binary);
        f << content;
        return p.string();
    }
    size_t entry_count() const {
        return static_cast<size_t>(std::distance(fs::directory_iterator(path), fs::directory_iterator{}));
    }
};

std::string read_all(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

AtomicWriter failing_at(AtomicWriter::Stage stage) {
    AtomicWriter::Config cfg;
    cfg.fault_injector = [stage](AtomicWriter::Stage s) { return s == stage; };
    return AtomicWriter(cfg);
}

} // namespace

TEST_CASE("AtomicWriter: replaces content and keeps backup", "[writer]") {
    TmpDir tmp;
    const std::string original = "line1\nline2\nline3\n";
    const auto path = tmp.file("app.log", original);

    const AtomicWriter writer;
    const auto result = writer.commit(path, {"line1", "line3"});

    REQUIRE(result.success);
    CHECK(result.error_category == ErrorCategory::NONE);
    CHECK(result.bytes_written == 12);
    CHECK(read_all(path) == "line1\nline3\n");

    CHECK(result.backup.original_path == path);
    CHECK(result.backup.bytes == original.size());
    CHECK(result.backup.retained);
    REQUIRE(fs::exists(result.backup.backup_path));
    CHECK(read_all(result.backup.backup_path) == original);
    CHECK(result.backup.backup_path.starts_with(path + "."));
    CHECK(result.backup.backup_path.ends_with(".bak"));

    // Original + backup, no staging leftovers
    CHECK(tmp.entry_count() == 2);
}

TEST_CASE("AtomicWriter: empty output truncates the file", "[writer]") {
    TmpDir tmp;
    const auto path = tmp.file("app.log", "a\nb\n");

    const auto result = AtomicWriter().commit(path, {});
    REQUIRE(result.success);
    CHECK(read_all(path).empty());
    CHECK(fs::file_size(path) == 0);
}

TEST_CASE("AtomicWriter: retain_backup=false deletes backup after success", "[writer]") {
    TmpDir tmp;
    const auto path = tmp.file("app.log", "a\nb\n");

    AtomicWriter::Config cfg;
    cfg.retain_backup = false;
    const auto result = AtomicWriter(cfg).commit(path, {"a"});

    REQUIRE(result.success);
    CHECK_FALSE(result.backup.retained);
    CHECK_FALSE(fs::exists(result.backup.backup_path));
    CHECK(tmp.entry_count() == 1);
}

TEST_CASE("AtomicWriter: backup name uses compact UTC stamp and suffix", "[writer]") {
    AtomicWriter::Config cfg;
    cfg.backup_suffix = ".orig";
    const AtomicWriter writer(cfg);

    const auto stamp = *utils::parse_instant("2023-06-01T12:34:56Z");
    CHECK(writer.backup_path_for("/var/log/app.log", stamp) == "/var/log/app.log.20230601T123456Z.orig");
}

TEST_CASE("AtomicWriter: consecutive commits never overwrite a backup", "[writer]") {
    TmpDir tmp;
    const auto path = tmp.file("app.log", "one\ntwo\nthree\n");

    const AtomicWriter writer;
    const auto first = writer.commit(path, {"one", "two"});
    const auto second = writer.commit(path, {"one"});

    REQUIRE(first.success);
    REQUIRE(second.success);
    CHECK(first.backup.backup_path != second.backup.backup_path);
    CHECK(read_all(first.backup.backup_path) == "one\ntwo\nthree\n");
    CHECK(read_all(second.backup.backup_path) == "one\ntwo\n");
    CHECK(read_all(path) == "one\n");
}

TEST_CASE("AtomicWriter: missing input is a backup failure", "[writer][failure]") {
    TmpDir tmp;
    const auto result = AtomicWriter().commit((tmp.path / "missing.log").string(), {"x"});

    CHECK_FALSE(result.success);
    CHECK(result.error_category == ErrorCategory::BACKUP_FAILURE);
    CHECK(result.backup.backup_path.empty());
    CHECK(tmp.entry_count() == 0);
}

TEST_CASE("AtomicWriter: line count disagreeing with the report fails verification", "[writer][failure]") {
    TmpDir tmp;
    const std::string original = "a\nb\nc\n";
    const auto path = tmp.file("app.log", original);

    const AtomicWriter writer;
    const auto result = writer.commit(path, {"a", "c"}, 3);

    REQUIRE_FALSE(result.success);
    CHECK(result.error_category == ErrorCategory::COMMIT_FAILURE);
    CHECK(result.error_message.find("2 lines, expected 3") != std::string::npos);
    CHECK(read_all(path) == original);
    // original + backup, staged file discarded
    CHECK(tmp.entry_count() == 2);
    CHECK(read_all(result.backup.backup_path) == original);
}

TEST_CASE("AtomicWriter: injected failures leave the original byte-identical", "[writer][failure]") {
    const std::string original = "2023-01-01,a,login\r\n2020-01-01,a,login\n";

    struct Case {
        AtomicWriter::Stage stage;
        ErrorCategory expected;
        bool backup_made;
    };
    const Case cases[] = {
        {AtomicWriter::Stage::BACKUP,      ErrorCategory::BACKUP_FAILURE, false},
        {AtomicWriter::Stage::STAGE_WRITE, ErrorCategory::COMMIT_FAILURE, true},
        {AtomicWriter::Stage::VERIFY,      ErrorCategory::COMMIT_FAILURE, true},
        {AtomicWriter::Stage::RENAME,      ErrorCategory::RENAME_FAILURE, true},
    };

    for (const auto& c : cases) {
        DYNAMIC_SECTION("fault at " << AtomicWriter::stage_name(c.stage)) {
            TmpDir tmp;
            const auto path = tmp.file("app.log", original);

            const auto result = failing_at(c.stage).commit(path, {"2023-01-01,a,login\r"});

            CHECK_FALSE(result.success);
            CHECK(result.error_category == c.expected);
            CHECK(read_all(path) == original);

            if (c.backup_made) {
                REQUIRE_FALSE(result.backup.backup_path.empty());
                CHECK(read_all(result.backup.backup_path) == original);
                CHECK(result.error_message.find(result.backup.backup_path) != std::string::npos);
                CHECK(tmp.entry_count() == 2);  // staging file cleaned up
            } else {
                CHECK(result.backup.backup_path.empty());
                CHECK(tmp.entry_count() == 1);
            }
        }
    }
}
