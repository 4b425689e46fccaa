#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"
#include "tracking/window_info.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("wingman_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("OpenCreatesParentDirectory") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("wingman_test_dir_" + std::to_string(getpid()));
        {
            HistoryDb db;
            REQUIRE(db.open((dir / "nested" / "history.db").string()));
        }
        REQUIRE(std::filesystem::exists(dir / "nested" / "history.db"));
        std::filesystem::remove_all(dir);
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        WindowInfo ctx{.app_id = "kitty", .title = "~/src"};
        REQUIRE(db.insert("grep", "man", true, ctx));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].id > 0);
        REQUIRE(entries[0].command == "grep");
        REQUIRE(entries[0].source == "man");
        REQUIRE(entries[0].found);
        REQUIRE(entries[0].app_name == "kitty");
        REQUIRE(entries[0].window_title == "~/src");
    }

    SECTION("AppNamePrefersTerminalCommand") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        WindowInfo ctx{.window_class = "XTerm", .title = "vim", .command = "vim notes.txt"};
        REQUIRE(db.insert("vim", "help", true, ctx));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].app_name == "vim notes.txt");
    }

    SECTION("MissedLookup") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("nosuchtool", "", false, WindowInfo{}));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].found);
        REQUIRE(entries[0].source.empty());
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        WindowInfo ctx;
        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert("cmd" + std::to_string(i), "man", true, ctx));
        }

        REQUIRE(db.recent(2).size() == 2);
        REQUIRE(db.recent(10).size() == 5);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        WindowInfo ctx;
        REQUIRE(db.insert("ls", "man", true, ctx));
        REQUIRE(db.insert("tar", "man", true, ctx));
        REQUIRE(db.insert("git", "help", true, ctx));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].command == "git");
        REQUIRE(entries[1].command == "tar");
        REQUIRE(entries[2].command == "ls");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings are stored as NULL and read back as empty
        REQUIRE(db.insert("ls", "", false, WindowInfo{}));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].source.empty());
        REQUIRE(entries[0].app_name.empty());
        REQUIRE(entries[0].window_title.empty());
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert("ls", "man", true, WindowInfo{}));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("PersistsAcrossReopen") {
        TmpDb tmp;
        {
            HistoryDb db;
            REQUIRE(db.open(tmp.path));
            REQUIRE(db.insert("sed", "man", true, WindowInfo{}));
        }
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        auto entries = db.recent(5);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].command == "sed");
    }

    SECTION("Clear") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.insert("ls", "man", true, WindowInfo{}));
        REQUIRE(db.insert("cp", "man", true, WindowInfo{}));

        REQUIRE(db.clear());
        REQUIRE(db.recent(10).empty());

        REQUIRE(db.insert("mv", "man", true, WindowInfo{}));
        REQUIRE(db.recent(10).size() == 1);
    }

    SECTION("ClosedDbRejectsInsert") {
        HistoryDb db;
        REQUIRE_FALSE(db.is_open());
        REQUIRE_FALSE(db.insert("ls", "man", true, WindowInfo{}));
        REQUIRE(db.recent(5).empty());
        REQUIRE_FALSE(db.clear());
    }
}
