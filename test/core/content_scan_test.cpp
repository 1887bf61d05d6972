#include "core/content_scan.hpp"
#include "core/contents_manager.hpp"
#include "core/utilities.hpp"

#include "test_database.hpp"

#include <absl/strings/str_cat.h>
#include <doctest/doctest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace notestore
{
namespace
{
    const absl::Time kBase = absl::FromUnixSeconds(1700000000);

    absl::Time at(int seconds) { return kBase + absl::Seconds(seconds); }

    // Writes the file and one checkpoint of it, both stamped `seconds` after the base time.
    void save_at(SQLiteDB db, ContentsManager& manager, const std::string& path, int seconds)
    {
        Model model;
        model.content = absl::StrCat(manager.user_id(), ":", path);
        model.format = ContentFormat::TEXT;
        manager.save(model, path);
        manager.create_checkpoint(path);

        for (const char* sql :
             {"update files set created_at = ?1 where user_id = ?2 and parent_name || name = ?3",
              "update remote_checkpoints set last_modified = ?1 where user_id = ?2 and path = ?3"})
        {
            auto st = db.statement(sql);
            st.bind_int(1, to_db_time(at(seconds)));
            st.bind_text(2, manager.user_id());
            st.bind_text(3, absl::StrCat("/", path));
            st.step();
        }
    }

    struct Collected
    {
        std::vector<std::string> items;
        ScanSummary summary;
    };

    Collected collect(SQLiteDB db,
                      bool checkpoints,
                      const CryptoFactory& factory,
                      const ScanOptions& options = {})
    {
        Collected result;
        auto callback = [&](const ScannedContent& item)
        {
            CHECK(item.content == absl::StrCat(item.user_id, ":", item.path));
            result.items.push_back(item.content);
        };
        result.summary = checkpoints ? generate_checkpoints(db, factory, options, callback)
                                     : generate_files(db, factory, options, callback);
        CHECK(result.summary.delivered == result.items.size());
        return result;
    }

    class ScanFixture
    {
    public:
        ScanFixture() : factory_(single_password_crypto_factory("pw"))
        {
            StoreParams params;
            params.set_create_user_on_startup(true);
            auto& db = database_.db();
            ContentsManager alice(db, "alice", factory_("alice"), params);
            ContentsManager bob(db, "bob", factory_("bob"), params);
            Model dir;
            dir.type = EntryType::DIRECTORY;
            alice.save(dir, "d");

            save_at(db, alice, "a.txt", 10);
            save_at(db, alice, "d/b.md", 30);
            save_at(db, bob, "c.txt", 20);
            save_at(db, bob, "e.txt", 20);
        }

    protected:
        TestDatabase database_;
        CryptoFactory factory_;
    };
}    // namespace

TEST_CASE_FIXTURE(ScanFixture, "Scan in timestamp order")
{
    auto& db = database_.db();
    std::vector<std::string> expected = {"alice:a.txt", "bob:c.txt", "bob:e.txt", "alice:d/b.md"};
    for (bool checkpoints : {false, true})
    {
        CAPTURE(checkpoints);
        auto collected = collect(db, checkpoints, factory_);
        CHECK(collected.items == expected);
        CHECK(collected.summary.skipped_corrupted == 0);
    }

    std::vector<absl::Time> times;
    generate_files(db,
                   factory_,
                   {},
                   [&](const ScannedContent& item) { times.push_back(item.last_modified); });
    CHECK(times == std::vector<absl::Time>{at(10), at(20), at(20), at(30)});
}

TEST_CASE_FIXTURE(ScanFixture, "Scan a time window")
{
    auto& db = database_.db();
    for (bool checkpoints : {false, true})
    {
        CAPTURE(checkpoints);
        ScanOptions options;
        options.min_time = at(20);
        options.max_time = at(30);
        CHECK(collect(db, checkpoints, factory_, options).items
              == std::vector<std::string>{"bob:c.txt", "bob:e.txt"});

        options = {};
        options.min_time = at(30);
        CHECK(collect(db, checkpoints, factory_, options).items
              == std::vector<std::string>{"alice:d/b.md"});

        // The upper bound is exclusive.
        options = {};
        options.max_time = at(10);
        CHECK(collect(db, checkpoints, factory_, options).items.empty());
    }
}

TEST_CASE_FIXTURE(ScanFixture, "Scan by suffix")
{
    auto& db = database_.db();
    ScanOptions options;
    options.suffix = ".txt";
    CHECK(collect(db, false, factory_, options).items
          == std::vector<std::string>{"alice:a.txt", "bob:c.txt", "bob:e.txt"});
    options.suffix = "b.md";
    CHECK(collect(db, true, factory_, options).items
          == std::vector<std::string>{"alice:d/b.md"});
    options.suffix = "nothing";
    CHECK(collect(db, false, factory_, options).items.empty());
}

TEST_CASE_FIXTURE(ScanFixture, "Scan skips rows that fail to decrypt")
{
    auto& db = database_.db();
    db.exec("update files set content = x'00010203' where name = 'c.txt'");

    auto collected = collect(db, false, factory_);
    CHECK(collected.items == std::vector<std::string>{"alice:a.txt", "bob:e.txt", "alice:d/b.md"});
    CHECK(collected.summary.skipped_corrupted == 1);

    // A wrong key for everyone.
    auto wrong = collect(db, true, single_password_crypto_factory("wrong"));
    CHECK(wrong.items.empty());
    CHECK(wrong.summary.skipped_corrupted == 4);
}

TEST_CASE_FIXTURE(ScanFixture, "Scan builds each crypto once")
{
    std::vector<std::string> requested;
    CryptoFactory counting = [&](std::string_view user_id)
    {
        requested.emplace_back(user_id);
        return factory_(user_id);
    };
    CHECK(collect(database_.db(), false, counting).items.size() == 4);
    std::sort(requested.begin(), requested.end());
    CHECK(requested == std::vector<std::string>{"alice", "bob"});
}
}    // namespace notestore
