#include "core/contents_manager.hpp"
#include "core/crypto.hpp"
#include "core/exceptions.hpp"
#include "core/reencryption.hpp"

#include "test_database.hpp"

#include <doctest/doctest.h>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace notestore
{
namespace
{
    // Every stored content, files first, in row order.
    std::vector<std::string> all_blobs(SQLiteDB db)
    {
        std::vector<std::string> result;
        for (const char* sql : {"select content from files order by id",
                                "select content from remote_checkpoints order by id"})
        {
            auto st = db.statement(sql);
            while (st.step())
            {
                result.emplace_back(st.get_blob(0));
            }
        }
        return result;
    }

    // How many stored contents of the user `crypto` decrypts.
    int count_opened(SQLiteDB db, std::string_view user_id, const Crypto& crypto)
    {
        int opened = 0;
        for (const char* sql : {"select content from files where user_id = ?1",
                                "select content from remote_checkpoints where user_id = ?1"})
        {
            auto st = db.statement(sql);
            st.bind_text(1, user_id);
            while (st.step())
            {
                try
                {
                    decrypt(crypto, st.get_blob(0));
                    ++opened;
                }
                catch (const CorruptedFile&)
                {
                }
            }
        }
        return opened;
    }

    StoreParams startup_params()
    {
        StoreParams params;
        params.set_create_user_on_startup(true);
        return params;
    }

    Model text_model(std::string content)
    {
        Model model;
        model.content = std::move(content);
        model.format = ContentFormat::TEXT;
        return model;
    }

    // Two files and two checkpoints for each user.
    void populate(SQLiteDB db, const CryptoFactory& factory)
    {
        for (const char* user : {"alice", "bob"})
        {
            ContentsManager manager(db, user, factory(user), startup_params());
            manager.save(text_model(std::string("first of ") + user), "a.txt");
            manager.create_checkpoint("a.txt");
            manager.save(text_model(std::string("second of ") + user), "a.txt");
            manager.create_checkpoint("a.txt");
            manager.save(text_model("other"), "b.txt");
        }
    }

    // Reads every file and checkpoint back through the given crypto.
    void check_readable(SQLiteDB db, const CryptoFactory& factory)
    {
        for (const char* user : {"alice", "bob"})
        {
            ContentsManager manager(db, user, factory(user), StoreParams());
            CHECK(*manager.get("a.txt").content == std::string("second of ") + user);
            CHECK(*manager.get("b.txt").content == "other");
            auto checkpoints = manager.list_checkpoints("a.txt");
            REQUIRE(checkpoints.size() == 2);
            manager.restore_checkpoint(checkpoints.back().id, "a.txt");
            CHECK(*manager.get("a.txt").content == std::string("first of ") + user);
            manager.restore_checkpoint(checkpoints.front().id, "a.txt");
        }
    }
}    // namespace

TEST_CASE("Re-encrypt all users")
{
    TestDatabase database;
    auto& db = database.db();
    auto old_factory = single_password_crypto_factory("old");
    auto new_factory = single_password_crypto_factory("new");
    populate(db, old_factory);
    check_readable(db, old_factory);

    reencrypt_all_users(db, old_factory, new_factory);
    check_readable(db, new_factory);
    {
        ContentsManager manager(db, "alice", old_factory("alice"), StoreParams());
        CHECK_THROWS_AS(manager.get("a.txt"), CorruptedFile);
    }

    // A second run leaves every row as it is.
    auto before = all_blobs(db);
    CHECK(before.size() == 8);
    reencrypt_all_users(db, old_factory, new_factory);
    CHECK(all_blobs(db) == before);

    // Also when the old key is no longer known at all.
    reencrypt_all_users(db, single_password_crypto_factory("forgotten"), new_factory);
    CHECK(all_blobs(db) == before);
}

TEST_CASE("Re-encrypt resumes a partial run")
{
    TestDatabase database;
    auto& db = database.db();
    auto old_factory = single_password_crypto_factory("old");
    auto new_factory = single_password_crypto_factory("new");
    populate(db, old_factory);

    reencrypt_user(db, "alice", old_factory("alice"), new_factory("alice"));
    {
        ContentsManager bob(db, "bob", new_factory("bob"), StoreParams());
        CHECK_THROWS_AS(bob.get("b.txt"), CorruptedFile);
    }

    // Rotating with a fallback of both passwords completes the job.
    reencrypt_all_users(db, fallback_password_crypto_factory({"new", "old"}), new_factory);
    check_readable(db, new_factory);
}

TEST_CASE("Re-encrypt to a fallback of the new and old passwords")
{
    TestDatabase database;
    auto& db = database.db();
    auto old_factory = single_password_crypto_factory("old");
    populate(db, old_factory);

    reencrypt_all_users(db, old_factory, fallback_password_crypto_factory({"new", "old"}));
    check_readable(db, single_password_crypto_factory("new"));
    for (const char* user : {"alice", "bob"})
    {
        CHECK(count_opened(db, user, old_factory(user)) == 0);
        CHECK(count_opened(db, user, single_password_crypto_factory("new")(user)) == 4);
    }
}

TEST_CASE("Re-encrypt plaintext to a fallback that reads plaintext")
{
    TestDatabase database;
    auto& db = database.db();
    populate(db, no_password_crypto_factory());

    reencrypt_all_users(
        db, no_password_crypto_factory(), fallback_password_crypto_factory({"new", std::nullopt}));
    check_readable(db, single_password_crypto_factory("new"));
    for (const auto& blob : all_blobs(db))
    {
        CHECK(blob.find("other") == std::string::npos);
    }
}

TEST_CASE("Re-encrypt plaintext content")
{
    TestDatabase database;
    auto& db = database.db();
    auto new_factory = single_password_crypto_factory("new");
    populate(db, no_password_crypto_factory());

    reencrypt_all_users(db, no_password_crypto_factory(), new_factory);
    check_readable(db, new_factory);
    for (const auto& blob : all_blobs(db))
    {
        CHECK(blob.find("other") == std::string::npos);
    }
}

TEST_CASE("Re-encrypt refuses a plaintext target")
{
    TestDatabase database;
    auto& db = database.db();
    auto old_factory = single_password_crypto_factory("old");
    populate(db, old_factory);
    auto before = all_blobs(db);

    CHECK_THROWS_AS(reencrypt_user(db, "alice", old_factory("alice"), NoEncryption()),
                    std::invalid_argument);
    CHECK_THROWS_AS(reencrypt_all_users(db,
                                        old_factory,
                                        fallback_password_crypto_factory({std::nullopt})),
                    std::invalid_argument);
    CHECK(all_blobs(db) == before);
}

TEST_CASE("Unencrypt")
{
    TestDatabase database;
    auto& db = database.db();
    auto old_factory = single_password_crypto_factory("old");
    populate(db, old_factory);

    unencrypt_user(db, "alice", old_factory("alice"));
    {
        ContentsManager alice(db, "alice", NoEncryption(), StoreParams());
        CHECK(*alice.get("b.txt").content == "other");
        ContentsManager bob(db, "bob", old_factory("bob"), StoreParams());
        CHECK(*bob.get("b.txt").content == "other");
    }

    // Alice is done already, so this only touches bob.
    unencrypt_all_users(db, old_factory);
    check_readable(db, no_password_crypto_factory());
    auto before = all_blobs(db);
    unencrypt_all_users(db, old_factory);
    CHECK(all_blobs(db) == before);

    CHECK_THROWS_AS(unencrypt_user(db, "alice", NoEncryption()), std::invalid_argument);
}

TEST_CASE("Plaintext writers")
{
    AesGcmEncryption aes(derive_single_key("pw", "alice"));
    CHECK(writes_plaintext(NoEncryption()));
    CHECK(!writes_plaintext(aes));
    CHECK(!writes_plaintext(FallbackEncryption({aes, NoEncryption()})));
    CHECK(writes_plaintext(FallbackEncryption({NoEncryption()})));
}
}    // namespace notestore
