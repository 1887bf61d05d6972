#include "core/directory_store.hpp"
#include "core/exceptions.hpp"
#include "core/file_store.hpp"
#include "core/user_store.hpp"

#include "test_database.hpp"

#include <doctest/doctest.h>

#include <stdexcept>

namespace notestore
{
namespace
{
    std::string identity(std::string_view s) { return std::string(s); }

    void setup_user(SQLiteDB& db, const char* user)
    {
        with_transaction(db,
                         [&]()
                         {
                             UserStore(db).ensure_user(user);
                             DirectoryStore(db).ensure_directory(user, "");
                         });
    }
}    // namespace

TEST_CASE("Ensure directory is idempotent")
{
    TestDatabase database;
    auto& db = database.db();
    setup_user(db, "alice");
    DirectoryStore store(db);

    with_transaction(db, [&]() { store.ensure_directory("alice", "foo"); });
    with_transaction(db, [&]() { store.ensure_directory("alice", "/foo/"); });
    CHECK(store.dir_exists("alice", "foo"));
    CHECK(!store.dir_exists("bob", "foo"));
    CHECK(query_int(db,
                    "select count(*) from directories where user_id = 'alice' and name = '/foo/'")
          == 1);

    CHECK_THROWS_AS(store.create_directory("alice", "foo"), DirectoryExists);
    CHECK_THROWS_AS(store.create_directory("alice", "missing/child"), NoSuchDirectory);
    CHECK(!store.dir_exists("alice", "missing/child"));
}

TEST_CASE("List a directory")
{
    TestDatabase database;
    auto& db = database.db();
    setup_user(db, "alice");
    DirectoryStore store(db);
    FileStore files(db);

    with_transaction(db,
                     [&]()
                     {
                         store.create_directory("alice", "d");
                         store.create_directory("alice", "d/z");
                         store.create_directory("alice", "d/a");
                         store.create_directory("alice", "d/a/deep");
                         files.save_file("alice", "d/b.txt", "b", identity, kUnlimitedSize);
                         files.save_file("alice", "d/a.txt", "a", identity, kUnlimitedSize);
                     });

    auto dir = store.get_directory("alice", "d", true);
    CHECK(dir.name == "/d/");
    REQUIRE(dir.subdirs);
    CHECK(*dir.subdirs == std::vector<std::string>{"/d/a/", "/d/z/"});
    REQUIRE(dir.files);
    REQUIRE(dir.files->size() == 2);
    CHECK(dir.files->at(0).api_path() == "d/a.txt");
    CHECK(dir.files->at(1).api_path() == "d/b.txt");
    CHECK(!dir.files->at(0).content);

    auto bare = store.get_directory("alice", "d", false);
    CHECK(!bare.files);
    CHECK(!bare.subdirs);
    CHECK_THROWS_AS(store.get_directory("alice", "nothing", false), NoSuchDirectory);
}

TEST_CASE("Delete a directory only when empty")
{
    TestDatabase database;
    auto& db = database.db();
    setup_user(db, "alice");
    DirectoryStore store(db);
    FileStore files(db);

    with_transaction(db,
                     [&]()
                     {
                         store.create_directory("alice", "foo");
                         store.create_directory("alice", "foo/bar");
                         files.save_file("alice", "foo/f.txt", "x", identity, kUnlimitedSize);
                     });

    CHECK_THROWS_AS(store.delete_directory("alice", "foo"), DirectoryNotEmpty);
    with_transaction(db, [&]() { store.delete_directory("alice", "foo/bar"); });
    CHECK_THROWS_AS(store.delete_directory("alice", "foo"), DirectoryNotEmpty);
    with_transaction(db, [&]() { files.delete_file("alice", "foo/f.txt"); });
    with_transaction(db, [&]() { store.delete_directory("alice", "foo"); });
    CHECK(!store.dir_exists("alice", "foo"));
    CHECK_THROWS_AS(store.delete_directory("alice", "foo"), NoSuchDirectory);
}

TEST_CASE("Rename a directory with its subtree")
{
    TestDatabase database;
    auto& db = database.db();
    setup_user(db, "alice");
    setup_user(db, "bob");
    DirectoryStore store(db);
    FileStore files(db);

    with_transaction(db,
                     [&]()
                     {
                         for (const char* user : {"alice", "bob"})
                         {
                             store.create_directory(user, "foo");
                             store.create_directory(user, "foo/sub");
                             store.create_directory(user, "foo/sub/leaf");
                             store.create_directory(user, "foobar");
                             files.save_file(user, "foo/baz.txt", "baz", identity, kUnlimitedSize);
                             files.save_file(
                                 user, "foo/sub/deep.txt", "deep", identity, kUnlimitedSize);
                         }
                     });
    auto baz_id = files.get_file_id("alice", "foo/baz.txt");

    with_transaction(db, [&]() { store.rename_directory("alice", "foo", "bar"); });

    CHECK(store.dir_exists("alice", "bar"));
    CHECK(store.dir_exists("alice", "bar/sub"));
    CHECK(store.dir_exists("alice", "bar/sub/leaf"));
    CHECK(!store.dir_exists("alice", "foo"));
    CHECK(!store.dir_exists("alice", "foo/sub"));
    // Shares the prefix but not the directory.
    CHECK(store.dir_exists("alice", "foobar"));

    CHECK(files.get_file("alice", "bar/baz.txt", identity).content == "baz");
    CHECK(files.get_file_id("alice", "bar/baz.txt") == baz_id);
    CHECK_THROWS_AS(files.get_file("alice", "foo/baz.txt"), NoSuchFile);
    CHECK(files.get_file("alice", "bar/sub/deep.txt", identity).content == "deep");

    // The other user is untouched.
    CHECK(store.dir_exists("bob", "foo/sub/leaf"));
    CHECK(files.file_exists("bob", "foo/sub/deep.txt"));

    // Every row keeps its parent one level up.
    CHECK(query_int(db, R"(
        select count(*) from directories
            where parent_name is not null
                and (substr(name, 1, length(parent_name)) != parent_name
                     or length(name) - length(replace(name, '/', ''))
                        != length(parent_name) - length(replace(parent_name, '/', '')) + 1)
    )") == 0);
    CHECK(query_int(db, R"(
        select count(*) from directories c
            where parent_name is not null
                and not exists (select 1 from directories p
                                    where p.user_id = c.user_id and p.name = c.parent_name)
    )") == 0);

    // Into a deeper existing parent.
    with_transaction(db, [&]() { store.rename_directory("alice", "bar/sub", "foobar/moved"); });
    CHECK(store.dir_exists("alice", "foobar/moved/leaf"));
    CHECK(files.file_exists("alice", "foobar/moved/deep.txt"));
    CHECK(store.get_directory("alice", "bar", true).subdirs->empty());
}

TEST_CASE("Invalid directory renames")
{
    TestDatabase database;
    auto& db = database.db();
    setup_user(db, "alice");
    DirectoryStore store(db);

    with_transaction(db,
                     [&]()
                     {
                         store.create_directory("alice", "a");
                         store.create_directory("alice", "a/b");
                         store.create_directory("alice", "c");
                     });

    auto rename = [&](const char* from, const char* to)
    { with_transaction(db, [&]() { store.rename_directory("alice", from, to); }); };

    CHECK_THROWS_AS(rename("", "x"), RenameRoot);
    CHECK_THROWS_AS(rename("/", "x"), RenameRoot);
    CHECK_THROWS_AS(rename("missing", "x"), NoSuchDirectory);
    CHECK_THROWS_AS(rename("a", "c"), DirectoryExists);
    CHECK_THROWS_AS(rename("a", "a/b/inside"), std::invalid_argument);
    CHECK_THROWS_AS(rename("a", "nowhere/a"), NoSuchDirectory);

    // Nothing moved.
    CHECK(store.dir_exists("alice", "a/b"));
    CHECK(store.dir_exists("alice", "c"));
}
}    // namespace notestore
