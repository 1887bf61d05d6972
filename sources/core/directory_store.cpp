#include "core/directory_store.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"
#include "core/utilities.hpp"

#include <absl/strings/match.h>

#include <stdexcept>

namespace notestore
{
void DirectoryStore::create_directory(std::string_view user_id, std::string_view api_path)
{
    auto name = from_api_dirname(api_path);
    if (!insert_)
    {
        insert_ = db_.statement(R"(
            insert into directories (user_id, name, parent_user_id, parent_name)
                values (?1, ?2, ?3, ?4);
        )");
    }
    auto guard = insert_.scoped_reset();
    insert_.bind_text(1, user_id);
    insert_.bind_text(2, name);

    std::string parent_name;
    if (name == "/")
    {
        insert_.bind_null(3);
        insert_.bind_null(4);
    }
    else
    {
        parent_name = parent_of_db_dirname(name);
        insert_.bind_text(3, user_id);
        insert_.bind_text(4, parent_name);
    }
    try
    {
        insert_.step();
    }
    catch (const SQLiteException& e)
    {
        if (e.is_unique_violation())
            throw DirectoryExists(api_path);
        if (e.is_foreign_key_violation())
            throw NoSuchDirectory(to_api_path(parent_name));
        throw;
    }
}

void DirectoryStore::ensure_directory(std::string_view user_id, std::string_view api_path)
{
    try
    {
        create_directory(user_id, api_path);
    }
    catch (const DirectoryExists&)
    {
        // Possibly created by a concurrent caller; either way it is there now.
    }
}

bool DirectoryStore::dir_exists(std::string_view user_id, std::string_view api_dirname)
{
    return db_dir_exists(user_id, from_api_dirname(api_dirname));
}

bool DirectoryStore::db_dir_exists(std::string_view user_id, std::string_view db_dirname)
{
    if (!exists_)
    {
        exists_ = db_.statement("select 1 from directories where user_id = ? and name = ?;");
    }
    auto guard = exists_.scoped_reset();
    exists_.bind_text(1, user_id);
    exists_.bind_text(2, db_dirname);
    return exists_.step();
}

std::vector<FileRecord> DirectoryStore::files_in_directory(std::string_view user_id,
                                                           std::string_view db_dirname)
{
    if (!list_files_)
    {
        list_files_ = db_.statement(R"(
            select id, name, parent_name, created_at from files
                where user_id = ? and parent_name = ?
                order by name;
        )");
    }
    auto guard = list_files_.scoped_reset();
    list_files_.bind_text(1, user_id);
    list_files_.bind_text(2, db_dirname);
    std::vector<FileRecord> result;
    while (list_files_.step())
    {
        auto& record = result.emplace_back();
        record.id = list_files_.get_int(0);
        record.name = list_files_.get_text(1);
        record.parent_name = list_files_.get_text(2);
        record.created_at = from_db_time(list_files_.get_int(3));
    }
    return result;
}

std::vector<std::string> DirectoryStore::directories_in_directory(std::string_view user_id,
                                                                  std::string_view db_dirname)
{
    if (!list_subdirs_)
    {
        list_subdirs_ = db_.statement(R"(
            select name from directories
                where parent_user_id = ? and parent_name = ?
                order by name;
        )");
    }
    auto guard = list_subdirs_.scoped_reset();
    list_subdirs_.bind_text(1, user_id);
    list_subdirs_.bind_text(2, db_dirname);
    std::vector<std::string> result;
    while (list_subdirs_.step())
    {
        result.emplace_back(list_subdirs_.get_text(0));
    }
    return result;
}

DirectoryRecord DirectoryStore::get_directory(std::string_view user_id,
                                              std::string_view api_dirname,
                                              bool with_content)
{
    DirectoryRecord result;
    result.name = from_api_dirname(api_dirname);
    if (!db_dir_exists(user_id, result.name))
    {
        throw NoSuchDirectory(api_dirname);
    }
    if (with_content)
    {
        result.files = files_in_directory(user_id, result.name);
        result.subdirs = directories_in_directory(user_id, result.name);
    }
    return result;
}

void DirectoryStore::delete_directory(std::string_view user_id, std::string_view api_path)
{
    if (!delete_)
    {
        delete_ = db_.statement("delete from directories where user_id = ? and name = ?;");
    }
    auto name = from_api_dirname(api_path);
    auto guard = delete_.scoped_reset();
    delete_.bind_text(1, user_id);
    delete_.bind_text(2, name);
    try
    {
        delete_.step();
    }
    catch (const SQLiteException& e)
    {
        if (e.is_foreign_key_violation())
            throw DirectoryNotEmpty(api_path);
        throw;
    }
    if (db_.last_changes() == 0)
    {
        throw NoSuchDirectory(api_path);
    }
}

void DirectoryStore::rename_directory(std::string_view user_id,
                                      std::string_view old_api_path,
                                      std::string_view new_api_path)
{
    auto old_name = from_api_dirname(old_api_path);
    auto new_name = from_api_dirname(new_api_path);

    if (old_name == "/")
    {
        throw RenameRoot(old_api_path);
    }
    if (!db_dir_exists(user_id, old_name))
    {
        throw NoSuchDirectory(old_api_path);
    }
    if (db_dir_exists(user_id, new_name))
    {
        throw DirectoryExists(new_api_path);
    }
    if (absl::StartsWith(new_name, old_name))
    {
        throw std::invalid_argument("Cannot move a directory into its own subtree");
    }
    auto new_parent = parent_of_db_dirname(new_name);
    if (!db_dir_exists(user_id, new_parent))
    {
        throw NoSuchDirectory(to_api_path(new_parent));
    }

    // The children of the renamed row point at a name that no longer exists until the second
    // statement has run.
    db_.defer_foreign_keys();

    if (!rename_self_)
    {
        rename_self_ = db_.statement(R"(
            update directories set name = ?3, parent_name = ?4
                where user_id = ?1 and name = ?2;
        )");
    }
    {
        auto guard = rename_self_.scoped_reset();
        rename_self_.bind_text(1, user_id);
        rename_self_.bind_text(2, old_name);
        rename_self_.bind_text(3, new_name);
        rename_self_.bind_text(4, new_parent);
        rename_self_.step();
        VALIDATE_CONSTRAINT(db_.last_changes() == 1);
    }

    // One statement for the whole subtree, because the slash count CHECK is evaluated per row and
    // cannot be deferred.
    if (!rename_descendants_)
    {
        rename_descendants_ = db_.statement(R"(
            update directories
                set name = ?3 || substr(name, length(?2) + 1),
                    parent_name = ?3 || substr(parent_name, length(?2) + 1)
                where user_id = ?1
                    and substr(name, 1, length(?2)) = ?2
                    and substr(parent_name, 1, length(?2)) = ?2;
        )");
    }
    auto guard = rename_descendants_.scoped_reset();
    rename_descendants_.bind_text(1, user_id);
    rename_descendants_.bind_text(2, old_name);
    rename_descendants_.bind_text(3, new_name);
    rename_descendants_.step();
}
}    // namespace notestore
