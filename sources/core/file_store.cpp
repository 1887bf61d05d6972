#include "core/file_store.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"
#include "core/utilities.hpp"

#include <absl/log/log.h>
#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>

namespace notestore
{
FileRecord FileStore::select_file(std::string_view user_id,
                                  std::string_view api_path,
                                  std::optional<DecryptFunc> decrypt)
{
    auto [parent_name, name] = split_api_filepath(api_path);
    SQLiteStatement* st = nullptr;
    if (decrypt)
    {
        if (!select_with_content_)
        {
            select_with_content_ = db_.statement(R"(
                select id, created_at, content from files
                    where user_id = ? and parent_name = ? and name = ?
                    order by created_at desc
                    limit 1;
            )");
        }
        st = &select_with_content_;
    }
    else
    {
        if (!select_)
        {
            select_ = db_.statement(R"(
                select id, created_at from files
                    where user_id = ? and parent_name = ? and name = ?
                    order by created_at desc
                    limit 1;
            )");
        }
        st = &select_;
    }
    auto guard = st->scoped_reset();
    st->bind_text(1, user_id);
    st->bind_text(2, parent_name);
    st->bind_text(3, name);
    if (!st->step())
    {
        throw NoSuchFile(api_path);
    }
    FileRecord result;
    result.id = st->get_int(0);
    result.created_at = from_db_time(st->get_int(1));
    if (decrypt)
    {
        result.content = (*decrypt)(st->get_blob(2));
    }
    result.name = std::move(name);
    result.parent_name = std::move(parent_name);
    return result;
}

FileRecord FileStore::get_file(std::string_view user_id, std::string_view api_path)
{
    return select_file(user_id, api_path, std::nullopt);
}

FileRecord
FileStore::get_file(std::string_view user_id, std::string_view api_path, DecryptFunc decrypt)
{
    return select_file(user_id, api_path, decrypt);
}

int64_t FileStore::get_file_id(std::string_view user_id, std::string_view api_path)
{
    return get_file(user_id, api_path).id;
}

bool FileStore::file_exists(std::string_view user_id, std::string_view api_path)
{
    try
    {
        get_file(user_id, api_path);
        return true;
    }
    catch (const NoSuchFile&)
    {
        return false;
    }
}

void FileStore::save_file(std::string_view user_id,
                          std::string_view api_path,
                          std::string_view content,
                          EncryptFunc encrypt,
                          uint64_t max_size_bytes)
{
    auto encrypted = preprocess_incoming_content(content, encrypt, max_size_bytes, api_path);
    auto [parent_name, name] = split_api_filepath(api_path);
    auto now = to_db_time(absl::Now());

    if (!insert_)
    {
        insert_ = db_.statement(R"(
            insert into files (user_id, parent_name, name, content, created_at)
                values (?, ?, ?, ?, ?);
        )");
        update_ = db_.statement(R"(
            update files set content = ?4, created_at = ?5
                where user_id = ?1 and parent_name = ?2 and name = ?3;
        )");
    }

    // Insert first, since most saves create a file. A unique violation means the row exists
    // (possibly written by a concurrent saver that committed first) and is overwritten instead.
    // Should the row vanish before the update, the insert is tried exactly once more.
    for (int attempt = 0; attempt < 2; ++attempt)
    {
        SQLiteSavepoint savepoint(db_, "save_file");
        try
        {
            auto guard = insert_.scoped_reset();
            insert_.bind_text(1, user_id);
            insert_.bind_text(2, parent_name);
            insert_.bind_text(3, name);
            insert_.bind_blob(4, encrypted);
            insert_.bind_int(5, now);
            insert_.step();
            savepoint.release();
            return;
        }
        catch (const SQLiteException& e)
        {
            if (e.is_foreign_key_violation())
                throw NoSuchDirectory(to_api_path(parent_name));
            if (!e.is_unique_violation() || attempt > 0)
                throw;
        }
        savepoint.rollback();

        auto guard = update_.scoped_reset();
        update_.bind_text(1, user_id);
        update_.bind_text(2, parent_name);
        update_.bind_text(3, name);
        update_.bind_blob(4, encrypted);
        update_.bind_int(5, now);
        update_.step();
        bool updated = db_.last_changes() > 0;
        savepoint.release();
        if (updated)
        {
            return;
        }
        LOG(WARNING) << "File " << api_path << " of user " << user_id
                     << " disappeared during save, inserting again";
    }
    throw InternalError("Save did not converge after one retry");
}

void FileStore::delete_file(std::string_view user_id, std::string_view api_path)
{
    if (!delete_)
    {
        delete_ = db_.statement(
            "delete from files where user_id = ? and parent_name = ? and name = ?;");
    }
    auto [parent_name, name] = split_api_filepath(api_path);
    auto guard = delete_.scoped_reset();
    delete_.bind_text(1, user_id);
    delete_.bind_text(2, parent_name);
    delete_.bind_text(3, name);
    delete_.step();
    if (db_.last_changes() == 0)
    {
        throw NoSuchFile(api_path);
    }
}

void FileStore::rename_file(std::string_view user_id,
                            std::string_view old_api_path,
                            std::string_view new_api_path)
{
    // Overwriting existing files is disallowed.
    if (file_exists(user_id, new_api_path))
    {
        throw FileExists(new_api_path);
    }
    if (!rename_)
    {
        rename_ = db_.statement(R"(
            update files set parent_name = ?4, name = ?5, created_at = ?6
                where user_id = ?1 and parent_name = ?2 and name = ?3;
        )");
    }
    auto [old_parent, old_name] = split_api_filepath(old_api_path);
    auto [new_parent, new_name] = split_api_filepath(new_api_path);
    auto guard = rename_.scoped_reset();
    rename_.bind_text(1, user_id);
    rename_.bind_text(2, old_parent);
    rename_.bind_text(3, old_name);
    rename_.bind_text(4, new_parent);
    rename_.bind_text(5, new_name);
    rename_.bind_int(6, to_db_time(absl::Now()));
    try
    {
        rename_.step();
    }
    catch (const SQLiteException& e)
    {
        if (e.is_foreign_key_violation())
            throw NoSuchDirectory(to_api_path(new_parent));
        throw;
    }
    if (db_.last_changes() == 0)
    {
        throw NoSuchFile(old_api_path);
    }
}

std::vector<int64_t> FileStore::select_file_ids(std::string_view user_id)
{
    if (!select_ids_)
    {
        select_ids_ = db_.statement("select id from files where user_id = ? order by id;");
    }
    auto guard = select_ids_.scoped_reset();
    select_ids_.bind_text(1, user_id);
    std::vector<int64_t> result;
    while (select_ids_.step())
    {
        result.push_back(select_ids_.get_int(0));
    }
    return result;
}

bool FileStore::rewrite_content(int64_t id, ContentRewriter rewrite)
{
    if (!select_content_by_id_)
    {
        select_content_by_id_ = db_.statement("select content from files where id = ?;");
        update_content_by_id_ = db_.statement("update files set content = ? where id = ?;");
    }
    std::optional<std::string> content;
    {
        auto guard = select_content_by_id_.scoped_reset();
        select_content_by_id_.bind_int(1, id);
        if (!select_content_by_id_.step())
        {
            throw InternalError(absl::StrCat("File row ", id, " vanished during re-encryption"));
        }
        content = rewrite(select_content_by_id_.get_blob(0));
    }
    if (!content)
    {
        return false;
    }
    auto guard = update_content_by_id_.scoped_reset();
    update_content_by_id_.bind_blob(1, *content);
    update_content_by_id_.bind_int(2, id);
    update_content_by_id_.step();
    return true;
}
}    // namespace notestore
