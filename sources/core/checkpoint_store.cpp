#include "core/checkpoint_store.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"
#include "core/utilities.hpp"

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>

namespace notestore
{
namespace
{
    CheckpointRecord read_metadata(SQLiteStatement& st)
    {
        CheckpointRecord record;
        record.id = st.get_int(0);
        record.path = to_api_path(st.get_text(1));
        record.last_modified = from_db_time(st.get_int(2));
        return record;
    }
}    // namespace

CheckpointRecord CheckpointStore::save(std::string_view user_id,
                                       std::string_view api_path,
                                       std::string_view content,
                                       EncryptFunc encrypt,
                                       uint64_t max_size_bytes)
{
    auto encrypted = preprocess_incoming_content(content, encrypt, max_size_bytes, api_path);
    if (!insert_)
    {
        insert_ = db_.statement(R"(
            insert into remote_checkpoints (user_id, path, content, last_modified)
                values (?, ?, ?, ?);
        )");
    }
    auto db_path = from_api_filename(api_path);
    auto now = to_db_time(absl::Now());

    auto guard = insert_.scoped_reset();
    insert_.bind_text(1, user_id);
    insert_.bind_text(2, db_path);
    insert_.bind_blob(3, encrypted);
    insert_.bind_int(4, now);
    insert_.step();

    CheckpointRecord result;
    result.id = db_.last_insert_rowid();
    result.path = to_api_path(db_path);
    result.last_modified = from_db_time(now);
    return result;
}

CheckpointRecord CheckpointStore::get(std::string_view user_id,
                                      std::string_view api_path,
                                      int64_t id,
                                      DecryptFunc decrypt)
{
    if (!select_)
    {
        select_ = db_.statement(R"(
            select id, path, last_modified, content from remote_checkpoints
                where user_id = ? and path = ? and id = ?;
        )");
    }
    auto guard = select_.scoped_reset();
    auto db_path = from_api_filename(api_path);
    select_.bind_text(1, user_id);
    select_.bind_text(2, db_path);
    select_.bind_int(3, id);
    if (!select_.step())
    {
        throw NoSuchCheckpoint(api_path, id);
    }
    auto result = read_metadata(select_);
    result.content = decrypt(select_.get_blob(3));
    return result;
}

std::vector<CheckpointRecord> CheckpointStore::list(std::string_view user_id,
                                                    std::string_view api_path)
{
    if (!list_)
    {
        list_ = db_.statement(R"(
            select id, path, last_modified from remote_checkpoints
                where user_id = ? and path = ?
                order by last_modified desc, id desc;
        )");
    }
    auto guard = list_.scoped_reset();
    auto db_path = from_api_filename(api_path);
    list_.bind_text(1, user_id);
    list_.bind_text(2, db_path);
    std::vector<CheckpointRecord> result;
    while (list_.step())
    {
        result.push_back(read_metadata(list_));
    }
    return result;
}

std::vector<CheckpointRecord> CheckpointStore::latest_per_path(std::string_view user_id)
{
    if (!latest_)
    {
        latest_ = db_.statement(R"(
            select c.id, c.path, c.last_modified from remote_checkpoints c
                where c.user_id = ?1
                    and c.id = (
                        select n.id from remote_checkpoints n
                            where n.user_id = ?1 and n.path = c.path
                            order by n.last_modified desc, n.id desc
                            limit 1)
                order by c.path;
        )");
    }
    auto guard = latest_.scoped_reset();
    latest_.bind_text(1, user_id);
    std::vector<CheckpointRecord> result;
    while (latest_.step())
    {
        result.push_back(read_metadata(latest_));
    }
    return result;
}

void CheckpointStore::delete_one(std::string_view user_id, std::string_view api_path, int64_t id)
{
    if (!delete_one_)
    {
        delete_one_ = db_.statement(
            "delete from remote_checkpoints where user_id = ? and path = ? and id = ?;");
    }
    auto guard = delete_one_.scoped_reset();
    auto db_path = from_api_filename(api_path);
    delete_one_.bind_text(1, user_id);
    delete_one_.bind_text(2, db_path);
    delete_one_.bind_int(3, id);
    delete_one_.step();
    if (db_.last_changes() == 0)
    {
        throw NoSuchCheckpoint(api_path, id);
    }
}

void CheckpointStore::delete_all(std::string_view user_id, std::string_view api_path)
{
    if (!delete_all_)
    {
        delete_all_
            = db_.statement("delete from remote_checkpoints where user_id = ? and path = ?;");
    }
    auto guard = delete_all_.scoped_reset();
    auto db_path = from_api_filename(api_path);
    delete_all_.bind_text(1, user_id);
    delete_all_.bind_text(2, db_path);
    delete_all_.step();
}

void CheckpointStore::purge_user(std::string_view user_id)
{
    if (!purge_)
    {
        purge_ = db_.statement("delete from remote_checkpoints where user_id = ?;");
    }
    auto guard = purge_.scoped_reset();
    purge_.bind_text(1, user_id);
    purge_.step();
}

void CheckpointStore::move_one(std::string_view user_id,
                               std::string_view src_api_path,
                               std::string_view dest_api_path,
                               int64_t id)
{
    if (!move_one_)
    {
        move_one_ = db_.statement(R"(
            update remote_checkpoints set path = ?3
                where user_id = ?1 and path = ?2 and id = ?4;
        )");
    }
    auto src = from_api_filename(src_api_path);
    auto dest = from_api_filename(dest_api_path);
    auto guard = move_one_.scoped_reset();
    move_one_.bind_text(1, user_id);
    move_one_.bind_text(2, src);
    move_one_.bind_text(3, dest);
    move_one_.bind_int(4, id);
    move_one_.step();
    if (db_.last_changes() == 0)
    {
        throw NoSuchCheckpoint(src_api_path, id);
    }
}

void CheckpointStore::move_file(std::string_view user_id,
                                std::string_view src_api_path,
                                std::string_view dest_api_path)
{
    if (!move_exact_)
    {
        move_exact_ = db_.statement(R"(
            update remote_checkpoints set path = ?3
                where user_id = ?1 and path = ?2;
        )");
    }
    auto guard = move_exact_.scoped_reset();
    move_exact_.bind_text(1, user_id);
    move_exact_.bind_text(2, from_api_filename(src_api_path));
    move_exact_.bind_text(3, from_api_filename(dest_api_path));
    move_exact_.step();
}

void CheckpointStore::move_directory(std::string_view user_id,
                                     std::string_view src_api_path,
                                     std::string_view dest_api_path)
{
    if (!move_prefix_)
    {
        move_prefix_ = db_.statement(R"(
            update remote_checkpoints set path = ?3 || substr(path, length(?2) + 1)
                where user_id = ?1 and substr(path, 1, length(?2)) = ?2;
        )");
    }
    // The trailing slash keeps "/ab.txt" and the file "/a" out of a rename of "/a".
    auto guard = move_prefix_.scoped_reset();
    move_prefix_.bind_text(1, user_id);
    move_prefix_.bind_text(2, absl::StrCat(from_api_filename(src_api_path), "/"));
    move_prefix_.bind_text(3, absl::StrCat(from_api_filename(dest_api_path), "/"));
    move_prefix_.step();
}

void CheckpointStore::move_all(std::string_view user_id,
                               std::string_view src_api_path,
                               std::string_view dest_api_path)
{
    move_file(user_id, src_api_path, dest_api_path);
    move_directory(user_id, src_api_path, dest_api_path);
}

std::vector<int64_t> CheckpointStore::select_checkpoint_ids(std::string_view user_id)
{
    if (!select_ids_)
    {
        select_ids_
            = db_.statement("select id from remote_checkpoints where user_id = ? order by id;");
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

bool CheckpointStore::rewrite_content(int64_t id, ContentRewriter rewrite)
{
    if (!select_content_by_id_)
    {
        select_content_by_id_
            = db_.statement("select content from remote_checkpoints where id = ?;");
        update_content_by_id_
            = db_.statement("update remote_checkpoints set content = ? where id = ?;");
    }
    std::optional<std::string> content;
    {
        auto guard = select_content_by_id_.scoped_reset();
        select_content_by_id_.bind_int(1, id);
        if (!select_content_by_id_.step())
        {
            throw InternalError(
                absl::StrCat("Checkpoint row ", id, " vanished during re-encryption"));
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
