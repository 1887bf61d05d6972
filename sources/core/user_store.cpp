#include "core/user_store.hpp"
#include "core/schema.hpp"

#include <absl/log/log.h>
#include <absl/strings/str_format.h>

#include <stdexcept>

namespace notestore
{
void UserStore::ensure_user(std::string_view user_id)
{
    if (user_id.empty() || user_id.size() > kMaxUserIdLength)
    {
        throw std::invalid_argument(absl::StrFormat(
            "User id must have between 1 and %d characters, got [%s]", kMaxUserIdLength, user_id));
    }
    if (!insert_)
    {
        insert_ = db_.statement("insert or ignore into users (id) values (?);");
    }
    auto guard = insert_.scoped_reset();
    insert_.bind_text(1, user_id);
    insert_.step();
    if (db_.last_changes() > 0)
    {
        LOG(INFO) << "Created user " << user_id;
    }
}

std::vector<std::string> UserStore::list_users()
{
    if (!list_)
    {
        list_ = db_.statement("select id from users order by id;");
    }
    auto guard = list_.scoped_reset();
    std::vector<std::string> result;
    while (list_.step())
    {
        result.emplace_back(list_.get_text(0));
    }
    return result;
}

void UserStore::purge_user(std::string_view user_id)
{
    if (!delete_checkpoints_)
    {
        delete_checkpoints_ = db_.statement("delete from remote_checkpoints where user_id = ?;");
        delete_files_ = db_.statement("delete from files where user_id = ?;");
        delete_directories_ = db_.statement("delete from directories where user_id = ?;");
        delete_user_ = db_.statement("delete from users where id = ?;");
    }
    // Children before parents, so that no foreign key is left dangling after any statement.
    for (SQLiteStatement* st :
         {&delete_checkpoints_, &delete_files_, &delete_directories_, &delete_user_})
    {
        auto guard = st->scoped_reset();
        st->bind_text(1, user_id);
        st->step();
    }
    LOG(INFO) << "Purged user " << user_id;
}
}    // namespace notestore
