#pragma once

#include "core/sqlitehelper.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace notestore
{
/// @brief The users table. Every other table is partitioned by user id.
class UserStore
{
public:
    explicit UserStore(SQLiteDB db) : db_(std::move(db)) {}

    /// @brief Insert the user unless it exists already.
    void ensure_user(std::string_view user_id);

    std::vector<std::string> list_users();

    /// @brief Delete the user together with all of its checkpoints, files and directories.
    void purge_user(std::string_view user_id);

private:
    SQLiteDB db_;
    SQLiteStatement insert_, list_, delete_checkpoints_, delete_files_, delete_directories_,
        delete_user_;
};
}    // namespace notestore
