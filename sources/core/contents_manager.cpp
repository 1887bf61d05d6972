#include "core/contents_manager.hpp"
#include "core/api_path.hpp"
#include "core/exceptions.hpp"
#include "core/schema.hpp"
#include "core/utilities.hpp"

#include <absl/log/log.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <magic_enum.hpp>

#include <stdexcept>

namespace notestore
{
namespace
{
    std::string last_segment(std::string_view path)
    {
        auto pos = path.rfind('/');
        if (pos == std::string_view::npos)
        {
            return std::string(path);
        }
        return std::string(path.substr(pos + 1));
    }

    Model base_model(const std::string& path, EntryType type)
    {
        Model model;
        model.name = last_segment(path);
        model.path = path;
        model.type = type;
        return model;
    }
}    // namespace

std::string decode_content(std::string_view content, ContentFormat format)
{
    switch (format)
    {
    case ContentFormat::TEXT:
        if (!is_valid_utf8(content))
        {
            throw std::invalid_argument("Text content is not valid UTF-8");
        }
        return std::string(content);
    case ContentFormat::BASE64:
    {
        std::string decoded;
        if (!absl::Base64Unescape(content, &decoded))
        {
            throw std::invalid_argument("Content is not valid base64");
        }
        return decoded;
    }
    }
    throw std::invalid_argument(
        absl::StrCat("Unknown content format ", magic_enum::enum_name(format)));
}

std::pair<std::string, ContentFormat> encode_content(std::string content,
                                                     std::optional<ContentFormat> format)
{
    bool is_text = is_valid_utf8(content);
    if (!format)
    {
        format = is_text ? ContentFormat::TEXT : ContentFormat::BASE64;
    }
    switch (*format)
    {
    case ContentFormat::TEXT:
        if (!is_text)
        {
            throw std::invalid_argument("Content is not UTF-8 encoded and cannot be read as text");
        }
        return {std::move(content), ContentFormat::TEXT};
    case ContentFormat::BASE64:
        return {absl::Base64Escape(content), ContentFormat::BASE64};
    }
    throw std::invalid_argument(
        absl::StrCat("Unknown content format ", magic_enum::enum_name(*format)));
}

ContentsManager::ContentsManager(SQLiteDB db,
                                 std::string user_id,
                                 Crypto crypto,
                                 const StoreParams& params)
    : db_(std::move(db))
    , user_id_(std::move(user_id))
    , crypto_(std::move(crypto))
    , max_file_size_bytes_(params.max_file_size_bytes())
    , users_(db_)
    , directories_(db_)
    , files_(db_)
    , checkpoints_(db_)
{
    check_schema_version(db_);
    if (params.create_user_on_startup())
    {
        with_transaction(db_,
                         [&]()
                         {
                             users_.ensure_user(user_id_);
                             directories_.ensure_directory(user_id_, "");
                         });
    }
}

std::string ContentsManager::encrypt_content(std::string_view plaintext) const
{
    return encrypt(crypto_, plaintext);
}

std::string ContentsManager::decrypt_content(std::string_view ciphertext) const
{
    return decrypt(crypto_, ciphertext);
}

bool ContentsManager::file_exists_unlocked(const std::string& path)
{
    // The root can only be a directory.
    return !path.empty() && files_.file_exists(user_id_, path);
}

Model ContentsManager::get_file_model(const std::string& path,
                                      bool with_content,
                                      std::optional<ContentFormat> format)
{
    FileRecord record;
    if (with_content)
    {
        record = files_.get_file(
            user_id_, path, [this](std::string_view c) { return decrypt_content(c); });
    }
    else
    {
        record = files_.get_file(user_id_, path);
    }
    Model model = base_model(path, EntryType::FILE);
    model.created = model.last_modified = record.created_at;
    if (with_content)
    {
        auto [content, actual_format] = encode_content(std::move(*record.content), format);
        model.content = std::move(content);
        model.format = actual_format;
    }
    return model;
}

Model ContentsManager::get_directory_model(const std::string& path, bool with_content)
{
    auto record = directories_.get_directory(user_id_, path, with_content);
    Model model = base_model(path, EntryType::DIRECTORY);
    if (with_content)
    {
        for (const auto& subdir : *record.subdirs)
        {
            model.children.push_back(base_model(to_api_path(subdir), EntryType::DIRECTORY));
        }
        for (const auto& file : *record.files)
        {
            Model& child
                = model.children.emplace_back(base_model(file.api_path(), EntryType::FILE));
            child.created = child.last_modified = file.created_at;
        }
    }
    return model;
}

void ContentsManager::write_file(const std::string& path, std::string_view content)
{
    if (path.empty())
    {
        throw std::invalid_argument("The root is a directory and cannot hold content");
    }
    files_.save_file(
        user_id_,
        path,
        content,
        [this](std::string_view p) { return encrypt_content(p); },
        max_file_size_bytes_);
}

bool ContentsManager::dir_exists(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(db_,
                            [&]() { return directories_.dir_exists(user_id_, normalized); });
}

bool ContentsManager::file_exists(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(db_, [&]() { return file_exists_unlocked(normalized); });
}

Model ContentsManager::get(std::string_view path,
                           bool with_content,
                           std::optional<EntryType> type,
                           std::optional<ContentFormat> format)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(
        db_,
        [&]()
        {
            auto actual_type = type;
            if (!actual_type)
            {
                if (file_exists_unlocked(normalized))
                    actual_type = EntryType::FILE;
                else if (directories_.dir_exists(user_id_, normalized))
                    actual_type = EntryType::DIRECTORY;
                else
                    throw NoSuchFile(normalized);
            }
            if (*actual_type == EntryType::DIRECTORY)
            {
                return get_directory_model(normalized, with_content);
            }
            return get_file_model(normalized, with_content, format);
        });
}

Model ContentsManager::save(const Model& model, std::string_view path)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(
        db_,
        [&]()
        {
            if (model.type == EntryType::DIRECTORY)
            {
                directories_.ensure_directory(user_id_, normalized);
                return get_directory_model(normalized, false);
            }
            if (!model.content)
            {
                throw std::invalid_argument("No file content provided");
            }
            if (!model.format)
            {
                throw std::invalid_argument("No file format provided");
            }
            write_file(normalized, decode_content(*model.content, *model.format));
            return get_file_model(normalized, false, std::nullopt);
        });
}

Model ContentsManager::rename(std::string_view old_path, std::string_view new_path)
{
    auto old_normalized = normalize_api_path(old_path);
    auto new_normalized = normalize_api_path(new_path);
    return with_transaction(
        db_,
        [&]()
        {
            if (file_exists_unlocked(old_normalized))
            {
                if (new_normalized.empty())
                {
                    throw DirectoryExists(new_normalized);
                }
                files_.rename_file(user_id_, old_normalized, new_normalized);
                checkpoints_.move_file(user_id_, old_normalized, new_normalized);
                return get_file_model(new_normalized, false, std::nullopt);
            }
            if (!old_normalized.empty() && !directories_.dir_exists(user_id_, old_normalized))
            {
                throw NoSuchFile(old_normalized);
            }
            directories_.rename_directory(user_id_, old_normalized, new_normalized);
            checkpoints_.move_directory(user_id_, old_normalized, new_normalized);
            return get_directory_model(new_normalized, false);
        });
}

void ContentsManager::delete_entry(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    with_transaction(db_,
                     [&]()
                     {
                         if (file_exists_unlocked(normalized))
                         {
                             files_.delete_file(user_id_, normalized);
                             checkpoints_.delete_all(user_id_, normalized);
                             return;
                         }
                         if (normalized.empty())
                         {
                             throw std::invalid_argument("Cannot delete the root directory");
                         }
                         if (!directories_.dir_exists(user_id_, normalized))
                         {
                             throw NoSuchFile(normalized);
                         }
                         directories_.delete_directory(user_id_, normalized);
                     });
}

CheckpointModel ContentsManager::create_checkpoint(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(
        db_,
        [&]()
        {
            auto file = files_.get_file(
                user_id_, normalized, [this](std::string_view c) { return decrypt_content(c); });
            auto saved = checkpoints_.save(
                user_id_,
                normalized,
                *file.content,
                [this](std::string_view p) { return encrypt_content(p); },
                max_file_size_bytes_);
            return CheckpointModel{saved.id, saved.last_modified};
        });
}

std::vector<CheckpointModel> ContentsManager::list_checkpoints(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    return with_transaction(db_,
                            [&]()
                            {
                                std::vector<CheckpointModel> result;
                                for (const auto& record : checkpoints_.list(user_id_, normalized))
                                {
                                    result.push_back({record.id, record.last_modified});
                                }
                                return result;
                            });
}

void ContentsManager::restore_checkpoint(int64_t checkpoint_id, std::string_view path)
{
    auto normalized = normalize_api_path(path);
    with_transaction(db_,
                     [&]()
                     {
                         auto checkpoint = checkpoints_.get(
                             user_id_,
                             normalized,
                             checkpoint_id,
                             [this](std::string_view c) { return decrypt_content(c); });
                         write_file(normalized, *checkpoint.content);
                     });
}

void ContentsManager::delete_checkpoint(int64_t checkpoint_id, std::string_view path)
{
    auto normalized = normalize_api_path(path);
    with_transaction(db_,
                     [&]() { checkpoints_.delete_one(user_id_, normalized, checkpoint_id); });
}

void ContentsManager::delete_all_checkpoints(std::string_view path)
{
    auto normalized = normalize_api_path(path);
    with_transaction(db_, [&]() { checkpoints_.delete_all(user_id_, normalized); });
}

void ContentsManager::rename_all_checkpoints(std::string_view old_path, std::string_view new_path)
{
    auto old_normalized = normalize_api_path(old_path);
    auto new_normalized = normalize_api_path(new_path);
    with_transaction(
        db_, [&]() { checkpoints_.move_all(user_id_, old_normalized, new_normalized); });
}

void ContentsManager::purge_user()
{
    with_transaction(db_, [&]() { users_.purge_user(user_id_); });
}

size_t ContentsManager::dump_latest_checkpoints(ContentsManager& target)
{
    // Read everything first, as `target` may share the connection and cannot open a transaction
    // while this one is open.
    auto snapshots = with_transaction(
        db_,
        [&]()
        {
            std::vector<CheckpointRecord> result;
            for (const auto& latest : checkpoints_.latest_per_path(user_id_))
            {
                result.push_back(checkpoints_.get(
                    user_id_,
                    latest.path,
                    latest.id,
                    [this](std::string_view c) { return decrypt_content(c); }));
            }
            return result;
        });

    for (const auto& snapshot : snapshots)
    {
        for (const auto& dirname : prefix_dirs(snapshot.path))
        {
            LOG(INFO) << "Ensuring directory [" << dirname << "]";
            target.save(base_model(dirname, EntryType::DIRECTORY), dirname);
        }
        LOG(INFO) << "Writing file [" << snapshot.path << "]";
        Model model = base_model(snapshot.path, EntryType::FILE);
        model.format = ContentFormat::BASE64;
        model.content = absl::Base64Escape(*snapshot.content);
        target.save(model, snapshot.path);
    }
    return snapshots.size();
}
}    // namespace notestore
