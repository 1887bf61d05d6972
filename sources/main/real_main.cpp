#include "real_main.hpp"
#include "cmdline.hpp"
#include "core/content_scan.hpp"
#include "core/directory_store.hpp"
#include "core/exceptions.hpp"
#include "core/reencryption.hpp"
#include "core/schema.hpp"
#include "core/sqlitehelper.hpp"
#include "core/user_store.hpp"

#include <CLI/CLI.hpp>
#include <absl/log/initialize.h>
#include <absl/strings/str_format.h>
#include <google/protobuf/text_format.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <vector>

namespace notestore
{
namespace
{
    constexpr const char* const kDefaultAllCmds = R"textproto(
        init_cmd: { database: { busy_timeout_ms: 5000 } }
        create_user_cmd: { database: { busy_timeout_ms: 5000 } }
        list_users_cmd: { database: { busy_timeout_ms: 5000 } }
        purge_user_cmd: { database: { busy_timeout_ms: 5000 } }
        reencrypt_cmd: { database: { busy_timeout_ms: 5000 } }
        unencrypt_cmd: { database: { busy_timeout_ms: 5000 } }
        scan_cmd: { database: { busy_timeout_ms: 5000 } table: FILES }
    )textproto";

    SQLiteDB open_checked_database(const DatabaseParams& params)
    {
        auto db = open_database(params);
        check_schema_version(db);
        return db;
    }

    void init_database(const InitCmd& cmd)
    {
        initialize_tables(open_database(cmd.database()));
        absl::PrintF(
            "Initialized schema version %d in %s\n", kSchemaVersion, cmd.database().path());
    }

    void create_user(const CreateUserCmd& cmd)
    {
        auto db = open_checked_database(cmd.database());
        with_transaction(db,
                         [&]()
                         {
                             UserStore(db).ensure_user(cmd.user_id());
                             DirectoryStore(db).ensure_directory(cmd.user_id(), "");
                         });
    }

    void list_users(const ListUsersCmd& cmd)
    {
        auto db = open_checked_database(cmd.database());
        for (const auto& user_id : UserStore(db).list_users())
        {
            absl::PrintF("%s\n", user_id);
        }
    }

    void purge_user(const PurgeUserCmd& cmd)
    {
        auto db = open_checked_database(cmd.database());
        with_transaction(db, [&]() { UserStore(db).purge_user(cmd.user_id()); });
    }

    void reencrypt(const ReencryptCmd& cmd)
    {
        auto db = open_checked_database(cmd.database());
        auto old_factory = make_old_crypto_factory(cmd);
        auto new_factory = single_password_crypto_factory(cmd.new_password());
        if (cmd.user_id().empty())
        {
            reencrypt_all_users(db, old_factory, new_factory);
        }
        else
        {
            reencrypt_user(
                db, cmd.user_id(), old_factory(cmd.user_id()), new_factory(cmd.user_id()));
        }
    }

    void unencrypt(const UnencryptCmd& cmd)
    {
        if (cmd.old_passwords().empty())
        {
            throw std::invalid_argument("At least one old password is required");
        }
        auto db = open_checked_database(cmd.database());
        std::vector<std::optional<std::string>> passwords(cmd.old_passwords().begin(),
                                                          cmd.old_passwords().end());
        auto old_factory = fallback_password_crypto_factory(std::move(passwords));
        if (cmd.user_id().empty())
        {
            unencrypt_all_users(db, old_factory);
        }
        else
        {
            unencrypt_user(db, cmd.user_id(), old_factory(cmd.user_id()));
        }
    }

    void scan(const ScanCmd& cmd)
    {
        auto db = open_checked_database(cmd.database());
        ScanOptions options;
        options.min_time = parse_time_option(cmd.min_time());
        options.max_time = parse_time_option(cmd.max_time());
        options.suffix = cmd.suffix();

        auto print = [](const ScannedContent& item)
        {
            absl::PrintF(
                "%d\t%s\t%s\t%s\t%d\n",
                item.id,
                item.user_id,
                item.path,
                absl::FormatTime(absl::RFC3339_full, item.last_modified, absl::UTCTimeZone()),
                item.content.size());
        };
        auto factory = make_crypto_factory(cmd.crypto());
        ScanSummary summary = cmd.table() == ScanCmd::CHECKPOINTS
            ? generate_checkpoints(db, factory, options, print)
            : generate_files(db, factory, options, print);
        absl::FPrintF(stderr,
                      "%d rows scanned, %d rows could not be decrypted\n",
                      summary.delivered,
                      summary.skipped_corrupted);
    }
}    // namespace

CryptoFactory make_crypto_factory(const CryptoParams& params)
{
    if (params.passwords().empty())
    {
        return no_password_crypto_factory();
    }
    std::vector<std::optional<std::string>> passwords(params.passwords().begin(),
                                                      params.passwords().end());
    if (params.allow_unencrypted())
    {
        passwords.emplace_back(std::nullopt);
    }
    return fallback_password_crypto_factory(std::move(passwords));
}

CryptoFactory make_old_crypto_factory(const ReencryptCmd& cmd)
{
    std::vector<std::optional<std::string>> passwords(cmd.old_passwords().begin(),
                                                      cmd.old_passwords().end());
    if (cmd.old_unencrypted())
    {
        passwords.emplace_back(std::nullopt);
    }
    if (passwords.empty())
    {
        throw std::invalid_argument(
            "Name the current password with --old, or pass --old-unencrypted");
    }
    return fallback_password_crypto_factory(std::move(passwords));
}

std::optional<absl::Time> parse_time_option(std::string_view value)
{
    if (value.empty())
    {
        return std::nullopt;
    }
    absl::Time result;
    std::string error;
    if (!absl::ParseTime(absl::RFC3339_full, value, &result, &error))
    {
        throw std::invalid_argument(
            absl::StrFormat("Invalid time [%s], expected RFC 3339: %s", value, error));
    }
    return result;
}

int real_main(int argc, char** argv)
{
    try
    {
        absl::InitializeLog();
        AllCmds all_cmds;
        VALIDATE_CONSTRAINT(
            google::protobuf::TextFormat::ParseFromString(kDefaultAllCmds, &all_cmds));

        auto main_app = std::make_unique<CLI::App>(
            "notestore keeps directories, files and checkpoints of many users in SQLite");
        attach_parser(main_app->add_subcommand("init", "Create the tables"),
                      all_cmds.mutable_init_cmd())
            ->parse_complete_callback([&]() { init_database(all_cmds.init_cmd()); });
        attach_parser(main_app->add_subcommand("create-user", "Add a user with its root directory"),
                      all_cmds.mutable_create_user_cmd())
            ->parse_complete_callback([&]() { create_user(all_cmds.create_user_cmd()); });
        attach_parser(main_app->add_subcommand("list-users", "Print every user id"),
                      all_cmds.mutable_list_users_cmd())
            ->parse_complete_callback([&]() { list_users(all_cmds.list_users_cmd()); });
        attach_parser(main_app->add_subcommand("purge-user", "Delete a user and all it owns"),
                      all_cmds.mutable_purge_user_cmd())
            ->parse_complete_callback([&]() { purge_user(all_cmds.purge_user_cmd()); });
        attach_parser(main_app->add_subcommand("reencrypt", "Rotate the encryption password"),
                      all_cmds.mutable_reencrypt_cmd())
            ->parse_complete_callback([&]() { reencrypt(all_cmds.reencrypt_cmd()); });
        attach_parser(main_app->add_subcommand("unencrypt", "Store all content as plaintext"),
                      all_cmds.mutable_unencrypt_cmd())
            ->parse_complete_callback([&]() { unencrypt(all_cmds.unencrypt_cmd()); });
        attach_parser(main_app->add_subcommand("scan", "List the decryptable files or checkpoints"),
                      all_cmds.mutable_scan_cmd())
            ->parse_complete_callback([&]() { scan(all_cmds.scan_cmd()); });
        main_app->require_subcommand(1);
        CLI11_PARSE(*main_app, argc, argv);
    }
    catch (const std::exception& e)
    {
        absl::FPrintF(stderr, "Exception encountered (%s): %s\n", typeid(e).name(), e.what());
        return 1;
    }
    return 0;
}
}    // namespace notestore
