#include "core/api_path.hpp"
#include "core/exceptions.hpp"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_split.h>

#include <stdexcept>

namespace notestore
{
namespace
{
    std::string_view strip_slashes(std::string_view path)
    {
        while (!path.empty() && path.front() == '/')
            path.remove_prefix(1);
        while (!path.empty() && path.back() == '/')
            path.remove_suffix(1);
        return path;
    }
}    // namespace

std::string from_api_dirname(std::string_view api_dirname)
{
    auto stripped = strip_slashes(api_dirname);
    if (stripped.empty())
    {
        return "/";
    }
    return absl::StrCat("/", stripped, "/");
}

std::string from_api_filename(std::string_view api_path)
{
    if (api_path.empty() || api_path.back() == '/')
    {
        throw std::invalid_argument(absl::StrCat("Invalid file path: [", api_path, "]"));
    }
    if (api_path.front() == '/')
    {
        return std::string(api_path);
    }
    return absl::StrCat("/", api_path);
}

std::string to_api_path(std::string_view db_path) { return std::string(strip_slashes(db_path)); }

std::pair<std::string, std::string> split_api_filepath(std::string_view api_path)
{
    auto stripped = strip_slashes(api_path);
    auto pos = stripped.rfind('/');
    if (pos == std::string_view::npos)
    {
        return {"/", std::string(stripped)};
    }
    return {from_api_dirname(stripped.substr(0, pos)), std::string(stripped.substr(pos + 1))};
}

std::string parent_of_db_dirname(std::string_view db_dirname)
{
    VALIDATE_CONSTRAINT(db_dirname.size() > 1 && db_dirname.front() == '/'
                        && db_dirname.back() == '/');
    auto pos = db_dirname.rfind('/', db_dirname.size() - 2);
    return std::string(db_dirname.substr(0, pos + 1));
}

std::string normalize_api_path(std::string_view api_path)
{
    std::vector<std::string_view> parts;
    for (std::string_view segment : absl::StrSplit(api_path, '/', absl::SkipEmpty()))
    {
        if (segment == ".")
        {
            continue;
        }
        if (segment == "..")
        {
            if (parts.empty())
            {
                throw PathOutsideRoot(api_path);
            }
            parts.pop_back();
            continue;
        }
        parts.push_back(segment);
    }
    return absl::StrJoin(parts, "/");
}

std::vector<std::string> prefix_dirs(std::string_view api_path)
{
    std::vector<std::string> result;
    auto stripped = strip_slashes(api_path);
    if (stripped.empty())
    {
        return result;
    }
    result.emplace_back();
    for (size_t i = 0; i < stripped.size(); ++i)
    {
        if (stripped[i] == '/')
        {
            result.emplace_back(stripped.substr(0, i));
        }
    }
    return result;
}
}    // namespace notestore
