#include "exceptions.hpp"

#include <absl/strings/str_format.h>

namespace notestore
{
StoreException::StoreException(const std::string& message, std::string_view path)
    : runtime_error(message), path_(path)
{
}

#define DEFINE_PATH_EXCEPTION(name, description)                                                   \
    name::name(std::string_view path)                                                              \
        : StoreException(absl::StrFormat("%s: [%s]", description, path), path)                     \
    {                                                                                              \
    }

DEFINE_PATH_EXCEPTION(NoSuchFile, "No such file")
DEFINE_PATH_EXCEPTION(NoSuchDirectory, "No such directory")
DEFINE_PATH_EXCEPTION(FileExists, "File already exists")
DEFINE_PATH_EXCEPTION(DirectoryExists, "Directory already exists")
DEFINE_PATH_EXCEPTION(DirectoryNotEmpty, "Directory not empty")
DEFINE_PATH_EXCEPTION(FileTooLarge, "File is too large to save")
DEFINE_PATH_EXCEPTION(RenameRoot, "Renaming the root directory is not permitted")
DEFINE_PATH_EXCEPTION(PathOutsideRoot, "Path outside root")

#undef DEFINE_PATH_EXCEPTION

NoSuchCheckpoint::NoSuchCheckpoint(std::string_view path, int64_t checkpoint_id)
    : StoreException(absl::StrFormat("No such checkpoint %d for [%s]", checkpoint_id, path), path)
    , checkpoint_id_(checkpoint_id)
{
}

CorruptedFile::CorruptedFile(std::string_view detail)
    : StoreException(absl::StrFormat("Corrupted file: %s", detail), {})
{
}
}    // namespace notestore
