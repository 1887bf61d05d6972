#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace notestore
{
class InternalError : public std::runtime_error
{
    using runtime_error::runtime_error;
};

#define VALIDATE_CONSTRAINT(x)                                                                     \
    do                                                                                             \
    {                                                                                              \
        if (!(x))                                                                                  \
            throw InternalError(#x);                                                               \
    } while (0)

/// @brief Base class of all the domain errors raised by the store.
/// The host maps each subclass to its own response code.
class StoreException : public std::runtime_error
{
private:
    std::string path_;

public:
    explicit StoreException(const std::string& message, std::string_view path);

    // Empty when the error is not tied to a path.
    const std::string& path() const noexcept { return path_; }
};

#define DECLARE_PATH_EXCEPTION(name)                                                               \
    class name : public StoreException                                                             \
    {                                                                                              \
    public:                                                                                        \
        explicit name(std::string_view path);                                                      \
    };

DECLARE_PATH_EXCEPTION(NoSuchFile)
DECLARE_PATH_EXCEPTION(NoSuchDirectory)
DECLARE_PATH_EXCEPTION(FileExists)
DECLARE_PATH_EXCEPTION(DirectoryExists)
DECLARE_PATH_EXCEPTION(DirectoryNotEmpty)
DECLARE_PATH_EXCEPTION(FileTooLarge)
DECLARE_PATH_EXCEPTION(RenameRoot)
DECLARE_PATH_EXCEPTION(PathOutsideRoot)

#undef DECLARE_PATH_EXCEPTION

class NoSuchCheckpoint : public StoreException
{
private:
    int64_t checkpoint_id_;

public:
    explicit NoSuchCheckpoint(std::string_view path, int64_t checkpoint_id);
    int64_t checkpoint_id() const noexcept { return checkpoint_id_; }
};

/// @brief Content cannot be authenticated or decoded under the key material at hand.
class CorruptedFile : public StoreException
{
public:
    explicit CorruptedFile(std::string_view detail);
};
}    // namespace notestore
