#include "core/api_path.hpp"
#include "core/exceptions.hpp"

#include <doctest/doctest.h>

#include <stdexcept>

namespace notestore
{
TEST_CASE("Convert API paths to database paths")
{
    CHECK(from_api_dirname("") == "/");
    CHECK(from_api_dirname("/") == "/");
    CHECK(from_api_dirname("a/b") == "/a/b/");
    CHECK(from_api_dirname("/a/b/") == "/a/b/");

    CHECK(from_api_filename("a/b.txt") == "/a/b.txt");
    CHECK(from_api_filename("/a/b.txt") == "/a/b.txt");
    CHECK_THROWS_AS(from_api_filename(""), std::invalid_argument);
    CHECK_THROWS_AS(from_api_filename("a/"), std::invalid_argument);

    CHECK(to_api_path("/") == "");
    CHECK(to_api_path("/a/b/") == "a/b");
    CHECK(to_api_path("/a/b.txt") == "a/b.txt");
}

TEST_CASE("Split file paths")
{
    auto [dir, name] = split_api_filepath("a/b/c.txt");
    CHECK(dir == "/a/b/");
    CHECK(name == "c.txt");

    std::tie(dir, name) = split_api_filepath("c.txt");
    CHECK(dir == "/");
    CHECK(name == "c.txt");

    CHECK(parent_of_db_dirname("/a/b/") == "/a/");
    CHECK(parent_of_db_dirname("/a/") == "/");
    CHECK_THROWS_AS(parent_of_db_dirname("/"), InternalError);
}

TEST_CASE("Normalize paths")
{
    CHECK(normalize_api_path("") == "");
    CHECK(normalize_api_path("/a//b/") == "a/b");
    CHECK(normalize_api_path("a/./b/../c") == "a/c");
    CHECK(normalize_api_path("a/..") == "");
    CHECK_THROWS_AS(normalize_api_path(".."), PathOutsideRoot);
    CHECK_THROWS_AS(normalize_api_path("a/../../b"), PathOutsideRoot);
}

TEST_CASE("Enumerate parent directories")
{
    CHECK(prefix_dirs("a/b/c") == std::vector<std::string>{"", "a", "a/b"});
    CHECK(prefix_dirs("/c.txt") == std::vector<std::string>{""});
    CHECK(prefix_dirs("").empty());
}
}    // namespace notestore
