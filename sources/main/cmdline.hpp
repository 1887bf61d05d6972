#pragma once

#include <CLI/App.hpp>
#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>

namespace notestore
{
/// @brief Add one command line option per field of `msg` that carries an `arg_option`.
///
/// Parsed values are written into `msg`. Values already set in `msg` become the defaults shown in
/// the help. Nested messages become option groups.
CLI::App* attach_parser(CLI::App* app, google::protobuf::Message* msg);
}    // namespace notestore
