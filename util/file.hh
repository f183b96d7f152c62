//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <optional>
#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>
#include <string>

#include "util/seastarx.hh"

namespace nodesync::util {

// dir and name must stay valid until the returned future resolves

future<> create_file(
    std::string_view dir, std::string_view name, std::string msg);

future<temporary_buffer<char>> read_file(
    std::string_view dir, std::string_view name);

future<bool> exist_file(std::string_view dir, std::string_view name);

// write msg to <path>.tmp, then atomically rename it over path, both the
// file and its parent directory are synced before the returned future
// resolves
future<> replace_file(std::string_view path, std::string msg);

// the whole content of path, or nullopt if path does not exist
future<std::optional<std::string>> read_file_if_exists(std::string_view path);

// point link at target, an existing link (or file) is replaced
void relink(std::string_view target, std::string_view link);

// the directory part of path, "." for a bare file name
std::string parent_dir(std::string_view path);

std::string base_name(std::string_view path);

}  // namespace nodesync::util
