//
// Created by nodesync on 2026/10/18.
//

#include "file.hh"

#include <filesystem>
#include <seastar/core/coroutine.hh>
#include <seastar/core/file.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <system_error>

#include "util/error.hh"

namespace nodesync::util {

future<> create_file(
    std::string_view dir, std::string_view name, std::string msg) {
  auto of = open_flags::create | open_flags::wo | open_flags::truncate |
            open_flags::dsync;
  return open_file_dma(std::filesystem::path(dir).append(name).string(), of)
      .then([msg = std::move(msg)](file f) mutable {
        return make_file_output_stream(std::move(f))
            .then([msg = std::move(msg)](output_stream<char>&& out) mutable {
              return do_with(
                  std::move(out),
                  std::move(msg),
                  [](output_stream<char>& out, std::string& msg) {
                    return out.write(msg)
                        .then([&out] { return out.flush(); })
                        .then([&out] { return out.close(); });
                  });
            });
      })
      .then([dir] { return sync_directory(dir); });
}

future<temporary_buffer<char>> read_file(
    std::string_view dir, std::string_view name) {
  return open_file_dma(
             std::filesystem::path(dir).append(name).string(), open_flags::ro)
      .then([](file f) {
        return do_with(std::move(f), [](file& f) {
          return f.size()
              .then([&](size_t size) {
                return do_with(
                    make_file_input_stream(f), [size](input_stream<char>& in) {
                      return in.read_exactly(size).finally(
                          [&in] { return in.close(); });
                    });
              })
              .finally([&f] { return f.close(); });
        });
      });
}

future<bool> exist_file(std::string_view dir, std::string_view name) {
  return file_exists(std::filesystem::path(dir).append(name).string());
}

std::string parent_dir(std::string_view path) {
  auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    return ".";
  }
  return parent.string();
}

std::string base_name(std::string_view path) {
  return std::filesystem::path(path).filename().string();
}

future<> replace_file(std::string_view path, std::string msg) {
  // keep our own copies, the caller's view is not guaranteed to outlive us
  auto dir = parent_dir(path);
  auto name = base_name(path);
  auto tmp = name + ".tmp";
  co_await create_file(dir, tmp, std::move(msg));
  co_await rename_file(
      std::filesystem::path(dir).append(tmp).string(),
      std::filesystem::path(dir).append(name).string());
  co_await sync_directory(dir);
}

future<std::optional<std::string>> read_file_if_exists(std::string_view path) {
  auto dir = parent_dir(path);
  auto name = base_name(path);
  if (!co_await exist_file(dir, name)) {
    co_return std::optional<std::string>{};
  }
  auto buf = co_await read_file(dir, name);
  co_return std::string(buf.get(), buf.size());
}

void relink(std::string_view target, std::string_view link) {
  std::error_code ec;
  std::filesystem::remove(link, ec);
  if (ec) {
    throw io_error(link, ec.message());
  }
  std::filesystem::create_symlink(target, link, ec);
  if (ec) {
    throw io_error(link, ec.message());
  }
}

}  // namespace nodesync::util
