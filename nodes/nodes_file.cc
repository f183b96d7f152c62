//
// Created by nodesync on 2026/10/18.
//

#include "nodes_file.hh"

#include <algorithm>
#include <seastar/core/coroutine.hh>

#include "nodes/logger.hh"
#include "util/error.hh"
#include "util/file.hh"

namespace {

std::string_view trim(std::string_view s) {
  constexpr std::string_view spaces = " \t\r\n";
  auto begin = s.find_first_not_of(spaces);
  if (begin == std::string_view::npos) {
    return {};
  }
  auto end = s.find_last_not_of(spaces);
  return s.substr(begin, end - begin + 1);
}

}  // namespace

namespace nodesync::nodes {

nodes_file::nodes_file(std::string real_path, std::string canonical_path)
  : _real_path(std::move(real_path)), _canon_path(std::move(canonical_path)) {}

future<std::vector<std::string>> nodes_file::read() const {
  auto content = co_await util::read_file_if_exists(_real_path);
  if (!content) {
    co_return std::vector<std::string>{};
  }
  co_return parse(*content);
}

future<> nodes_file::write(std::span<const std::string> nodes) const {
  co_await util::replace_file(_real_path, format(nodes));
  l.debug("nodes_file::write: {} with {} nodes", _real_path, nodes.size());
}

void nodes_file::ensure_link() const {
  if (_canon_path.empty() || _canon_path == _real_path) {
    return;
  }
  util::relink(_real_path, _canon_path);
}

future<> nodes_file::ensure_present(
    std::string_view address, std::optional<uint64_t> expected_pnn) const {
  auto nodes = co_await read();
  auto it = std::find(nodes.begin(), nodes.end(), address);
  if (it == nodes.end()) {
    it = nodes.emplace(nodes.end(), address);
  }
  uint64_t found = std::distance(nodes.begin(), it);
  if (expected_pnn && *expected_pnn != found) {
    throw util::inconsistency_error(fmt::format(
        "expected pnn {} for {} is not {}", *expected_pnn, address, found));
  }
  ensure_link();
  co_await write(nodes);
}

std::vector<std::string> nodes_file::parse(std::string_view content) {
  std::vector<std::string> nodes;
  // a blank line still occupies its position, only the empty tail after the
  // final newline is dropped
  while (!content.empty()) {
    auto pos = content.find('\n');
    nodes.emplace_back(trim(content.substr(0, pos)));
    if (pos == std::string_view::npos) {
      break;
    }
    content.remove_prefix(pos + 1);
  }
  return nodes;
}

std::string nodes_file::format(std::span<const std::string> nodes) {
  std::string out;
  for (const auto& node : nodes) {
    out.append(node).append("\n");
  }
  return out;
}

}  // namespace nodesync::nodes
