//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <optional>
#include <seastar/core/future.hh>
#include <span>
#include <string>
#include <vector>

#include "util/seastarx.hh"

namespace nodesync::nodes {

// nodes_file is the nodes list consumed by the clustering daemon, one address
// per line, line i is the node with pnn i.
//
// The daemon reads the canonical path which is a symlink to the real path, so
// that the real file can live on persistent storage.
class nodes_file {
 public:
  static constexpr std::string_view DEFAULT_CANONICAL_PATH = "/etc/ctdb/nodes";

  explicit nodes_file(
      std::string real_path,
      std::string canonical_path = std::string(DEFAULT_CANONICAL_PATH));

  const std::string& real_path() const noexcept { return _real_path; }
  const std::string& canonical_path() const noexcept { return _canon_path; }

  // an absent file is an empty list
  future<std::vector<std::string>> read() const;

  // overwrite the real path, the content is durable once the future resolves
  future<> write(std::span<const std::string> nodes) const;

  // (re)point the canonical path at the real path
  void ensure_link() const;

  // append address if it is not listed yet, check that it ends up at
  // expected_pnn, write the list and refresh the link
  future<> ensure_present(
      std::string_view address, std::optional<uint64_t> expected_pnn) const;

  static std::vector<std::string> parse(std::string_view content);
  static std::string format(std::span<const std::string> nodes);

 private:
  std::string _real_path;
  std::string _canon_path;
};

}  // namespace nodesync::nodes
