//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/posix.hh>

#include "meta/cluster_meta.hh"
#include "util/backoff.hh"

namespace nodesync::meta {

// the document is a JSON file, the exclusive lock is an advisory flock on the
// sidecar file <path>.lock so that the document itself can be replaced by
// rename
class file_cluster_meta final : public cluster_meta {
 public:
  explicit file_cluster_meta(std::string path, abort_source* as = nullptr);
  ~file_cluster_meta() override = default;

  std::string name() const override { return _path; }
  const std::string& path() const noexcept { return _path; }
  const std::string& lock_path() const noexcept { return _lock_path; }

  future<document> load(bool strict) override;
  future<> with_lock(critical_section func) override;

  static constexpr auto LOCK_RETRY_BASE = std::chrono::milliseconds(10);
  static constexpr auto LOCK_RETRY_MAX = std::chrono::milliseconds(500);

 private:
  // the lock is held as long as the returned descriptor is open
  future<file_desc> acquire();

  std::string _path;
  std::string _lock_path;
  abort_source* _as = nullptr;
};

}  // namespace nodesync::meta
