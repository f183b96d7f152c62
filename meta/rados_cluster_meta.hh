//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <rados/librados.hpp>

#include <optional>
#include <seastar/core/shared_future.hh>

#include "meta/cluster_meta.hh"

namespace nodesync::meta {

// rados://<pool>/<object> or rados://<pool>/<namespace>/<object>
struct rados_object {
  std::string pool;
  std::string ns;
  std::string key;

  static rados_object parse(std::string_view uri);
};

// the document is a RADOS object, the exclusive lock is a cls_lock exclusive
// lock on the same object. All librados calls block, they run on a helper
// thread. The cluster connection is made on first use.
class rados_cluster_meta final : public cluster_meta {
 public:
  explicit rados_cluster_meta(std::string uri, abort_source* as = nullptr);
  ~rados_cluster_meta() override = default;

  std::string name() const override { return _uri; }
  const rados_object& object() const noexcept { return _object; }
  const std::string& cookie() const noexcept { return _cookie; }

  future<document> load(bool strict) override;
  future<> with_lock(critical_section func) override;

  static constexpr std::string_view LOCK_NAME = "nodesync_cluster_meta";
  static constexpr auto LOCK_RETRY_BASE = std::chrono::milliseconds(50);
  static constexpr auto LOCK_RETRY_MAX = std::chrono::seconds(2);

 private:
  future<> connect();
  future<std::optional<std::string>> read();
  future<> write(std::string content);
  future<> acquire();
  future<> release();

  std::string _uri;
  rados_object _object;
  std::string _cookie;
  abort_source* _as = nullptr;
  std::optional<shared_future<>> _connected;
  librados::Rados _cluster;
  librados::IoCtx _ioctx;
};

}  // namespace nodesync::meta
