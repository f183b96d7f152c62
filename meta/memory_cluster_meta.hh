//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <optional>
#include <seastar/core/shared_mutex.hh>
#include <seastar/core/shared_ptr.hh>

#include "meta/cluster_meta.hh"

namespace nodesync::meta {

// an in-process document, handles created by share() see the same document
// and contend for the same lock, which makes it a stand-in for several node
// processes sharing one file
class memory_cluster_meta final : public cluster_meta {
 public:
  explicit memory_cluster_meta(std::string name);
  ~memory_cluster_meta() override = default;

  std::string name() const override { return _state->name; }

  future<document> load(bool strict) override;
  future<> with_lock(critical_section func) override;

  std::unique_ptr<memory_cluster_meta> share() const;

  // replace the stored content bypassing the lock, nullopt removes it
  void reset(std::optional<std::string> content);
  const std::optional<std::string>& content() const { return _state->content; }
  uint64_t writes() const noexcept { return _state->writes; }

 private:
  struct state {
    std::string name;
    // encoded document, nullopt if it does not exist yet
    std::optional<std::string> content;
    uint64_t writes = 0;
    shared_mutex mtx;
  };

  explicit memory_cluster_meta(lw_shared_ptr<state> s);

  lw_shared_ptr<state> _state;
};

}  // namespace nodesync::meta
