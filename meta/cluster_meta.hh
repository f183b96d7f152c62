//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <functional>
#include <memory>
#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <string>

#include "meta/document.hh"
#include "util/seastarx.hh"

namespace nodesync::meta {

// cluster_meta is the shared, lock protected home of the membership document.
//
// load() returns a lock-free snapshot which may be stale by the time it is
// used, any decision leading to a write must be re-validated in with_lock().
class cluster_meta {
 public:
  // the critical section returns true if the (mutated) document should be
  // persisted before the lock is released
  using critical_section = std::function<future<bool>(document&)>;

  virtual ~cluster_meta() = default;

  virtual std::string name() const = 0;

  // when strict is set, a missing document throws not_found_error, otherwise
  // an empty document is returned
  virtual future<document> load(bool strict) = 0;

  // acquire the exclusive lock (blocking, no timeout), load a fresh document,
  // run func against it and persist it if asked to, then release the lock
  virtual future<> with_lock(critical_section func) = 0;
};

enum class location_type : uint8_t {
  file,
  rados,
};

struct location {
  location_type type = location_type::file;
  std::string path;
};

// accepted forms: /abs/path, rel/path, file:/abs/path, file:///abs/path and
// rados://pool[/namespace]/object
location parse_location(std::string_view uri);

std::unique_ptr<cluster_meta> make_cluster_meta(
    std::string_view uri, abort_source* as = nullptr);

}  // namespace nodesync::meta
