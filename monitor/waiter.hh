//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <seastar/core/abort_source.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/fsnotify.hh>
#include <seastar/core/future.hh>
#include <seastar/core/timer.hh>
#include <string>

#include "util/backoff.hh"
#include "util/seastarx.hh"
#include "util/types.hh"

namespace nodesync::monitor {

// waiter paces the supervisor, wait() blocks until it is time for the next
// pass. An abort request interrupts a pending wait with an exception.
class waiter {
 public:
  virtual ~waiter() = default;
  virtual future<> wait() = 0;
  // called after a successful pass
  virtual void reset() {}
  virtual future<> close() { return make_ready_future<>(); }
};

class sleeper final : public waiter {
 public:
  using duration = std::chrono::milliseconds;

  sleeper(duration base, duration max, double factor, abort_source& as);
  ~sleeper() override = default;

  future<> wait() override;
  void reset() override { _backoff.reset(); }

 private:
  util::backoff_waiter<steady_clock_type> _backoff;
  abort_source& _as;
};

// file_watcher returns from wait() once the watched file is written or moved
// into place, or once the timeout expires, whichever comes first
class file_watcher final : public waiter {
 public:
  using duration = std::chrono::milliseconds;

  DISALLOW_COPY_MOVE_AND_ASSIGN(file_watcher);
  ~file_watcher() override = default;

  static future<std::unique_ptr<file_watcher>> create(
      std::string path, duration timeout, abort_source& as);

  future<> wait() override;
  future<> close() override;

 private:
  file_watcher(std::string path, duration timeout, abort_source& as);
  future<> run();

  std::string _dir;
  std::string _name;
  duration _timeout;
  abort_source& _as;
  experimental::fsnotifier _notifier;
  std::optional<experimental::fsnotifier::watch> _watch;
  std::optional<future<>> _service;
  condition_variable _cond;
  bool _changed = false;
};

}  // namespace nodesync::monitor
