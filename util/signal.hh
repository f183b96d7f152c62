//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/abort_source.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/future.hh>

namespace nodesync::util {

// stop_signal turns SIGINT/SIGTERM into an abort request, every abortable
// wait subscribed to as() is interrupted immediately
class stop_signal {
 public:
  stop_signal();
  ~stop_signal();
  seastar::future<int> wait();
  bool stopping() const { return _caught; }
  int signum() const { return _signum; }
  seastar::abort_source& as() { return _as; }

 private:
  void signaled(int signum);

 private:
  int _signum = 0;
  bool _caught = false;
  seastar::condition_variable _cond;
  seastar::abort_source _as;
};

}  // namespace nodesync::util
