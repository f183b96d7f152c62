//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <algorithm>
#include <chrono>

namespace nodesync::util {

// backoff_waiter yields base, base * factor, base * factor^2, ... capped at
// max_interval (when non-zero)
template <typename Clock = std::chrono::steady_clock>
class backoff_waiter {
 public:
  using duration = typename Clock::duration;

  explicit backoff_waiter(
      duration base_interval,
      double factor = 1.0,
      duration max_interval = duration::zero())
    : _base(base_interval)
    , _next(base_interval)
    , _max(max_interval)
    , _factor(factor < 1.0 ? 1.0 : factor) {}

  duration next() {
    auto ret = _next;
    _next = std::chrono::duration_cast<duration>(_next * _factor);
    if (_max != duration::zero()) {
      _next = std::min(_next, _max);
      ret = std::min(ret, _max);
    }
    return ret;
  }

  duration next_duration() const noexcept { return _next; }

  void reset() { _next = _base; }

 private:
  duration _base;
  duration _next;
  duration _max;
  double _factor = 1.0;
};

}  // namespace nodesync::util
