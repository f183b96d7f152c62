//
// Created by nodesync on 2026/10/18.
//

#include "waiter.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "monitor/logger.hh"
#include "util/file.hh"

namespace nodesync::monitor {

sleeper::sleeper(duration base, duration max, double factor, abort_source& as)
  : _backoff(base, factor, max), _as(as) {}

future<> sleeper::wait() { return sleep_abortable(_backoff.next(), _as); }

file_watcher::file_watcher(std::string path, duration timeout, abort_source& as)
  : _dir(util::parent_dir(path))
  , _name(util::base_name(path))
  , _timeout(timeout)
  , _as(as) {}

future<std::unique_ptr<file_watcher>> file_watcher::create(
    std::string path, duration timeout, abort_source& as) {
  std::unique_ptr<file_watcher> w{
      new file_watcher(std::move(path), timeout, as)};
  // the file is replaced by rename, so the directory is watched instead
  using flags = experimental::fsnotifier::flags;
  auto mask = flags::close_write | flags::move_to | flags::create_child;
  w->_watch = co_await w->_notifier.create_watch(w->_dir.c_str(), mask);
  w->_service = w->run();
  l.debug(
      "file_watcher::create: watching {} in {}", w->_name, w->_dir);
  co_return std::move(w);
}

future<> file_watcher::run() {
  while (_notifier.active()) {
    auto events = co_await _notifier.wait();
    for (const auto& e : events) {
      if (std::string_view{e.name} == _name) {
        _changed = true;
        _cond.broadcast();
        break;
      }
    }
  }
}

future<> file_watcher::wait() {
  _as.check();
  auto sub = _as.subscribe([this]() noexcept { _cond.broadcast(); });
  try {
    co_await _cond.wait(
        _timeout, [this] { return _changed || _as.abort_requested(); });
  } catch (const condition_variable_timed_out&) {
    l.trace(
        "file_watcher::wait: no change of {} in {}ms",
        _name,
        _timeout.count());
  }
  _as.check();
  _changed = false;
}

future<> file_watcher::close() {
  _watch.reset();
  _notifier.shutdown();
  if (_service) {
    try {
      co_await std::move(*_service);
    } catch (const std::exception& e) {
      l.debug("file_watcher::close: {} stopped with {}", _dir, e.what());
    }
    _service.reset();
  }
}

}  // namespace nodesync::monitor
