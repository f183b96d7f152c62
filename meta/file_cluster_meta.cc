//
// Created by nodesync on 2026/10/18.
//

#include "file_cluster_meta.hh"

#include <fcntl.h>
#include <sys/file.h>

#include <cstring>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "meta/logger.hh"
#include "util/error.hh"
#include "util/file.hh"

namespace nodesync::meta {

file_cluster_meta::file_cluster_meta(std::string path, abort_source* as)
  : _path(std::move(path)), _lock_path(_path + ".lock"), _as(as) {}

future<document> file_cluster_meta::load(bool strict) {
  auto content = co_await util::read_file_if_exists(_path);
  if (!content) {
    if (strict) {
      throw util::not_found_error(_path);
    }
    co_return document{};
  }
  co_return document::read_from(*content);
}

future<> file_cluster_meta::with_lock(critical_section func) {
  auto lock = co_await acquire();
  auto doc = co_await load(false);
  if (co_await func(doc)) {
    doc.validate();
    co_await util::replace_file(_path, doc.write_to());
    l.debug("file_cluster_meta::with_lock: {} persisted", _path);
  }
  // lock released by closing the descriptor
}

future<file_desc> file_cluster_meta::acquire() {
  auto fd = file_desc::open(
      _lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  util::backoff_waiter<steady_clock_type> waiter(
      LOCK_RETRY_BASE, 2.0, LOCK_RETRY_MAX);
  bool contended = false;
  while (::flock(fd.get(), LOCK_EX | LOCK_NB) != 0) {
    auto err = errno;
    if (err != EWOULDBLOCK && err != EINTR) {
      throw util::io_error(_lock_path, ::strerror(err));
    }
    if (!contended) {
      l.debug("file_cluster_meta::acquire: {} is busy, waiting", _lock_path);
      contended = true;
    }
    if (_as) {
      co_await sleep_abortable(waiter.next(), *_as);
    } else {
      co_await sleep(waiter.next());
    }
  }
  co_return std::move(fd);
}

}  // namespace nodesync::meta
