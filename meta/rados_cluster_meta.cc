//
// Created by nodesync on 2026/10/18.
//

#include "rados_cluster_meta.hh"

#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <vector>

#include "meta/logger.hh"
#include "util/backoff.hh"
#include "util/blocking.hh"
#include "util/error.hh"

namespace nodesync::meta {

namespace {

constexpr std::string_view SCHEME = "rados://";

void check(int rc, std::string_view uri, std::string_view op) {
  if (rc < 0) {
    throw util::io_error(uri, fmt::format("{}: {}", op, ::strerror(-rc)));
  }
}

std::string make_cookie() {
  static uint64_t next = 0;
  char host[256] = {0};
  if (::gethostname(host, sizeof(host) - 1) != 0) {
    std::strcpy(host, "localhost");
  }
  return fmt::format("{}-{}-{}", host, ::getpid(), next++);
}

}  // namespace

rados_object rados_object::parse(std::string_view uri) {
  if (!uri.starts_with(SCHEME)) {
    throw util::configuration_error(
        "cluster_meta_uri", fmt::format("not a rados URI: {}", uri));
  }
  auto rest = uri.substr(SCHEME.size());
  std::vector<std::string> parts;
  while (!rest.empty()) {
    auto pos = rest.find('/');
    parts.emplace_back(rest.substr(0, pos));
    if (pos == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(pos + 1);
  }
  bool empty_part = std::any_of(
      parts.begin(), parts.end(), [](const auto& p) { return p.empty(); });
  if (parts.size() < 2 || parts.size() > 3 || empty_part) {
    throw util::configuration_error(
        "cluster_meta_uri",
        fmt::format("expected rados://pool[/namespace]/object, got {}", uri));
  }
  if (parts.size() == 2) {
    return rados_object{.pool = parts[0], .key = parts[1]};
  }
  return rados_object{.pool = parts[0], .ns = parts[1], .key = parts[2]};
}

rados_cluster_meta::rados_cluster_meta(std::string uri, abort_source* as)
  : _uri(std::move(uri))
  , _object(rados_object::parse(_uri))
  , _cookie(make_cookie())
  , _as(as) {}

future<document> rados_cluster_meta::load(bool strict) {
  auto content = co_await read();
  if (!content) {
    if (strict) {
      throw util::not_found_error(_uri);
    }
    co_return document{};
  }
  co_return document::read_from(*content);
}

future<> rados_cluster_meta::with_lock(critical_section func) {
  co_await acquire();
  std::exception_ptr ex;
  try {
    auto doc = co_await load(false);
    if (co_await func(doc)) {
      doc.validate();
      co_await write(doc.write_to());
      l.debug("rados_cluster_meta::with_lock: {} persisted", _uri);
    }
  } catch (...) {
    ex = std::current_exception();
  }
  if (!ex) {
    co_await release();
    co_return;
  }
  try {
    co_await release();
  } catch (const std::exception& e) {
    l.warn("rados_cluster_meta::with_lock: unlock {}: {}", _uri, e.what());
  }
  std::rethrow_exception(ex);
}

future<> rados_cluster_meta::connect() {
  if (!_connected) {
    l.info("rados_cluster_meta::connect: {}", _uri);
    auto fut = util::run_blocking([this] {
      try {
        check(_cluster.init(nullptr), _uri, "init");
        check(_cluster.conf_read_file(nullptr), _uri, "conf_read_file");
        check(_cluster.conf_parse_env(nullptr), _uri, "conf_parse_env");
        check(_cluster.connect(), _uri, "connect");
        check(
            _cluster.ioctx_create(_object.pool.c_str(), _ioctx),
            _uri,
            "ioctx_create");
      } catch (...) {
        // a later call starts over with a fresh handle
        _ioctx.close();
        _cluster.shutdown();
        throw;
      }
      _ioctx.set_namespace(_object.ns);
      return true;
    });
    _connected.emplace(std::move(fut).discard_result());
  }
  std::exception_ptr ex;
  try {
    co_await _connected->get_future();
  } catch (...) {
    ex = std::current_exception();
  }
  if (ex) {
    _connected.reset();
    std::rethrow_exception(ex);
  }
}

future<std::optional<std::string>> rados_cluster_meta::read() {
  co_await connect();
  co_return co_await util::run_blocking(
      [this]() -> std::optional<std::string> {
        uint64_t size = 0;
        time_t mtime = 0;
        auto rc = _ioctx.stat(_object.key, &size, &mtime);
        if (rc == -ENOENT) {
          return std::nullopt;
        }
        check(rc, _uri, "stat");
        // the lock alone creates an empty object
        if (size == 0) {
          return std::nullopt;
        }
        librados::bufferlist bl;
        rc = _ioctx.read(_object.key, bl, size, 0);
        if (rc == -ENOENT) {
          return std::nullopt;
        }
        check(rc, _uri, "read");
        return bl.to_str();
      });
}

future<> rados_cluster_meta::write(std::string content) {
  co_await connect();
  co_await util::run_blocking([this, content = std::move(content)] {
    librados::bufferlist bl;
    bl.append(content.data(), content.size());
    check(_ioctx.write_full(_object.key, bl), _uri, "write_full");
    return true;
  });
}

future<> rados_cluster_meta::acquire() {
  co_await connect();
  util::backoff_waiter<steady_clock_type> waiter(
      LOCK_RETRY_BASE, 2.0, LOCK_RETRY_MAX);
  bool contended = false;
  while (true) {
    auto rc = co_await util::run_blocking([this] {
      return _ioctx.lock_exclusive(
          _object.key,
          std::string(LOCK_NAME),
          _cookie,
          "nodesync cluster meta",
          nullptr,
          0);
    });
    if (rc == 0) {
      co_return;
    }
    // EEXIST: another with_lock of this handle holds the lock
    if (rc != -EBUSY && rc != -EEXIST) {
      check(rc, _uri, "lock_exclusive");
    }
    if (!contended) {
      l.debug("rados_cluster_meta::acquire: {} is busy, waiting", _uri);
      contended = true;
    }
    if (_as) {
      co_await sleep_abortable(waiter.next(), *_as);
    } else {
      co_await sleep(waiter.next());
    }
  }
}

future<> rados_cluster_meta::release() {
  auto rc = co_await util::run_blocking([this] {
    return _ioctx.unlock(_object.key, std::string(LOCK_NAME), _cookie);
  });
  check(rc, _uri, "unlock");
}

}  // namespace nodesync::meta
