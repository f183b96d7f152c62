//
// Created by nodesync on 2026/10/18.
//

#include "memory_cluster_meta.hh"

#include <seastar/core/coroutine.hh>

#include "meta/logger.hh"
#include "util/error.hh"

namespace nodesync::meta {

memory_cluster_meta::memory_cluster_meta(std::string name)
  : _state(make_lw_shared<state>()) {
  _state->name = fmt::format("memory:{}", name);
}

memory_cluster_meta::memory_cluster_meta(lw_shared_ptr<state> s)
  : _state(std::move(s)) {}

std::unique_ptr<memory_cluster_meta> memory_cluster_meta::share() const {
  return std::unique_ptr<memory_cluster_meta>(new memory_cluster_meta(_state));
}

future<document> memory_cluster_meta::load(bool strict) {
  if (!_state->content) {
    if (strict) {
      throw util::not_found_error(_state->name);
    }
    co_return document{};
  }
  co_return document::read_from(*_state->content);
}

future<> memory_cluster_meta::with_lock(critical_section func) {
  auto s = _state;
  co_await s->mtx.lock();
  std::exception_ptr ex;
  try {
    auto doc = s->content ? document::read_from(*s->content) : document{};
    if (co_await func(doc)) {
      doc.validate();
      s->content = doc.write_to();
      s->writes++;
      l.debug("memory_cluster_meta::with_lock: {} persisted", s->name);
    }
  } catch (...) {
    ex = std::current_exception();
  }
  s->mtx.unlock();
  if (ex) {
    std::rethrow_exception(ex);
  }
}

void memory_cluster_meta::reset(std::optional<std::string> content) {
  _state->content = std::move(content);
}

}  // namespace nodesync::meta
