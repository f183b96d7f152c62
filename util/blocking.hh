//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <exception>
#include <optional>
#include <seastar/core/alien.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/future.hh>
#include <seastar/core/smp.hh>
#include <thread>
#include <type_traits>

#include "util/seastarx.hh"

namespace nodesync::util {

// run a blocking call on a dedicated thread and resolve on the calling shard,
// func must return a value
template <typename Func>
future<std::invoke_result_t<Func>> run_blocking(Func func) {
  using result_type = std::invoke_result_t<Func>;
  struct state {
    promise<result_type> pr;
    std::optional<result_type> value;
    std::exception_ptr ex;
  };
  state st;
  auto fut = st.pr.get_future();
  auto shard = this_shard_id();
  std::thread worker([&st, func = std::move(func), shard]() mutable {
    try {
      st.value.emplace(func());
    } catch (...) {
      st.ex = std::current_exception();
    }
    // st is only touched by the shard from here on
    alien::run_on(*alien::internal::default_instance, shard, [&st]() noexcept {
      if (st.ex) {
        st.pr.set_exception(st.ex);
      } else {
        st.pr.set_value(std::move(*st.value));
      }
    });
  });
  std::exception_ptr ex;
  std::optional<result_type> result;
  try {
    result.emplace(co_await std::move(fut));
  } catch (...) {
    ex = std::current_exception();
  }
  worker.join();
  if (ex) {
    std::rethrow_exception(ex);
  }
  co_return std::move(*result);
}

}  // namespace nodesync::util
