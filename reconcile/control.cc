//
// Created by nodesync on 2026/10/18.
//

#include "control.hh"

#include <fmt/ranges.h>
#include <unistd.h>

#include <seastar/core/coroutine.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/when_all.hh>
#include <seastar/util/process.hh>
#include <tuple>
#include <variant>

#include "reconcile/logger.hh"
#include "util/error.hh"

extern char** environ;

namespace {

using namespace seastar;

future<std::string> drain(input_stream<char> in) {
  std::string out;
  while (true) {
    auto buf = co_await in.read();
    if (buf.empty()) {
      break;
    }
    out.append(buf.get(), buf.size());
  }
  co_await in.close();
  co_return out;
}

}  // namespace

namespace nodesync::reconcile {

command_control::command_control(std::vector<std::string> argv)
  : _argv(std::move(argv)) {}

future<> command_control::reload_nodes() { return run(_argv); }

future<> command_control::run(std::vector<std::string> argv) {
  if (argv.empty()) {
    throw util::configuration_error("reload_command", "empty");
  }
  auto command = fmt::format("{}", fmt::join(argv, " "));
  l.info("running: {}", command);
  experimental::spawn_parameters params;
  for (const auto& arg : argv) {
    params.argv.emplace_back(arg.c_str());
  }
  for (char** env = environ; *env != nullptr; ++env) {
    params.env.emplace_back(*env);
  }
  auto proc =
      co_await experimental::spawn_process(argv.front(), std::move(params))
          .handle_exception_type(
              [&command](const std::system_error& e) -> experimental::process {
                throw util::control_error(command, e.what());
              });
  std::string out_msg;
  std::string err_msg;
  std::exception_ptr ex;
  try {
    auto in = proc.cin();
    co_await in.close();
    // drain both pipes concurrently so that a chatty child never blocks
    std::tie(out_msg, err_msg) =
        co_await when_all_succeed(drain(proc.cout()), drain(proc.cerr()));
  } catch (...) {
    ex = std::current_exception();
  }
  // the child is always reaped, even when its output could not be collected
  auto status = co_await proc.wait();
  if (ex) {
    l.warn("{}: failed to collect output", command);
    std::rethrow_exception(ex);
  }
  if (!out_msg.empty()) {
    l.debug("{}: stdout: {}", command, out_msg);
  }
  if (auto* exited = std::get_if<experimental::process::wait_exited>(&status)) {
    if (exited->exit_code == 0) {
      co_return;
    }
    throw util::control_error(
        command,
        fmt::format("exit code {}, stderr: {}", exited->exit_code, err_msg));
  }
  auto* signaled = std::get_if<experimental::process::wait_signaled>(&status);
  throw util::control_error(
      command,
      fmt::format(
          "killed by signal {}",
          signaled ? signaled->terminating_signal : 0));
}

}  // namespace nodesync::reconcile
