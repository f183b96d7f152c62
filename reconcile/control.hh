//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/core/future.hh>
#include <string>
#include <vector>

#include "util/seastarx.hh"

namespace nodesync::reconcile {

// control operations of the clustering daemon
class control {
 public:
  virtual ~control() = default;
  // make the daemon re-read the nodes list, throws control_error on failure
  virtual future<> reload_nodes() = 0;
};

// runs an external command, e.g. "/usr/bin/ctdb reloadnodes", without a shell.
// argv[0] must be a path to the executable.
class command_control final : public control {
 public:
  explicit command_control(std::vector<std::string> argv);
  ~command_control() override = default;

  const std::vector<std::string>& argv() const noexcept { return _argv; }

  future<> reload_nodes() override;

 private:
  future<> run(std::vector<std::string> argv);

  std::vector<std::string> _argv;
};

}  // namespace nodesync::reconcile
