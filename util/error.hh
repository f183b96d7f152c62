//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <exception>
#include <string>
#include <string_view>

namespace nodesync::util {

enum class code : uint8_t {
  ok = 0,
  configuration,
  serialization,
  io,
  not_found,
  node_not_present,
  inconsistency,
  out_of_order,
  duplicate_pnn,
  control,
  num_of_codes,
};

std::string_view status_string(enum code e);

class base_error : public std::exception {
 public:
  explicit base_error(enum code e) : _e(e), _msg(status_string(e)) {}
  base_error(enum code e, std::string msg) : _e(e), _msg(std::move(msg)) {}
  template <typename... Args>
  base_error(std::string_view s, enum code e, Args&&... args)
    : _e(e)
    , _msg(fmt::format(
          fmt::runtime(s), status_string(e), std::forward<Args>(args)...)) {}

  code error_code() const noexcept { return _e; }

  const char* what() const noexcept override { return _msg.c_str(); }

 protected:
  enum code _e;
  std::string _msg;
};

class configuration_error : public base_error {
 public:
  using base_error::base_error;
  configuration_error(std::string_view key, std::string_view msg)
    : base_error("{}: key:{}, reason:{}", code::configuration, key, msg) {}
};

class serialization_error : public base_error {
 public:
  using base_error::base_error;
  serialization_error() : base_error(code::serialization) {}
  serialization_error(std::string_view type, std::string_view msg)
    : base_error("{}: type:{}, reason:{}", code::serialization, type, msg) {}
};

class io_error : public base_error {
 public:
  using base_error::base_error;
  io_error(std::string_view path, std::string_view msg)
    : base_error("{}: path:{}, reason:{}", code::io, path, msg) {}
};

// the backing location of a document does not exist
class not_found_error : public io_error {
 public:
  using io_error::io_error;
  explicit not_found_error(std::string_view location)
    : io_error("{}: {}", code::not_found, location) {}
};

class membership_error : public base_error {
 public:
  using base_error::base_error;
};

// the local node has no entry in the membership document yet
class node_not_present : public membership_error {
 public:
  using membership_error::membership_error;
  node_not_present(std::string_view identity, uint64_t pnn)
    : membership_error(
          "{}: identity:{}, pnn:{}", code::node_not_present, identity, pnn) {}
};

// the nodes list holds something other than what a pnn expects
class inconsistency_error : public membership_error {
 public:
  using membership_error::membership_error;
  explicit inconsistency_error(std::string_view msg)
    : membership_error("{}: {}", code::inconsistency, msg) {}
};

// appending the pnn would leave or create a gap in the nodes list
class out_of_order_error : public inconsistency_error {
 public:
  using inconsistency_error::inconsistency_error;
  out_of_order_error(uint64_t pnn, uint64_t length)
    : inconsistency_error(
          "{}: pnn:{} cannot be appended to nodes of length {}",
          code::out_of_order,
          pnn,
          length) {}
};

class duplicate_pnn_error : public membership_error {
 public:
  using membership_error::membership_error;
  duplicate_pnn_error(uint64_t pnn, std::string_view owner)
    : membership_error(
          "{}: pnn:{} already claimed by {}", code::duplicate_pnn, pnn, owner) {
  }
};

// the clustering daemon rejected a control operation
class control_error : public base_error {
 public:
  using base_error::base_error;
  control_error(std::string_view command, std::string_view msg)
    : base_error("{}: command:{}, reason:{}", code::control, command, msg) {}
};

}  // namespace nodesync::util
