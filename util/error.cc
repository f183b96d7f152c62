//
// Created by nodesync on 2026/10/18.
//

#include "error.hh"

#include <iterator>

namespace nodesync::util {

std::string_view status_string(enum code e) {
  static std::string_view s[] = {
      "ok",
      "configuration",
      "serialization",
      "io",
      "not_found",
      "node_not_present",
      "inconsistency",
      "out_of_order",
      "duplicate_pnn",
      "control"};
  static_assert(std::size(s) == static_cast<int>(code::num_of_codes));
  return s[static_cast<uint8_t>(e)];
}

}  // namespace nodesync::util
