//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/util/log.hh>

namespace nodesync::monitor {

inline seastar::logger l{"monitor"};

}  // namespace nodesync::monitor
