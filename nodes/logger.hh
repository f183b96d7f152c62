//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/util/log.hh>

namespace nodesync::nodes {

inline seastar::logger l{"nodes"};

}  // namespace nodesync::nodes
