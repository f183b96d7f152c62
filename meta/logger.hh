//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/util/log.hh>

namespace nodesync::meta {

inline seastar::logger l{"meta"};

}  // namespace nodesync::meta
