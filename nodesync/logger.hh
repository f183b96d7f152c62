//
// Created by nodesync on 2026/10/18.
//

#pragma once

#include <seastar/util/log.hh>

namespace nodesync {

inline seastar::logger l{"nodesync"};

}  // namespace nodesync
