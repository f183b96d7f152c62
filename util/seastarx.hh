//
// Created by nodesync on 2026/10/18.
//

#pragma once

namespace seastar {

template <typename T>
class shared_ptr;

template <typename T, typename... A>
shared_ptr<T> make_shared(A&&... a);

}  // namespace seastar

namespace nodesync {

using namespace seastar;
using seastar::make_shared;
using seastar::shared_ptr;

}  // namespace nodesync
