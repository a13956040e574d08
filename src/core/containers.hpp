#pragma once

#include <ankerl/unordered_dense.h>

namespace warden::core {

// Hash containers backed by ankerl::unordered_dense.
// Dense storage keeps the per-tenant and per-user index tables compact;
// iterators are invalidated on insertion, like std::vector.
//
// Keys need an ankerl::unordered_dense::hash specialization (see uuid.hpp).

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace warden::core
