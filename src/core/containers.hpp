#pragma once

#include <ankerl/unordered_dense.h>

namespace httpgate::core {

// Hash container aliases backed by ankerl::unordered_dense.
// Dense storage keeps iteration cheap; iterators are invalidated on insertion
// (same rules as std::vector), so never hold one across a mutation.
//
// Usage:
//   httpgate::core::fast_map<std::string, DevboxInfo> entries;
//   httpgate::core::fast_set<int> active_fds;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace httpgate::core
