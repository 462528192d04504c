// Copyright (c) Meta Platforms, Inc. and affiliates.
/*
 * Type aliases for the hash containers used by the object model and the
 * runtime.
 *
 * The base types do not provide pointer stability: pointers to container
 * content are invalidated on mutation.  Store owning pointers as values when
 * something outside the container needs to hold on to an element.
 */

#pragma once

#include "parallel_hashmap/phmap.h"

namespace attrcache {

#define SET_TEMPLATE_PARAMS <Key, Hash, KeyEqual, Allocator>
#define MAP_TEMPLATE_PARAMS <Key, T, Hash, KeyEqual, Allocator>

#define SET_TEMPLATE_ARGS                                 \
  template <                                              \
      class Key,                                          \
      class Hash = phmap::priv::hash_default_hash<Key>,   \
      class KeyEqual = phmap::priv::hash_default_eq<Key>, \
      class Allocator = phmap::priv::Allocator<Key>>

#define MAP_TEMPLATE_ARGS                  \
  template <                               \
      class Key,                           \
      class T,                             \
      class Hash = std::hash<Key>,         \
      class KeyEqual = std::equal_to<Key>, \
      class Allocator = std::allocator<std::pair<const Key, T>>>

SET_TEMPLATE_ARGS using UnorderedSet = phmap::flat_hash_set SET_TEMPLATE_PARAMS;
MAP_TEMPLATE_ARGS using UnorderedMap = phmap::flat_hash_map MAP_TEMPLATE_PARAMS;

#undef SET_TEMPLATE_PARAMS
#undef MAP_TEMPLATE_PARAMS

#undef SET_TEMPLATE_ARGS
#undef MAP_TEMPLATE_ARGS

} // namespace attrcache
