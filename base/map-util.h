// Copyright 2005 Google Inc.
//
// Utility functions for use with map-like containers, such as std::map and
// absl::flat_hash_map.
//
// Find*() functions use the map's .find() member function to locate and return
// the map's value type. Insert*() functions never overwrite an existing entry
// unless the name says so.
//

#ifndef UTIL_GTL_MAP_UTIL_H_
#define UTIL_GTL_MAP_UTIL_H_

#include <stddef.h>
#include <utility>

#include "base/logging.h"

// Returns a const reference to the value associated with the given key if it
// exists, otherwise a const reference to the provided default value is
// returned.
//
// WARNING: If a temporary object is passed as the default "value," this
// function will return a reference to that temporary object, which will be
// destroyed by the end of the statement.
template <class Collection, class Key>
const typename Collection::value_type::second_type&
FindWithDefault(const Collection& collection,
                const Key& key,
                const typename Collection::value_type::second_type& value) {
  typename Collection::const_iterator it = collection.find(key);
  if (it == collection.end()) {
    return value;
  }
  return it->second;
}

// Returns a pointer to the const value associated with the given key if it
// exists, or NULL otherwise.
template <class Collection, class Key>
const typename Collection::value_type::second_type*
FindOrNull(const Collection& collection, const Key& key) {
  typename Collection::const_iterator it = collection.find(key);
  if (it == collection.end()) {
    return 0;
  }
  return &it->second;
}

// Same as above but returns a pointer to the non-const value.
template <class Collection, class Key>
typename Collection::value_type::second_type*
FindOrNull(Collection& collection,  // NOLINT
           const Key& key) {
  typename Collection::iterator it = collection.find(key);
  if (it == collection.end()) {
    return 0;
  }
  return &it->second;
}

// Inserts the given key and value into the given collection if and only if the
// given key did NOT already exist in the collection. If the key previously
// existed in the collection, the value is not changed. Returns true if the
// key-value pair was inserted; returns false if the key was already present.
template <class Collection>
bool InsertIfNotPresent(Collection* const collection,
                        const typename Collection::value_type::first_type& key,
                        const typename Collection::value_type::second_type& value) {
  return collection->insert(typename Collection::value_type(key, value)).second;
}

#endif  // UTIL_GTL_MAP_UTIL_H_
