// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "cinedoc/relation.h"

namespace cinedoc {

/*! \class cinedoc::LookupIndex
    \brief Build-scoped multimap from a movie or person id to the values associated with it.

    The index is populated by fully draining a relation and is read-only afterwards.
    Values under the same key keep the order of the relation.
*/
template <typename V> class LookupIndex {
 public:
  using ValueList = std::vector<V>;

  LookupIndex() = default;
  LookupIndex(LookupIndex&&) = default;
  LookupIndex& operator=(LookupIndex&&) = default;

  // Drains the relation of records T. to_entry(T&&) returns std::pair<std::string, V>.
  template <typename T, typename Fn>
  static util::StatusObject<LookupIndex> Build(RelationSource* src, const std::string& relation,
                                               Fn&& to_entry);

  void Add(std::string key, V val) {
    map_[std::move(key)].push_back(std::move(val));
    ++value_count_;
  }

  // Returns an empty list for unknown keys.
  const ValueList& Get(StringPiece key) const {
    auto it = map_.find(key);
    return it == map_.end() ? EmptyList() : it->second;
  }

  size_t key_count() const { return map_.size(); }
  size_t value_count() const { return value_count_; }
  const DrainStats& drain_stats() const { return drain_stats_; }

 private:
  static const ValueList& EmptyList() {
    static const ValueList* empty = new ValueList;
    return *empty;
  }

  absl::flat_hash_map<std::string, ValueList> map_;
  size_t value_count_ = 0;
  DrainStats drain_stats_;
};

/*! \class cinedoc::UniqueIndex
    \brief Map from a key to at most one value.

    Duplicate keys are not rejected: the last value put under a key wins.
*/
template <typename V> class UniqueIndex {
 public:
  UniqueIndex() = default;
  UniqueIndex(UniqueIndex&&) = default;
  UniqueIndex& operator=(UniqueIndex&&) = default;

  template <typename T, typename Fn>
  static util::StatusObject<UniqueIndex> Build(RelationSource* src, const std::string& relation,
                                               Fn&& to_entry);

  void Put(std::string key, V val) { map_[std::move(key)] = std::move(val); }

  // Returns nullptr for unknown keys.
  const V* Find(StringPiece key) const {
    auto it = map_.find(key);
    return it == map_.end() ? nullptr : &it->second;
  }

  size_t size() const { return map_.size(); }
  const DrainStats& drain_stats() const { return drain_stats_; }

 private:
  absl::flat_hash_map<std::string, V> map_;
  DrainStats drain_stats_;
};

template <typename V>
template <typename T, typename Fn>
util::StatusObject<LookupIndex<V>> LookupIndex<V>::Build(RelationSource* src,
                                                         const std::string& relation,
                                                         Fn&& to_entry) {
  LookupIndex<V> index;
  auto res = ForEachRecord<T>(src, relation, [&](T&& rec) {
    std::pair<std::string, V> entry = to_entry(std::move(rec));
    index.Add(std::move(entry.first), std::move(entry.second));
  });
  if (!res.ok())
    return res.status;

  index.drain_stats_ = res.obj;
  return index;
}

template <typename V>
template <typename T, typename Fn>
util::StatusObject<UniqueIndex<V>> UniqueIndex<V>::Build(RelationSource* src,
                                                         const std::string& relation,
                                                         Fn&& to_entry) {
  UniqueIndex<V> index;
  auto res = ForEachRecord<T>(src, relation, [&](T&& rec) {
    std::pair<std::string, V> entry = to_entry(std::move(rec));
    index.Put(std::move(entry.first), std::move(entry.second));
  });
  if (!res.ok())
    return res.status;

  index.drain_stats_ = res.obj;
  return index;
}

}  // namespace cinedoc
