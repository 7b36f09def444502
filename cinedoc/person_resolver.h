// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>

#include "cinedoc/lookup_index.h"

namespace cinedoc {

// Display name for person ids that do not resolve.
extern const char kUnknownPerson[];

/*! \class cinedoc::PersonResolver
    \brief Maps person ids to names. Built once from the persons relation and shared read-only.

    Find() reports unresolved ids explicitly. DisplayName() applies the kUnknownPerson fallback
    and never fails. Every document name goes through DisplayName().
*/
class PersonResolver {
 public:
  PersonResolver() = default;
  PersonResolver(PersonResolver&&) = default;
  PersonResolver& operator=(PersonResolver&&) = default;

  static util::StatusObject<PersonResolver> Build(RelationSource* src);

  void Add(std::string person_id, std::string name) {
    names_.Put(std::move(person_id), std::move(name));
  }

  // Returns nullptr if the id is not in persons.
  const std::string* Find(StringPiece person_id) const { return names_.Find(person_id); }

  // Returns kUnknownPerson for ids that are not in persons. If resolved is not null, it is set
  // to whether the id was found.
  StringPiece DisplayName(StringPiece person_id, bool* resolved = nullptr) const;

  size_t size() const { return names_.size(); }
  const DrainStats& drain_stats() const { return names_.drain_stats(); }

 private:
  explicit PersonResolver(UniqueIndex<std::string> names) : names_(std::move(names)) {}

  UniqueIndex<std::string> names_;
};

}  // namespace cinedoc
