// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "cinedoc/movie_document.h"
#include "cinedoc/person_resolver.h"
#include "cinedoc/records.h"

namespace cinedoc {

/*! \class cinedoc::CastAssembler
    \brief Joins principals with characters into a per-movie cast list.

    The first pass drains principals and creates one entry per distinct (movie, person) pair in
    the order of first appearance. The second pass drains characters and appends each character
    name to the entry of its (movie, person) pair. Character rows without a matching entry are
    dropped and counted.
*/
class CastAssembler {
 public:
  explicit CastAssembler(const PersonResolver* resolver) : resolver_(resolver) {}

  // Runs both passes over src. Fails if either relation can not be read.
  util::Status Build(RelationSource* src);

  // Returns true if a new cast entry was created.
  bool AddPrincipal(const PersonAssoc& assoc);

  // Returns false if there is no cast entry for the pair.
  bool AddCharacter(CharacterAssoc&& assoc);

  // Empty list for movies without principals.
  const std::vector<CastEntry>& Get(StringPiece movie_id) const;

  size_t movie_count() const { return casts_.size(); }
  uint64 entry_count() const { return entry_count_; }
  uint64 orphaned_characters() const { return orphaned_characters_; }
  uint64 unresolved_persons() const { return unresolved_persons_; }
  uint64 malformed_rows() const { return malformed_rows_; }

 private:
  struct MovieCast {
    std::vector<CastEntry> entries;
    absl::flat_hash_map<std::string, unsigned> pos;  // person_id -> index in entries.
  };

  const PersonResolver* resolver_;
  absl::flat_hash_map<std::string, MovieCast> casts_;

  uint64 entry_count_ = 0;
  uint64 orphaned_characters_ = 0;
  uint64 unresolved_persons_ = 0;
  uint64 malformed_rows_ = 0;
};

}  // namespace cinedoc
