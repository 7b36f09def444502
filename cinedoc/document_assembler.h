// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>
#include <vector>

#include "cinedoc/cast_assembler.h"
#include "cinedoc/lookup_index.h"
#include "cinedoc/movie_document.h"
#include "cinedoc/person_resolver.h"
#include "cinedoc/records.h"

namespace cinedoc {

using RatingIndex = UniqueIndex<Rating>;
using GenreIndex = LookupIndex<std::string>;

// movie_id -> person ids, in relation order.
using PersonLinkIndex = LookupIndex<std::string>;

util::StatusObject<RatingIndex> BuildRatingIndex(RelationSource* src);
util::StatusObject<GenreIndex> BuildGenreIndex(RelationSource* src);

// relation is kDirectorsRelation or kWritersRelation.
util::StatusObject<PersonLinkIndex> BuildPersonLinkIndex(RelationSource* src,
                                                         const std::string& relation);

// The read-only indices a document is assembled from. Not owned.
struct MovieIndices {
  const RatingIndex* ratings = nullptr;
  const GenreIndex* genres = nullptr;
  const PersonLinkIndex* directors = nullptr;
  const PersonLinkIndex* writers = nullptr;
  const CastAssembler* cast = nullptr;
};

/*! \class cinedoc::DocumentAssembler
    \brief Builds the composite document of a movie from the per-movie indices.

    Missing associations become defaults: no rating gives {average: null, votes: 0}, the lists
    become empty. Director and writer ids are resolved to names here; ids that do not resolve
    get kUnknownPerson.
*/
class DocumentAssembler {
 public:
  DocumentAssembler(const MovieIndices& indices, const PersonResolver* resolver);

  MovieDocument Assemble(const MovieRecord& movie);

  uint64 unresolved_persons() const { return unresolved_persons_; }

 private:
  std::vector<PersonRef> ResolvePersons(const std::vector<std::string>& person_ids);

  MovieIndices indices_;
  const PersonResolver* resolver_;
  uint64 unresolved_persons_ = 0;
};

}  // namespace cinedoc
