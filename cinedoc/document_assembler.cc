// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/document_assembler.h"

#include "base/logging.h"

namespace cinedoc {

using std::string;

util::StatusObject<RatingIndex> BuildRatingIndex(RelationSource* src) {
  return RatingIndex::Build<RatingAssoc>(src, kRatingsRelation, [](RatingAssoc&& rec) {
    Rating rating;
    rating.average = rec.average;
    rating.votes = rec.votes;
    return std::make_pair(std::move(rec.movie_id), rating);
  });
}

util::StatusObject<GenreIndex> BuildGenreIndex(RelationSource* src) {
  return GenreIndex::Build<GenreAssoc>(src, kGenresRelation, [](GenreAssoc&& rec) {
    return std::make_pair(std::move(rec.movie_id), std::move(rec.genre));
  });
}

util::StatusObject<PersonLinkIndex> BuildPersonLinkIndex(RelationSource* src,
                                                         const std::string& relation) {
  return PersonLinkIndex::Build<PersonAssoc>(src, relation, [](PersonAssoc&& rec) {
    return std::make_pair(std::move(rec.movie_id), std::move(rec.person_id));
  });
}

DocumentAssembler::DocumentAssembler(const MovieIndices& indices, const PersonResolver* resolver)
    : indices_(indices), resolver_(resolver) {
  CHECK(indices_.ratings && indices_.genres && indices_.directors && indices_.writers &&
        indices_.cast);
  CHECK(resolver_);
}

MovieDocument DocumentAssembler::Assemble(const MovieRecord& movie) {
  MovieDocument doc;
  doc.id = movie.movie_id;
  doc.title = movie.title;
  doc.year = movie.year;
  doc.runtime = movie.runtime;

  const Rating* rating = indices_.ratings->Find(movie.movie_id);
  if (rating)
    doc.rating = *rating;

  doc.genres = indices_.genres->Get(movie.movie_id);
  doc.directors = ResolvePersons(indices_.directors->Get(movie.movie_id));
  doc.cast = indices_.cast->Get(movie.movie_id);
  doc.writers = ResolvePersons(indices_.writers->Get(movie.movie_id));

  return doc;
}

std::vector<PersonRef> DocumentAssembler::ResolvePersons(const std::vector<string>& person_ids) {
  std::vector<PersonRef> res;
  res.reserve(person_ids.size());

  bool resolved;
  for (const string& id : person_ids) {
    StringPiece name = resolver_->DisplayName(id, &resolved);
    if (!resolved)
      ++unresolved_persons_;
    res.push_back(PersonRef{id, string(name)});
  }
  return res;
}

}  // namespace cinedoc
