// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/records.h"

#include "base/logging.h"

namespace cinedoc {

namespace {

absl::optional<int32> ToInt32(absl::optional<int64> val) {
  if (!val || *val < std::numeric_limits<int32>::min() || *val > kint32max)
    return absl::nullopt;
  return static_cast<int32>(*val);
}

}  // namespace

bool RecordTraits<MovieRecord>::Parse(const FieldReader& fr, MovieRecord* res) {
  StringPiece id = fr.Str(0);
  if (id.empty())
    return false;

  res->movie_id = std::string(id);
  res->title = std::string(fr.Str(1));
  res->year = ToInt32(fr.Int(2));
  res->runtime = ToInt32(fr.Int(3));
  return true;
}

bool RecordTraits<RatingAssoc>::Parse(const FieldReader& fr, RatingAssoc* res) {
  StringPiece id = fr.Str(0);
  if (id.empty())
    return false;

  res->movie_id = std::string(id);
  res->average = fr.Double(1);
  res->votes = fr.Int(2).value_or(0);
  return true;
}

bool RecordTraits<GenreAssoc>::Parse(const FieldReader& fr, GenreAssoc* res) {
  StringPiece id = fr.Str(0), genre = fr.Str(1);
  if (id.empty() || genre.empty())
    return false;

  res->movie_id = std::string(id);
  res->genre = std::string(genre);
  return true;
}

bool RecordTraits<PersonRecord>::Parse(const FieldReader& fr, PersonRecord* res) {
  StringPiece id = fr.Str(0);
  if (id.empty())
    return false;

  res->person_id = std::string(id);
  res->name = std::string(fr.Str(1));
  return true;
}

bool RecordTraits<PersonAssoc>::Parse(const FieldReader& fr, PersonAssoc* res) {
  StringPiece movie_id = fr.Str(0), person_id = fr.Str(1);
  if (movie_id.empty() || person_id.empty())
    return false;

  res->movie_id = std::string(movie_id);
  res->person_id = std::string(person_id);
  return true;
}

bool RecordTraits<CharacterAssoc>::Parse(const FieldReader& fr, CharacterAssoc* res) {
  StringPiece movie_id = fr.Str(0), person_id = fr.Str(1), name = fr.Str(2);
  if (movie_id.empty() || person_id.empty() || name.empty())
    return false;

  res->movie_id = std::string(movie_id);
  res->person_id = std::string(person_id);
  res->name = std::string(name);
  return true;
}

}  // namespace cinedoc
