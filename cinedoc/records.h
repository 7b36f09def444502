// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "cinedoc/relation.h"

namespace cinedoc {

struct MovieRecord {
  std::string movie_id;
  std::string title;
  absl::optional<int32> year;
  absl::optional<int32> runtime;
};

struct RatingAssoc {
  std::string movie_id;
  absl::optional<double> average;
  int64 votes = 0;
};

struct GenreAssoc {
  std::string movie_id;
  std::string genre;
};

struct PersonRecord {
  std::string person_id;
  std::string name;
};

// A (movie, person) link: directors, writers and principals.
struct PersonAssoc {
  std::string movie_id;
  std::string person_id;
};

struct CharacterAssoc {
  std::string movie_id;
  std::string person_id;
  std::string name;
};

template <> struct RecordTraits<MovieRecord> {
  static std::vector<StringPiece> Columns() {
    return {"movie_id", "primary_title", "start_year", "runtime_minutes"};
  }
  static bool Parse(const FieldReader& fr, MovieRecord* res);
};

template <> struct RecordTraits<RatingAssoc> {
  static std::vector<StringPiece> Columns() {
    return {"movie_id", "average_rating", "num_votes"};
  }
  static bool Parse(const FieldReader& fr, RatingAssoc* res);
};

template <> struct RecordTraits<GenreAssoc> {
  static std::vector<StringPiece> Columns() { return {"movie_id", "genre"}; }
  static bool Parse(const FieldReader& fr, GenreAssoc* res);
};

template <> struct RecordTraits<PersonRecord> {
  static std::vector<StringPiece> Columns() { return {"person_id", "name"}; }
  static bool Parse(const FieldReader& fr, PersonRecord* res);
};

template <> struct RecordTraits<PersonAssoc> {
  static std::vector<StringPiece> Columns() { return {"movie_id", "person_id"}; }
  static bool Parse(const FieldReader& fr, PersonAssoc* res);
};

template <> struct RecordTraits<CharacterAssoc> {
  static std::vector<StringPiece> Columns() { return {"movie_id", "person_id", "name"}; }
  static bool Parse(const FieldReader& fr, CharacterAssoc* res);
};

}  // namespace cinedoc
