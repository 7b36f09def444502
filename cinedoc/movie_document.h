// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "absl/types/optional.h"
#include "base/integral_types.h"
#include "strings/stringpiece.h"
#include "util/status.h"

namespace cinedoc {

struct PersonRef {
  std::string person_id;
  std::string name;
};

struct CastEntry {
  std::string person_id;
  std::string name;
  std::vector<std::string> characters;  // In the order of the characters relation.
};

struct Rating {
  absl::optional<double> average;
  int64 votes = 0;
};

// The composite document built for each movie. Absent associations are empty, never missing.
struct MovieDocument {
  std::string id;
  std::string title;
  absl::optional<int32> year;
  absl::optional<int32> runtime;
  Rating rating;
  std::vector<std::string> genres;
  std::vector<PersonRef> directors;
  std::vector<CastEntry> cast;
  std::vector<PersonRef> writers;
};

bool operator==(const PersonRef& a, const PersonRef& b);
bool operator==(const CastEntry& a, const CastEntry& b);
bool operator==(const Rating& a, const Rating& b);
bool operator==(const MovieDocument& a, const MovieDocument& b);

inline bool operator!=(const MovieDocument& a, const MovieDocument& b) { return !(a == b); }

// Serializes the document into a single line of JSON. Fields are written in the order
// id, title, year, runtime, rating, genres, directors, cast, writers.
std::string ToJson(const MovieDocument& doc);

// INVALID_ARGUMENT if json is not an object of the shape ToJson produces.
util::Status ParseMovieDocument(StringPiece json, MovieDocument* res);

// Short form for logs: first three genres and only the counts of people.
std::string ToAbbreviatedJson(const MovieDocument& doc);

std::ostream& operator<<(std::ostream& os, const MovieDocument& doc);

}  // namespace cinedoc
