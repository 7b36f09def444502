// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/movie_document.h"

#include <cmath>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "absl/strings/str_cat.h"
#include "base/logging.h"

namespace cinedoc {

namespace rj = ::rapidjson;

using std::string;
using util::Status;
using util::StatusCode;

namespace {

using RapidWriter = rj::Writer<rj::StringBuffer>;

constexpr unsigned kExampleGenres = 3;

void WriteString(StringPiece str, RapidWriter* w) {
  w->String(str.data(), str.size());
}

template <typename T, typename Fn> void WriteOptional(const absl::optional<T>& val, Fn&& fn,
                                                      RapidWriter* w) {
  if (val) {
    fn(*val);
  } else {
    w->Null();
  }
}

void WriteHeader(const MovieDocument& doc, RapidWriter* w) {
  w->Key("id");
  WriteString(doc.id, w);
  w->Key("title");
  WriteString(doc.title, w);
  w->Key("year");
  WriteOptional(doc.year, [w](int32 v) { w->Int(v); }, w);
}

void WriteRating(const Rating& rating, RapidWriter* w) {
  w->Key("rating");
  w->StartObject();
  w->Key("average");
  // rapidjson writes nothing for nan and inf.
  WriteOptional(rating.average, [w](double v) {
    if (std::isfinite(v))
      w->Double(v);
    else
      w->Null();
  }, w);
  w->Key("votes");
  w->Int64(rating.votes);
  w->EndObject();
}

void WritePersons(const char* key, const std::vector<PersonRef>& persons, RapidWriter* w) {
  w->Key(key);
  w->StartArray();
  for (const PersonRef& p : persons) {
    w->StartObject();
    w->Key("person_id");
    WriteString(p.person_id, w);
    w->Key("name");
    WriteString(p.name, w);
    w->EndObject();
  }
  w->EndArray();
}

void WriteGenres(const std::vector<string>& genres, size_t limit, RapidWriter* w) {
  w->Key("genres");
  w->StartArray();
  for (size_t i = 0; i < genres.size() && i < limit; ++i) {
    WriteString(genres[i], w);
  }
  w->EndArray();
}

// Parsing helpers. Each returns false on a type mismatch.

bool GetString(const rj::Value& obj, const char* key, string* dest) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsString())
    return false;
  dest->assign(it->value.GetString(), it->value.GetStringLength());
  return true;
}

bool GetOptionalInt(const rj::Value& obj, const char* key, absl::optional<int32>* dest) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || it->value.IsNull()) {
    dest->reset();
    return true;
  }
  if (!it->value.IsInt())
    return false;
  *dest = it->value.GetInt();
  return true;
}

bool GetStrings(const rj::Value& arr, std::vector<string>* dest) {
  if (!arr.IsArray())
    return false;
  for (const auto& v : arr.GetArray()) {
    if (!v.IsString())
      return false;
    dest->emplace_back(v.GetString(), v.GetStringLength());
  }
  return true;
}

bool GetPersons(const rj::Value& obj, const char* key, std::vector<PersonRef>* dest) {
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || !it->value.IsArray())
    return false;
  for (const auto& v : it->value.GetArray()) {
    PersonRef p;
    if (!v.IsObject() || !GetString(v, "person_id", &p.person_id) || !GetString(v, "name", &p.name))
      return false;
    dest->push_back(std::move(p));
  }
  return true;
}

bool GetRating(const rj::Value& obj, Rating* dest) {
  auto it = obj.FindMember("rating");
  if (it == obj.MemberEnd() || !it->value.IsObject())
    return false;
  const rj::Value& rating = it->value;

  auto avg = rating.FindMember("average");
  if (avg != rating.MemberEnd() && !avg->value.IsNull()) {
    if (!avg->value.IsNumber())
      return false;
    dest->average = avg->value.GetDouble();
  }

  auto votes = rating.FindMember("votes");
  if (votes == rating.MemberEnd() || !votes->value.IsInt64())
    return false;
  dest->votes = votes->value.GetInt64();
  return true;
}

bool GetCast(const rj::Value& obj, std::vector<CastEntry>* dest) {
  auto it = obj.FindMember("cast");
  if (it == obj.MemberEnd() || !it->value.IsArray())
    return false;

  for (const auto& v : it->value.GetArray()) {
    CastEntry entry;
    if (!v.IsObject() || !GetString(v, "person_id", &entry.person_id) ||
        !GetString(v, "name", &entry.name))
      return false;
    auto chars = v.FindMember("characters");
    if (chars == v.MemberEnd() || !GetStrings(chars->value, &entry.characters))
      return false;
    dest->push_back(std::move(entry));
  }
  return true;
}

}  // namespace

bool operator==(const PersonRef& a, const PersonRef& b) {
  return a.person_id == b.person_id && a.name == b.name;
}

bool operator==(const CastEntry& a, const CastEntry& b) {
  return a.person_id == b.person_id && a.name == b.name && a.characters == b.characters;
}

bool operator==(const Rating& a, const Rating& b) {
  return a.average == b.average && a.votes == b.votes;
}

bool operator==(const MovieDocument& a, const MovieDocument& b) {
  return a.id == b.id && a.title == b.title && a.year == b.year && a.runtime == b.runtime &&
         a.rating == b.rating && a.genres == b.genres && a.directors == b.directors &&
         a.cast == b.cast && a.writers == b.writers;
}

string ToJson(const MovieDocument& doc) {
  rj::StringBuffer sb;
  RapidWriter w(sb);

  w.StartObject();
  WriteHeader(doc, &w);
  w.Key("runtime");
  WriteOptional(doc.runtime, [&w](int32 v) { w.Int(v); }, &w);
  WriteRating(doc.rating, &w);
  WriteGenres(doc.genres, doc.genres.size(), &w);
  WritePersons("directors", doc.directors, &w);

  w.Key("cast");
  w.StartArray();
  for (const CastEntry& entry : doc.cast) {
    w.StartObject();
    w.Key("person_id");
    WriteString(entry.person_id, &w);
    w.Key("name");
    WriteString(entry.name, &w);
    w.Key("characters");
    w.StartArray();
    for (const string& c : entry.characters) {
      WriteString(c, &w);
    }
    w.EndArray();
    w.EndObject();
  }
  w.EndArray();

  WritePersons("writers", doc.writers, &w);
  w.EndObject();

  return string(sb.GetString(), sb.GetSize());
}

Status ParseMovieDocument(StringPiece json, MovieDocument* res) {
  rj::Document d;
  if (d.Parse(json.data(), json.size()).HasParseError()) {
    return Status(StatusCode::INVALID_ARGUMENT,
                  absl::StrCat("Bad document json: ", rj::GetParseError_En(d.GetParseError()),
                               " at offset ", d.GetErrorOffset()));
  }
  if (!d.IsObject())
    return Status(StatusCode::INVALID_ARGUMENT, "Document is not a json object");

  *res = MovieDocument{};

  auto genres = d.FindMember("genres");
  bool valid = GetString(d, "id", &res->id) && GetString(d, "title", &res->title) &&
               GetOptionalInt(d, "year", &res->year) &&
               GetOptionalInt(d, "runtime", &res->runtime) && GetRating(d, &res->rating) &&
               genres != d.MemberEnd() && GetStrings(genres->value, &res->genres) &&
               GetPersons(d, "directors", &res->directors) && GetCast(d, &res->cast) &&
               GetPersons(d, "writers", &res->writers);
  if (!valid) {
    return Status(StatusCode::INVALID_ARGUMENT,
                  absl::StrCat("Malformed movie document ", json.substr(0, 80)));
  }
  return Status::OK;
}

string ToAbbreviatedJson(const MovieDocument& doc) {
  rj::StringBuffer sb;
  RapidWriter w(sb);

  w.StartObject();
  WriteHeader(doc, &w);
  WriteRating(doc.rating, &w);
  WriteGenres(doc.genres, kExampleGenres, &w);
  w.Key("directors");
  w.Uint64(doc.directors.size());
  w.Key("cast");
  w.Uint64(doc.cast.size());
  w.Key("writers");
  w.Uint64(doc.writers.size());
  w.EndObject();

  return string(sb.GetString(), sb.GetSize());
}

std::ostream& operator<<(std::ostream& os, const MovieDocument& doc) {
  return os << ToJson(doc);
}

}  // namespace cinedoc
