// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "base/integral_types.h"
#include "strings/stringpiece.h"
#include "util/status.h"

namespace cinedoc {

// Names of the source relations.
extern const char kMoviesRelation[];
extern const char kRatingsRelation[];
extern const char kGenresRelation[];
extern const char kPersonsRelation[];
extern const char kDirectorsRelation[];
extern const char kWritersRelation[];
extern const char kPrincipalsRelation[];
extern const char kCharactersRelation[];

using Row = std::vector<StringPiece>;

/*! \class cinedoc::RelationReader
    \brief Single-pass reader over the flat records of one named relation.

    Rows are returned as column values in the order given by columns(). The values are valid
    until the next call to Next().
*/
class RelationReader {
 public:
  RelationReader(std::string name, std::vector<std::string> columns, std::string null_token)
      : name_(std::move(name)), columns_(std::move(columns)), null_token_(std::move(null_token)) {}

  virtual ~RelationReader() {}

  // Returns false at the end of the relation or if reading failed. status() tells which.
  virtual bool Next(Row* row) = 0;

  virtual const util::Status& status() const = 0;

  // Position of the column in each row or -1 if the relation does not have it.
  int ColumnIndex(StringPiece column) const;

  bool IsNull(StringPiece value) const { return value.empty() || value == null_token_; }

  const std::string& name() const { return name_; }
  const std::vector<std::string>& columns() const { return columns_; }

 private:
  std::string name_;
  std::vector<std::string> columns_;
  std::string null_token_;
};

class RelationSource {
 public:
  virtual ~RelationSource() {}

  // Opens the named relation. The ownership over the reader is passed to the caller.
  // NOT_FOUND if the relation does not exist.
  virtual util::StatusObject<RelationReader*> Open(const std::string& relation) = 0;
};

/*! \class cinedoc::DirRelationSource
    \brief Reads relations from delimited text files in a directory.

    The relation "movies" is looked up as movies.csv, movies.tsv, movies.csv.gz and movies.tsv.gz
    in that order. The first line of each file names the columns. TSV files are split on tabs,
    CSV files on commas with double-quote escaping. Gzip compressed files are inflated
    transparently.
*/
class DirRelationSource : public RelationSource {
 public:
  struct Options {
    Options() {}
    std::string null_token = "\\N";
  };

  explicit DirRelationSource(const std::string& dir, const Options& opts = Options());

  util::StatusObject<RelationReader*> Open(const std::string& relation) override;

  // Returns the path of the file that backs the relation or empty string if none exists.
  std::string FindRelationFile(const std::string& relation) const;

 private:
  std::string dir_;
  Options opts_;
};

// Resolves typed field access for one row against the columns a record type needs.
class FieldReader {
 public:
  // Returns INVALID_ARGUMENT naming the first column the relation does not have.
  util::Status Bind(const RelationReader& rd, const std::vector<StringPiece>& columns);

  void Reset(const Row* row) { row_ = row; }

  // Returns the value of the i-th bound column or empty piece if it's null.
  StringPiece Str(unsigned i) const;

  // Both return nullopt for null or malformed values.
  absl::optional<int64> Int(unsigned i) const;
  absl::optional<double> Double(unsigned i) const;

 private:
  const RelationReader* rd_ = nullptr;
  const Row* row_ = nullptr;
  std::vector<unsigned> pos_;
};

// Specialized per record type in records.h. Each specialization provides:
//   static std::vector<StringPiece> Columns();
//   static bool Parse(const FieldReader& fr, T* res);  // false for malformed rows.
template <typename T> struct RecordTraits;

struct DrainStats {
  uint64 rows = 0;
  uint64 malformed = 0;
};

// Reads all the records of the relation and passes each parsed record to cb(T&&).
// Fails if the relation can not be opened, lacks a column or reading breaks in the middle.
template <typename T, typename Cb>
util::StatusObject<DrainStats> ForEachRecord(RelationSource* src, const std::string& relation,
                                             Cb&& cb);

// ----------------------------------------------------------------------------
// Implementation
// ----------------------------------------------------------------------------

namespace detail {

void LogMalformedRow(const RelationReader& rd, const Row& row);

}  // namespace detail

template <typename T, typename Cb>
util::StatusObject<DrainStats> ForEachRecord(RelationSource* src, const std::string& relation,
                                             Cb&& cb) {
  auto res = src->Open(relation);
  if (!res.ok())
    return res.status;

  std::unique_ptr<RelationReader> rd(res.obj);
  FieldReader fr;
  RETURN_IF_ERROR(fr.Bind(*rd, RecordTraits<T>::Columns()));

  DrainStats stats;
  Row row;
  while (rd->Next(&row)) {
    ++stats.rows;
    fr.Reset(&row);

    T rec;
    if (!RecordTraits<T>::Parse(fr, &rec)) {
      ++stats.malformed;
      detail::LogMalformedRow(*rd, row);
      continue;
    }
    cb(std::move(rec));
  }

  if (!rd->status().ok()) {
    util::Status st = rd->status();
    st.AddErrorMsg(absl::StrCat("while reading relation ", relation));
    return st;
  }

  return stats;
}

}  // namespace cinedoc
