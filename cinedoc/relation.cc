// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/relation.h"

#include <cmath>

#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "base/logging.h"
#include "file/file.h"
#include "file/file_util.h"
#include "file/filesource.h"

namespace cinedoc {

using namespace std;
using util::Status;
using util::StatusCode;
using util::StatusObject;

const char kMoviesRelation[] = "movies";
const char kRatingsRelation[] = "ratings";
const char kGenresRelation[] = "genres";
const char kPersonsRelation[] = "persons";
const char kDirectorsRelation[] = "directors";
const char kWritersRelation[] = "writers";
const char kPrincipalsRelation[] = "principals";
const char kCharactersRelation[] = "characters";

namespace {

constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

class CsvRelationReader : public RelationReader {
 public:
  CsvRelationReader(string name, vector<string> columns, string null_token,
                    std::unique_ptr<file::CsvReader> csv)
      : RelationReader(std::move(name), std::move(columns), std::move(null_token)),
        csv_(std::move(csv)) {}

  bool Next(Row* row) final { return csv_->Next(row); }

  const Status& status() const final { return csv_->status(); }

 private:
  std::unique_ptr<file::CsvReader> csv_;
};

}  // namespace

int RelationReader::ColumnIndex(StringPiece column) const {
  for (size_t i = 0; i < columns_.size(); ++i) {
    if (columns_[i] == column)
      return i;
  }
  return -1;
}

DirRelationSource::DirRelationSource(const string& dir, const Options& opts)
    : dir_(dir), opts_(opts) {}

string DirRelationSource::FindRelationFile(const string& relation) const {
  for (const char* ext : {".csv", ".tsv", ".csv.gz", ".tsv.gz"}) {
    string path = file_util::JoinPath(dir_, absl::StrCat(relation, ext));
    if (file::Exists(path))
      return path;
  }
  return string();
}

StatusObject<RelationReader*> DirRelationSource::Open(const string& relation) {
  string path = FindRelationFile(relation);
  if (path.empty()) {
    return Status(StatusCode::NOT_FOUND,
                  absl::StrCat("relation ", relation, " not found in ", dir_));
  }

  auto res = file::ReadonlyFile::Open(path);
  if (!res.ok())
    return res.status;

  char delimiter = absl::StrContains(file_util::GetNameFromPath(path), ".tsv") ? '\t' : ',';
  std::unique_ptr<file::CsvReader> csv(
      new file::CsvReader(file::Source::Uncompressed(res.obj), delimiter));

  Row header;
  if (!csv->Next(&header)) {
    if (!csv->status().ok())
      return csv->status();
    return Status(StatusCode::INVALID_ARGUMENT, absl::StrCat(path, " has no header line"));
  }

  vector<string> columns;
  for (StringPiece col : header) {
    if (columns.empty() && absl::StartsWith(col, kUtf8Bom))
      col.remove_prefix(sizeof(kUtf8Bom) - 1);
    columns.emplace_back(absl::AsciiStrToLower(col));
  }
  VLOG(1) << "Opened " << path << " with columns [" << absl::StrJoin(columns, ",") << "]";

  return static_cast<RelationReader*>(
      new CsvRelationReader(relation, std::move(columns), opts_.null_token, std::move(csv)));
}

Status FieldReader::Bind(const RelationReader& rd, const vector<StringPiece>& columns) {
  rd_ = &rd;
  pos_.clear();
  for (StringPiece col : columns) {
    int index = rd.ColumnIndex(col);
    if (index < 0) {
      return Status(StatusCode::INVALID_ARGUMENT,
                    absl::StrCat("relation ", rd.name(), " has no column ", col));
    }
    pos_.push_back(index);
  }
  return Status::OK;
}

StringPiece FieldReader::Str(unsigned i) const {
  DCHECK_LT(i, pos_.size());
  unsigned pos = pos_[i];
  if (pos >= row_->size())
    return StringPiece();
  StringPiece val = (*row_)[pos];
  return rd_->IsNull(val) ? StringPiece() : val;
}

absl::optional<int64> FieldReader::Int(unsigned i) const {
  int64 val;
  StringPiece str = Str(i);
  if (str.empty() || !absl::SimpleAtoi(str, &val))
    return absl::nullopt;
  return val;
}

absl::optional<double> FieldReader::Double(unsigned i) const {
  double val;
  StringPiece str = Str(i);
  if (str.empty() || !absl::SimpleAtod(str, &val) || !std::isfinite(val))
    return absl::nullopt;
  return val;
}

namespace detail {

void LogMalformedRow(const RelationReader& rd, const Row& row) {
  LOG_FIRST_N(WARNING, 10) << "Skipping malformed row in " << rd.name() << ": ["
                           << absl::StrJoin(row, ",") << "]";
}

}  // namespace detail
}  // namespace cinedoc
