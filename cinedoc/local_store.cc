// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/local_store.h"

#include <algorithm>
#include <map>
#include <memory>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "base/logging.h"
#include "file/file.h"
#include "file/file_util.h"
#include "file/filesource.h"

namespace cinedoc {

namespace rj = ::rapidjson;

using file_util::JoinPath;
using std::string;
using util::Status;
using util::StatusCode;

namespace {

constexpr int kDirMode = 0750;
constexpr char kIndexSuffix[] = ".idx";
constexpr char kPartPrefix[] = "part-";
constexpr char kPartSuffix[] = ".jsonl";

// Stops before the next line once *stop is set.
Status ForEachLine(const string& path, std::function<Status(StringPiece)> cb,
                   const bool* stop = nullptr) {
  auto res = file::ReadonlyFile::Open(path);
  if (!res.ok()) {
    Status st = res.status;
    st.AddErrorMsg(StatusCode::IO_ERROR, absl::StrCat("Could not open ", path));
    return st;
  }

  file::LineReader lr(new file::Source(res.obj), file::TAKE_OWNERSHIP);
  StringPiece line;
  string scratch;
  while (!(stop && *stop) && lr.Next(&line, &scratch)) {
    if (line.empty())
      continue;
    RETURN_IF_ERROR(cb(line));
  }
  return lr.status();
}

string ToString(const rj::Value& val) {
  rj::StringBuffer sb;
  rj::Writer<rj::StringBuffer> w(sb);
  val.Accept(w);
  return string(sb.GetString(), sb.GetSize());
}

Status ParseLine(StringPiece line, const string& path, rj::Document* d) {
  if (d->Parse(line.data(), line.size()).HasParseError() || !d->IsObject()) {
    return Status(StatusCode::IO_ERROR, absl::StrCat("Corrupted line in ", path));
  }
  return Status::OK;
}

}  // namespace

LocalCollection::LocalCollection(const string& root_dir, const string& name)
    : name_(name), dir_(JoinPath(root_dir, name)) {}

string LocalCollection::DataDir() const { return JoinPath(dir_, "data"); }

string LocalCollection::IndexDir() const { return JoinPath(dir_, "indexes"); }

string LocalCollection::IndexPath(const string& index_name) const {
  return JoinPath(IndexDir(), absl::StrCat(index_name, kIndexSuffix));
}

string LocalCollection::PartPath(unsigned part) const {
  return JoinPath(DataDir(), absl::StrFormat("%s%05d%s", kPartPrefix, part, kPartSuffix));
}

Status LocalCollection::Drop() {
  RETURN_IF_ERROR(file_util::DeleteRecursively(dir_));
  next_part_ = 0;
  VLOG(1) << "Dropped " << dir_;

  return Status::OK;
}

util::StatusObject<std::vector<string>> LocalCollection::ListFiles(const string& pattern) const {
  std::vector<file_util::StatShort> stats;
  RETURN_IF_ERROR(file_util::StatFilesSafe(pattern, &stats));

  std::vector<string> res;
  for (const auto& s : stats) {
    res.push_back(s.name);
  }
  return res;
}

util::StatusObject<std::vector<unsigned>> LocalCollection::ListParts() const {
  string pattern = JoinPath(DataDir(), absl::StrCat(kPartPrefix, "*", kPartSuffix));
  GET_UNLESS_ERROR(paths, ListFiles(pattern));

  // glob sorts by name, which breaks the commit order once the numbers get wider.
  std::vector<unsigned> parts;
  for (const string& p : paths) {
    StringPiece name = file_util::GetNameFromPath(p);
    name.remove_prefix(sizeof(kPartPrefix) - 1);
    name.remove_suffix(sizeof(kPartSuffix) - 1);
    unsigned part;
    if (!absl::SimpleAtoi(name, &part)) {
      LOG(WARNING) << "Ignoring unexpected data file " << p;
      continue;
    }
    parts.push_back(part);
  }
  std::sort(parts.begin(), parts.end());
  return parts;
}

Status LocalCollection::WriteAtomically(const string& path, StringPiece contents) {
  string dir(file_util::DirName(path));
  if (!file_util::RecursivelyCreateDir(dir, kDirMode)) {
    Status st = file::StatusFileError();
    st.AddErrorMsg(StatusCode::IO_ERROR, absl::StrCat("Could not create ", dir));
    return st;
  }

  string tmp_path = JoinPath(dir, absl::StrCat(".tmp-", file_util::GetNameFromPath(path)));
  Status st = file_util::WriteStringToFile(contents, tmp_path);
  if (!st.ok()) {
    LOG_IF(WARNING, file::Exists(tmp_path) && !file::Delete(tmp_path))
        << "Could not delete " << tmp_path;
    return st;
  }
  return file::Rename(tmp_path, path);
}

Status LocalCollection::InsertMany(const DocList& docs) {
  if (docs.empty())
    return Status::OK;

  if (next_part_ < 0) {
    GET_UNLESS_ERROR(parts, ListParts());
    next_part_ = parts.empty() ? 0 : parts.back() + 1;
  }

  string contents;
  for (const string& doc : docs) {
    absl::StrAppend(&contents, doc, "\n");
  }

  RETURN_IF_ERROR(WriteAtomically(PartPath(next_part_), contents));
  ++next_part_;

  GET_UNLESS_ERROR(indexes, ListFiles(JoinPath(IndexDir(), "*.idx")));
  for (const string& index_path : indexes) {
    GET_UNLESS_ERROR(field, ReadIndexField(index_path));
    RETURN_IF_ERROR(BuildIndex(field, index_path));
  }

  return Status::OK;
}

Status LocalCollection::CreateIndex(const pb::IndexSpec& spec) {
  if (spec.field().empty())
    return Status(StatusCode::INVALID_ARGUMENT, "Index field is empty");

  string index_name = IndexName(spec);
  string path = IndexPath(index_name);
  if (file::Exists(path)) {
    VLOG(1) << "Index " << index_name << " already exists";
    return Status::OK;
  }

  return BuildIndex(spec.field(), path);
}

Status LocalCollection::BuildIndex(const string& field, const string& path) {
  struct Entry {
    std::vector<string> ids;
    std::vector<DocLocation> locs;
  };
  std::map<string, Entry> entries;
  std::vector<string> keys;

  RETURN_IF_ERROR(ForEachLocated([&](const DocLocation& loc, StringPiece doc) {
    // Documents without a valid id are not indexed.
    keys.clear();
    if (!ExtractIndexKeys(doc, field, &keys).ok())
      return;
    auto id = ExtractDocumentId(doc);
    if (!id.ok())
      return;
    for (string& key : keys) {
      Entry& e = entries[std::move(key)];
      if (!e.locs.empty() && e.locs.back().part == loc.part && e.locs.back().offset == loc.offset)
        continue;
      e.ids.push_back(id.obj);
      e.locs.push_back(loc);
    }
  }));

  rj::StringBuffer sb;
  rj::Writer<rj::StringBuffer> w(sb);
  w.StartObject();
  w.Key("field");
  w.String(field.data(), field.size());
  w.EndObject();
  string contents = absl::StrCat(sb.GetString(), "\n");

  for (const auto& k_v : entries) {
    sb.Clear();
    w.Reset(sb);
    w.StartObject();
    w.Key("k");
    w.RawValue(k_v.first.data(), k_v.first.size(), rj::kStringType);
    w.Key("ids");
    w.StartArray();
    for (const string& id : k_v.second.ids) {
      w.String(id.data(), id.size());
    }
    w.EndArray();
    w.Key("at");
    w.StartArray();
    for (const DocLocation& loc : k_v.second.locs) {
      w.StartArray();
      w.Uint(loc.part);
      w.Uint64(loc.offset);
      w.Uint(loc.length);
      w.EndArray();
    }
    w.EndArray();
    w.EndObject();
    absl::StrAppend(&contents, sb.GetString(), "\n");
  }

  VLOG(1) << "Writing index " << path << " with " << entries.size() << " keys";
  return WriteAtomically(path, contents);
}

util::StatusObject<string> LocalCollection::ReadIndexField(const string& path) {
  string field;
  bool have_header = false;

  Status st = ForEachLine(path, [&](StringPiece line) {
    have_header = true;

    rj::Document d;
    RETURN_IF_ERROR(ParseLine(line, path, &d));
    auto it = d.FindMember("field");
    if (it == d.MemberEnd() || !it->value.IsString())
      return Status(StatusCode::IO_ERROR, absl::StrCat("Index header is missing in ", path));
    field.assign(it->value.GetString(), it->value.GetStringLength());
    return Status::OK;
  }, &have_header);
  RETURN_IF_ERROR(st);

  if (!have_header)
    return Status(StatusCode::IO_ERROR, absl::StrCat("Empty index file ", path));
  return field;
}

util::StatusObject<std::vector<string>> LocalCollection::ListIndexes() {
  GET_UNLESS_ERROR(paths, ListFiles(JoinPath(IndexDir(), "*.idx")));

  std::vector<string> res;
  for (const string& p : paths) {
    StringPiece name = file_util::GetNameFromPath(p);
    name.remove_suffix(sizeof(kIndexSuffix) - 1);
    res.emplace_back(name);
  }
  return res;
}

util::StatusObject<uint64> LocalCollection::Count() {
  uint64 count = 0;
  RETURN_IF_ERROR(ForEach([&count](StringPiece) { ++count; }));

  return count;
}

Status LocalCollection::ForEach(const DocCb& cb) {
  GET_UNLESS_ERROR(parts, ListParts());

  for (unsigned part : parts) {
    RETURN_IF_ERROR(ForEachLine(PartPath(part), [&cb](StringPiece line) {
      cb(line);
      return Status::OK;
    }));
  }
  return Status::OK;
}

Status LocalCollection::ForEachLocated(const LocatedDocCb& cb) {
  GET_UNLESS_ERROR(parts, ListParts());

  string contents;
  for (unsigned part : parts) {
    string path = PartPath(part);
    if (!file_util::ReadFileToString(path, &contents))
      return Status(StatusCode::IO_ERROR, absl::StrCat("Could not read ", path));

    DocLocation loc{part, 0, 0};
    while (loc.offset < contents.size()) {
      size_t eol = contents.find('\n', loc.offset);
      if (eol == string::npos)
        eol = contents.size();
      loc.length = eol - loc.offset;
      if (loc.length)
        cb(loc, StringPiece(contents).substr(loc.offset, loc.length));
      loc.offset = eol + 1;
    }
  }
  return Status::OK;
}

Status LocalCollection::ReadLocated(const std::vector<DocLocation>& locs, DocList* res) {
  std::unique_ptr<file::ReadonlyFile> fl;
  unsigned open_part = 0;
  string path;

  for (const DocLocation& loc : locs) {
    if (!fl || open_part != loc.part) {
      if (fl)
        RETURN_IF_ERROR(fl->Close());
      path = PartPath(loc.part);
      auto open_res = file::ReadonlyFile::Open(path);
      if (!open_res.ok())
        return open_res.status;
      fl.reset(open_res.obj);
      open_part = loc.part;
    }

    string doc(loc.length, '\0');
    auto read_res = fl->Read(loc.offset, strings::AsMutableByteRange(doc));
    if (!read_res.ok())
      return read_res.status;
    if (read_res.obj != loc.length) {
      return Status(StatusCode::IO_ERROR,
                    absl::StrCat("Index points past the end of ", path, " at ", loc.offset));
    }
    res->push_back(std::move(doc));
  }
  return fl ? fl->Close() : Status::OK;
}

Status LocalCollection::ReadIndexEntries(const string& path, const string& field,
                                         const string& key, std::vector<DocLocation>* locs,
                                         bool* found) {
  *found = false;
  if (!file::Exists(path))
    return Status::OK;

  GET_UNLESS_ERROR(indexed_field, ReadIndexField(path));
  if (indexed_field != field)
    return Status::OK;

  *found = true;
  bool header = true;
  bool done = false;
  auto corrupted = [&path] {
    return Status(StatusCode::IO_ERROR, absl::StrCat("Corrupted index entry in ", path));
  };

  // Keys are sorted, so the scan ends at the first key that is not less than the one we need.
  return ForEachLine(path, [&](StringPiece line) {
    if (header) {
      header = false;
      return Status::OK;
    }
    rj::Document d;
    RETURN_IF_ERROR(ParseLine(line, path, &d));
    auto k = d.FindMember("k");
    if (k == d.MemberEnd())
      return corrupted();

    string entry_key = ToString(k->value);
    if (entry_key < key)
      return Status::OK;
    done = true;
    if (entry_key != key)
      return Status::OK;

    auto at = d.FindMember("at");
    if (at == d.MemberEnd() || !at->value.IsArray())
      return corrupted();
    for (const auto& loc : at->value.GetArray()) {
      if (!loc.IsArray() || loc.Size() != 3 || !loc[0].IsUint() || !loc[1].IsUint64() ||
          !loc[2].IsUint()) {
        return corrupted();
      }
      locs->push_back(DocLocation{loc[0].GetUint(), loc[1].GetUint64(), loc[2].GetUint()});
    }
    return Status::OK;
  }, &done);
}

util::StatusObject<DocumentCollection::DocList> LocalCollection::FindByKey(
    const string& field, const string& key_json) {
  GET_UNLESS_ERROR(key, CanonicalKey(key_json));

  std::vector<DocLocation> locs;
  bool indexed = false;
  pb::IndexSpec spec;
  spec.set_field(field);
  RETURN_IF_ERROR(ReadIndexEntries(IndexPath(IndexName(spec)), field, key, &locs, &indexed));

  DocList res;
  if (indexed) {
    std::sort(locs.begin(), locs.end());
    RETURN_IF_ERROR(ReadLocated(locs, &res));
  } else {
    std::vector<string> keys;
    RETURN_IF_ERROR(ForEach([&](StringPiece doc) {
      keys.clear();
      if (ExtractIndexKeys(doc, field, &keys).ok() &&
          std::find(keys.begin(), keys.end(), key) != keys.end()) {
        res.emplace_back(doc);
      }
    }));
  }

  VLOG(1) << "Find " << field << "=" << key_json << (indexed ? " using index" : " by scan")
          << " matched " << res.size();
  return res;
}

}  // namespace cinedoc
