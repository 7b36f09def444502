// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "cinedoc/document_store.h"

namespace cinedoc {

/*! \class cinedoc::LocalCollection
    \brief DocumentCollection stored in a local directory.

    Layout under <root_dir>/<name>:
      data/part-00000.jsonl   one file per committed batch, one document per line.
      indexes/<index>.idx     first line {"field":<path>}, then one line per key in key order:
                              {"k":<canonical key>,"ids":[<document ids>],
                               "at":[[<part>,<offset>,<length>],...]}

    Every file is written under a temporary name and renamed into place. Existing indexes are
    rebuilt after each committed batch, so index lookups read only the referenced documents.
*/
class LocalCollection : public DocumentCollection {
 public:
  LocalCollection(const std::string& root_dir, const std::string& name);

  const std::string& name() const override { return name_; }

  util::Status Drop() override;
  util::Status InsertMany(const DocList& docs) override;
  util::Status CreateIndex(const pb::IndexSpec& spec) override;
  util::StatusObject<std::vector<std::string>> ListIndexes() override;
  util::StatusObject<uint64> Count() override;
  util::Status ForEach(const DocCb& cb) override;
  util::StatusObject<DocList> FindByKey(const std::string& field,
                                        const std::string& key_json) override;

  const std::string& dir() const { return dir_; }

 private:
  std::string DataDir() const;
  std::string IndexDir() const;
  std::string IndexPath(const std::string& index_name) const;
  std::string PartPath(unsigned part) const;

  // Position of a document line inside a data part.
  struct DocLocation {
    unsigned part;
    uint64 offset;
    uint32 length;

    bool operator<(const DocLocation& o) const {
      return part < o.part || (part == o.part && offset < o.offset);
    }
  };

  using LocatedDocCb = std::function<void(const DocLocation&, StringPiece)>;

  util::StatusObject<std::vector<std::string>> ListFiles(const std::string& pattern) const;

  // Committed part numbers in commit order.
  util::StatusObject<std::vector<unsigned>> ListParts() const;
  util::Status ForEachLocated(const LocatedDocCb& cb);
  util::Status ReadLocated(const std::vector<DocLocation>& locs, DocList* res);

  util::Status WriteAtomically(const std::string& path, StringPiece contents);

  util::Status BuildIndex(const std::string& field, const std::string& path);
  util::StatusObject<std::string> ReadIndexField(const std::string& path);

  // Fills locs with the documents stored under key. Sets found to false if the index
  // does not cover field.
  util::Status ReadIndexEntries(const std::string& path, const std::string& field,
                                const std::string& key, std::vector<DocLocation>* locs,
                                bool* found);

  std::string name_;
  std::string dir_;
  int64 next_part_ = -1;  // -1 until the data directory is scanned.
};

}  // namespace cinedoc
