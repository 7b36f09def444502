// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <functional>
#include <string>
#include <vector>

#include "base/integral_types.h"
#include "cinedoc/cinedoc.pb.h"
#include "strings/stringpiece.h"
#include "util/status.h"

namespace cinedoc {

/*! \class cinedoc::DocumentCollection
    \brief Destination collection of JSON documents keyed by their "id" field.

    Documents are committed in batches. A batch is either fully visible or not visible at all.
    Secondary indexes are keyed by the canonical JSON encoding of the indexed value (see
    CanonicalKey) and an array value contributes one key per element.
*/
class DocumentCollection {
 public:
  using DocList = std::vector<std::string>;
  using DocCb = std::function<void(StringPiece)>;

  virtual ~DocumentCollection() {}

  virtual const std::string& name() const = 0;

  // Removes all documents and indexes. Dropping a collection that does not exist is ok.
  virtual util::Status Drop() = 0;

  virtual util::Status InsertMany(const DocList& docs) = 0;

  // No-op if an index with the same name already exists.
  virtual util::Status CreateIndex(const pb::IndexSpec& spec) = 0;

  virtual util::StatusObject<std::vector<std::string>> ListIndexes() = 0;

  virtual util::StatusObject<uint64> Count() = 0;

  // Calls cb for each document in commit order.
  virtual util::Status ForEach(const DocCb& cb) = 0;

  // Returns the documents whose field equals the key or, for array fields, contains it.
  // key_json is a JSON value, i.e. "\"Drama\"" or "2000".
  virtual util::StatusObject<DocList> FindByKey(const std::string& field,
                                                const std::string& key_json) = 0;

  // Same as FindByKey for a string value.
  util::StatusObject<DocList> Find(const std::string& field, StringPiece value);
};

// "<field>_1" unless spec names the index.
std::string IndexName(const pb::IndexSpec& spec);

// Re-encodes a JSON value so that equal values have equal keys: numbers are written as doubles.
// INVALID_ARGUMENT if key_json is not valid JSON.
util::StatusObject<std::string> CanonicalKey(StringPiece key_json);

// Appends to keys the canonical keys of the value at the dotted path inside doc_json.
// A missing value yields "null", an empty array yields no keys.
util::Status ExtractIndexKeys(StringPiece doc_json, StringPiece field,
                              std::vector<std::string>* keys);

// Returns the "id" of the document or INVALID_ARGUMENT.
util::StatusObject<std::string> ExtractDocumentId(StringPiece doc_json);

}  // namespace cinedoc
