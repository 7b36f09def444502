// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <string>
#include <vector>

#include "cinedoc/document_store.h"
#include "cinedoc/movie_document.h"

namespace cinedoc {

/*! \class cinedoc::BulkLoader
    \brief Replaces the contents of a collection with a stream of documents.

    Start() drops the collection. Documents passed to Add() are buffered and committed in
    batches of batch_size. A failed batch fails the load; batches committed before it stay.
    The replacement is not atomic: readers may observe an empty or partially loaded collection.
*/
class BulkLoader {
 public:
  struct Options {
    unsigned batch_size = 1000;

    // Log progress every that many batches. 0 disables progress lines.
    unsigned progress_every = 5;
  };

  BulkLoader(DocumentCollection* coll, const Options& opts);

  util::Status Start();

  util::Status Add(const MovieDocument& doc);

  // Commits the last partial batch.
  util::Status Finish();

  uint64 documents_written() const { return documents_written_; }
  uint64 batches_written() const { return batches_written_; }

 private:
  util::Status Flush();

  DocumentCollection* coll_;
  Options opts_;
  std::vector<std::string> batch_;
  bool started_ = false;

  uint64 documents_written_ = 0;
  uint64 batches_written_ = 0;
};

}  // namespace cinedoc
