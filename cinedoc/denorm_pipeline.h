// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <atomic>
#include <functional>
#include <vector>

#include "cinedoc/bulk_loader.h"
#include "cinedoc/cinedoc.pb.h"
#include "cinedoc/document_store.h"
#include "cinedoc/relation.h"

namespace cinedoc {

/*! \class cinedoc::DenormPipeline
    \brief Rebuilds a collection of composite movie documents from the normalized relations.

    The run consists of sequential phases: person names, ratings, genres, directors, writers,
    cast, movies, load and indexes. All relations are read before the destination is touched,
    so a source failure leaves the destination as it was. Errors are prefixed with the name of
    the failing phase.
*/
class DenormPipeline {
 public:
  struct Options {
    Options() {}
    BulkLoader::Options loader;

    bool create_indexes = true;
    std::vector<pb::IndexSpec> indexes;  // DefaultMovieIndexes() if empty.

    // The summary example is the first document with more votes than this.
    int64 example_min_votes = 1000000;
  };

  DenormPipeline(RelationSource* src, DocumentCollection* dest, const Options& opts = Options());

  util::StatusObject<pb::BuildSummary> Run();

  // Can be called from any thread or a signal handler. The run checks the flag before each
  // phase and between batches and returns CANCELLED.
  void Stop() { stopped_.store(true, std::memory_order_relaxed); }

  bool is_stopped() const { return stopped_.load(std::memory_order_relaxed); }

 private:
  // fn sets the number of records the phase processed.
  util::Status RunPhase(const char* name, std::function<util::Status(uint64*)> fn,
                        pb::BuildSummary* summary);

  RelationSource* src_;
  DocumentCollection* dest_;
  Options opts_;
  std::atomic_bool stopped_{false};
};

// Logs the summary in human readable form.
void LogSummary(const pb::BuildSummary& summary);

}  // namespace cinedoc
