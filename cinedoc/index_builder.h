// Copyright 2019, Beeri 15.  All rights reserved.
//
#pragma once

#include <vector>

#include "cinedoc/cinedoc.pb.h"
#include "cinedoc/document_store.h"

namespace cinedoc {

// title, year, genres and rating.average.
std::vector<pb::IndexSpec> DefaultMovieIndexes();

// Creates the indexes on coll. Failures are logged and recorded in summary->index_errors but
// do not stop the remaining indexes. Returns the number of indexes that failed.
unsigned BuildSecondaryIndexes(const std::vector<pb::IndexSpec>& specs, DocumentCollection* coll,
                               pb::BuildSummary* summary);

}  // namespace cinedoc
