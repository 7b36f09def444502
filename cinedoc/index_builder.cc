// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/index_builder.h"

#include "absl/strings/str_cat.h"
#include "base/logging.h"

namespace cinedoc {

std::vector<pb::IndexSpec> DefaultMovieIndexes() {
  std::vector<pb::IndexSpec> res;
  for (const char* field : {"title", "year", "genres", "rating.average"}) {
    res.emplace_back();
    res.back().set_field(field);
  }
  return res;
}

unsigned BuildSecondaryIndexes(const std::vector<pb::IndexSpec>& specs, DocumentCollection* coll,
                               pb::BuildSummary* summary) {
  unsigned failed = 0;

  for (const pb::IndexSpec& spec : specs) {
    std::string name = IndexName(spec);
    util::Status st = coll->CreateIndex(spec);
    if (st.ok()) {
      LOG(INFO) << "Created index " << name << " on " << coll->name();
      summary->add_indexes_created(name);
    } else {
      LOG(ERROR) << "Could not create index " << name << ": " << st;
      summary->add_index_errors(absl::StrCat(name, ": ", st.error_str()));
      ++failed;
    }
  }
  return failed;
}

}  // namespace cinedoc
