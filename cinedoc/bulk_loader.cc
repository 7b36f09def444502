// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/bulk_loader.h"

#include "absl/strings/str_cat.h"
#include "base/logging.h"

namespace cinedoc {

using util::Status;
using util::StatusCode;

BulkLoader::BulkLoader(DocumentCollection* coll, const Options& opts) : coll_(coll), opts_(opts) {
  CHECK(coll_);
}

Status BulkLoader::Start() {
  if (opts_.batch_size == 0)
    return Status(StatusCode::INVALID_ARGUMENT, "batch_size must be positive");

  RETURN_IF_ERROR(coll_->Drop());
  LOG(INFO) << "Dropped collection " << coll_->name();

  batch_.clear();
  batch_.reserve(opts_.batch_size);
  documents_written_ = batches_written_ = 0;
  started_ = true;

  return Status::OK;
}

Status BulkLoader::Add(const MovieDocument& doc) {
  DCHECK(started_);

  batch_.push_back(ToJson(doc));
  if (batch_.size() >= opts_.batch_size)
    return Flush();
  return Status::OK;
}

Status BulkLoader::Finish() {
  DCHECK(started_);

  RETURN_IF_ERROR(Flush());
  LOG(INFO) << "Inserted " << documents_written_ << " documents into " << coll_->name() << " in "
            << batches_written_ << " batches";
  started_ = false;

  return Status::OK;
}

Status BulkLoader::Flush() {
  if (batch_.empty())
    return Status::OK;

  Status st = coll_->InsertMany(batch_);
  if (!st.ok()) {
    st.AddErrorMsg(absl::StrCat("while writing batch ", batches_written_ + 1, " with ",
                                batch_.size(), " documents"));
    return st;
  }

  documents_written_ += batch_.size();
  ++batches_written_;
  batch_.clear();

  if (opts_.progress_every && batches_written_ % opts_.progress_every == 0) {
    LOG(INFO) << "Inserted " << documents_written_ << " documents";
  }
  return Status::OK;
}

}  // namespace cinedoc
