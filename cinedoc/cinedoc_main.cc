// Copyright 2019, Beeri 15.  All rights reserved.
//
// Builds the movies_complete collection of composite movie documents from a directory of
// normalized relation files.

#include <signal.h>

#include <google/protobuf/text_format.h>

#include "base/init.h"
#include "base/logging.h"
#include "base/walltime.h"
#include "cinedoc/denorm_pipeline.h"
#include "cinedoc/local_store.h"
#include "file/file_util.h"

DEFINE_string(source_dir, "", "Directory with the relation files (movies.csv, ratings.tsv, ...)");
DEFINE_string(dest_dir, "~/cinedoc", "Root directory of the document store");
DEFINE_string(collection, "movies_complete", "Destination collection, rebuilt on every run");
DEFINE_int32(batch_size, 1000, "Number of documents per batch write");
DEFINE_int32(progress_every, 5, "Log progress every that many batches");
DEFINE_bool(create_indexes, true, "Create secondary indexes after loading");
DEFINE_string(null_token, "\\N", "Source value that stands for a missing value");
DEFINE_string(summary_file, "", "If set, the build summary is written there in text format");

using namespace cinedoc;
using std::string;

namespace {

DenormPipeline* pipeline_instance = nullptr;

void StopHandler(int sig) {
  if (pipeline_instance)
    pipeline_instance->Stop();
}

}  // namespace

int main(int argc, char** argv) {
  MainInitGuard guard(&argc, &argv);

  if (FLAGS_source_dir.empty()) {
    LOG(ERROR) << "--source_dir is required";
    return 1;
  }
  if (FLAGS_batch_size <= 0 || FLAGS_progress_every < 0) {
    LOG(ERROR) << "--batch_size must be positive and --progress_every non-negative";
    return 1;
  }

  DirRelationSource::Options src_opts;
  src_opts.null_token = FLAGS_null_token;
  DirRelationSource src(file_util::ExpandPath(FLAGS_source_dir), src_opts);

  string dest_dir = file_util::ExpandPath(FLAGS_dest_dir);
  LocalCollection coll(dest_dir, FLAGS_collection);

  DenormPipeline::Options opts;
  opts.loader.batch_size = FLAGS_batch_size;
  opts.loader.progress_every = FLAGS_progress_every;
  opts.create_indexes = FLAGS_create_indexes;

  DenormPipeline pipeline(&src, &coll, opts);
  pipeline_instance = &pipeline;
  signal(SIGINT, StopHandler);
  signal(SIGTERM, StopHandler);

  LOG(INFO) << "Started at " << base::LocalTimeNow("%Y-%m-%d %H:%M:%S") << ", building "
            << coll.dir() << " from " << FLAGS_source_dir;

  auto res = pipeline.Run();
  pipeline_instance = nullptr;

  if (!res.ok()) {
    LOG(ERROR) << "Build failed: " << res.status;
    return res.status.IsCancelled() ? 2 : 1;
  }

  LogSummary(res.obj);
  LOG(INFO) << "Finished at " << base::LocalTimeNow("%Y-%m-%d %H:%M:%S");

  if (!FLAGS_summary_file.empty()) {
    string text;
    CHECK(google::protobuf::TextFormat::PrintToString(res.obj, &text));
    util::Status st = file_util::WriteStringToFile(text, file_util::ExpandPath(FLAGS_summary_file));
    if (!st.ok()) {
      LOG(ERROR) << "Could not write " << FLAGS_summary_file << ": " << st;
      return 1;
    }
  }

  return 0;
}
