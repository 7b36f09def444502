// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/denorm_pipeline.h"

#include "absl/strings/str_cat.h"
#include "base/logging.h"
#include "base/walltime.h"
#include "cinedoc/cast_assembler.h"
#include "cinedoc/document_assembler.h"
#include "cinedoc/index_builder.h"
#include "cinedoc/person_resolver.h"

namespace cinedoc {

using std::string;
using util::Status;
using util::StatusCode;

DenormPipeline::DenormPipeline(RelationSource* src, DocumentCollection* dest, const Options& opts)
    : src_(src), dest_(dest), opts_(opts) {
  CHECK(src_ && dest_);
  if (opts_.indexes.empty())
    opts_.indexes = DefaultMovieIndexes();
}

Status DenormPipeline::RunPhase(const char* name, std::function<Status(uint64*)> fn,
                                pb::BuildSummary* summary) {
  if (is_stopped()) {
    return Status(StatusCode::CANCELLED, absl::StrCat("phase ", name, ": stopped before start"));
  }

  LOG(INFO) << "Starting phase " << name;
  base::Timer timer;
  uint64 records = 0;

  Status st = fn(&records);
  if (!st.ok()) {
    LOG(ERROR) << "Phase " << name << " failed: " << st;
    return Status(st.code(), absl::StrCat("phase ", name, ": ", st.error_str()));
  }

  pb::PhaseStats* stats = summary->add_phase();
  stats->set_name(name);
  stats->set_records(records);
  stats->set_elapsed_ms(timer.EvalMsec());
  LOG(INFO) << "Finished phase " << name << " with " << records << " records in "
            << stats->elapsed_ms() << "ms";

  return Status::OK;
}

util::StatusObject<pb::BuildSummary> DenormPipeline::Run() {
  base::Timer timer;
  pb::BuildSummary summary;
  uint64 malformed = 0;

  PersonResolver resolver;
  RETURN_IF_ERROR(RunPhase("persons", [&](uint64* records) {
    auto res = PersonResolver::Build(src_);
    if (!res.ok())
      return res.status;
    resolver = std::move(res.obj);
    *records = resolver.drain_stats().rows;
    malformed += resolver.drain_stats().malformed;
    return Status::OK;
  }, &summary));
  summary.set_persons(resolver.size());

  RatingIndex ratings;
  RETURN_IF_ERROR(RunPhase("ratings", [&](uint64* records) {
    auto res = BuildRatingIndex(src_);
    if (!res.ok())
      return res.status;
    ratings = std::move(res.obj);
    *records = ratings.drain_stats().rows;
    malformed += ratings.drain_stats().malformed;
    return Status::OK;
  }, &summary));
  summary.set_ratings(ratings.size());

  GenreIndex genres;
  RETURN_IF_ERROR(RunPhase("genres", [&](uint64* records) {
    auto res = BuildGenreIndex(src_);
    if (!res.ok())
      return res.status;
    genres = std::move(res.obj);
    *records = genres.drain_stats().rows;
    malformed += genres.drain_stats().malformed;
    return Status::OK;
  }, &summary));
  summary.set_movies_with_genres(genres.key_count());

  PersonLinkIndex directors, writers;
  for (auto rel_index : {std::make_pair(kDirectorsRelation, &directors),
                         std::make_pair(kWritersRelation, &writers)}) {
    PersonLinkIndex* index = rel_index.second;
    RETURN_IF_ERROR(RunPhase(rel_index.first, [&](uint64* records) {
      auto res = BuildPersonLinkIndex(src_, rel_index.first);
      if (!res.ok())
        return res.status;
      *index = std::move(res.obj);
      *records = index->drain_stats().rows;
      malformed += index->drain_stats().malformed;
      return Status::OK;
    }, &summary));
  }
  summary.set_movies_with_directors(directors.key_count());
  summary.set_movies_with_writers(writers.key_count());

  CastAssembler cast(&resolver);
  RETURN_IF_ERROR(RunPhase("cast", [&](uint64* records) {
    RETURN_IF_ERROR(cast.Build(src_));
    *records = cast.entry_count();
    malformed += cast.malformed_rows();
    return Status::OK;
  }, &summary));
  summary.set_movies_with_cast(cast.movie_count());
  summary.set_orphaned_characters(cast.orphaned_characters());

  std::vector<MovieRecord> movies;
  RETURN_IF_ERROR(RunPhase("movies", [&](uint64* records) {
    auto res = ForEachRecord<MovieRecord>(
        src_, kMoviesRelation, [&movies](MovieRecord&& rec) { movies.push_back(std::move(rec)); });
    if (!res.ok())
      return res.status;
    *records = res.obj.rows;
    malformed += res.obj.malformed;
    return Status::OK;
  }, &summary));
  summary.set_movies(movies.size());

  MovieIndices indices;
  indices.ratings = &ratings;
  indices.genres = &genres;
  indices.directors = &directors;
  indices.writers = &writers;
  indices.cast = &cast;
  DocumentAssembler assembler(indices, &resolver);
  BulkLoader loader(dest_, opts_.loader);

  RETURN_IF_ERROR(RunPhase("load", [&](uint64* records) {
    RETURN_IF_ERROR(loader.Start());

    bool have_example = false;
    for (const MovieRecord& movie : movies) {
      if (is_stopped()) {
        return Status(StatusCode::CANCELLED,
                      absl::StrCat("stopped after ", loader.batches_written(), " batches"));
      }

      MovieDocument doc = assembler.Assemble(movie);
      if (!have_example && doc.rating.votes > opts_.example_min_votes) {
        summary.set_example_document(ToAbbreviatedJson(doc));
        have_example = true;
      } else if (!summary.has_example_document()) {
        summary.set_example_document(ToAbbreviatedJson(doc));
      }
      RETURN_IF_ERROR(loader.Add(doc));
    }
    RETURN_IF_ERROR(loader.Finish());
    *records = loader.documents_written();
    return Status::OK;
  }, &summary));

  summary.set_documents_written(loader.documents_written());
  summary.set_batches_written(loader.batches_written());
  summary.set_unresolved_persons(cast.unresolved_persons() + assembler.unresolved_persons());
  summary.set_malformed_rows(malformed);

  if (opts_.create_indexes) {
    RETURN_IF_ERROR(RunPhase("indexes", [&](uint64* records) {
      BuildSecondaryIndexes(opts_.indexes, dest_, &summary);
      *records = summary.indexes_created_size();
      return Status::OK;
    }, &summary));
  }

  summary.set_elapsed_ms(timer.EvalMsec());
  return summary;
}

void LogSummary(const pb::BuildSummary& summary) {
  LOG(INFO) << "Build summary:";
  LOG(INFO) << "  movies: " << summary.movies();
  LOG(INFO) << "  ratings: " << summary.ratings();
  LOG(INFO) << "  movies with genres: " << summary.movies_with_genres();
  LOG(INFO) << "  persons: " << summary.persons();
  LOG(INFO) << "  movies with directors: " << summary.movies_with_directors();
  LOG(INFO) << "  movies with cast: " << summary.movies_with_cast();
  LOG(INFO) << "  movies with writers: " << summary.movies_with_writers();
  LOG(INFO) << "  documents written: " << summary.documents_written() << " in "
            << summary.batches_written() << " batches";

  if (summary.unresolved_persons() || summary.orphaned_characters() || summary.malformed_rows()) {
    LOG(WARNING) << "  unresolved persons: " << summary.unresolved_persons()
                 << ", orphaned characters: " << summary.orphaned_characters()
                 << ", malformed rows: " << summary.malformed_rows();
  }
  for (const string& err : summary.index_errors()) {
    LOG(WARNING) << "  index error: " << err;
  }
  LOG(INFO) << "  elapsed: " << summary.elapsed_ms() / 1000.0 << "s";

  if (summary.has_example_document()) {
    LOG(INFO) << "Example document: " << summary.example_document();
  }
}

}  // namespace cinedoc
