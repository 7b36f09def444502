// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/denorm_pipeline.h"

#include <gmock/gmock.h>

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "base/gtest.h"
#include "base/logging.h"
#include "cinedoc/local_store.h"
#include "cinedoc/movie_document.h"
#include "cinedoc/test_utils.h"
#include "file/file_util.h"
#include "util/zlib_source.h"

namespace cinedoc {

using testing::ElementsAre;
using testing::HasSubstr;
using testing::IsEmpty;
using std::string;
using std::vector;
using util::StatusCode;

namespace {

// Stops the pipeline once the given number of batches were inserted.
class StoppingCollection : public MemoryCollection {
 public:
  StoppingCollection(DenormPipeline** pipeline, unsigned stop_after)
      : pipeline_(pipeline), stop_after_(stop_after) {}

  util::Status InsertMany(const DocList& docs) override {
    RETURN_IF_ERROR(MemoryCollection::InsertMany(docs));
    if (batches().size() == stop_after_)
      (*pipeline_)->Stop();
    return util::Status::OK;
  }

 private:
  DenormPipeline** pipeline_;
  unsigned stop_after_;
};

MovieDocument ParseDoc(const string& json) {
  MovieDocument doc;
  auto st = ParseMovieDocument(json, &doc);
  CHECK(st.ok()) << st;
  return doc;
}

}  // namespace

class DenormPipelineTest : public testing::Test {
 protected:
  void SetUp() override { AddEmptyRelations(&src_); }

  // The example source of two movies.
  void AddAlpha() {
    src_.AddRows(kMoviesRelation, {"movie_id", "primary_title", "start_year", "runtime_minutes"},
                 {{"m1", "Alpha", "2000", "100"}});
    src_.AddRows(kRatingsRelation, {"movie_id", "average_rating", "num_votes"},
                 {{"m1", "8.5", "1000"}});
    src_.AddRows(kGenresRelation, {"movie_id", "genre"}, {{"m1", "Drama"}});
    src_.AddRows(kPersonsRelation, {"person_id", "name"},
                 {{"p1", "A. Actor"}, {"p2", "B. Director"}});
    src_.AddRows(kPrincipalsRelation, {"movie_id", "person_id"}, {{"m1", "p1"}});
    src_.AddRows(kCharactersRelation, {"movie_id", "person_id", "name"},
                 {{"m1", "p1", "Hero"}, {"m1", "p1", "Narrator"}});
    src_.AddRows(kDirectorsRelation, {"movie_id", "person_id"}, {{"m1", "p2"}});
  }

  void AddMovies(unsigned count) {
    vector<TestRelationSource::StrRow> rows;
    for (unsigned i = 0; i < count; ++i) {
      rows.push_back({absl::StrCat("t", i), absl::StrCat("Title ", i), "1999", "\\N"});
    }
    src_.AddRows(kMoviesRelation, {"movie_id", "primary_title", "start_year", "runtime_minutes"},
                 rows);
  }

  util::StatusObject<pb::BuildSummary> Run(DocumentCollection* dest) {
    DenormPipeline pipeline(&src_, dest, opts_);
    return pipeline.Run();
  }

  TestRelationSource src_;
  DenormPipeline::Options opts_;
  MemoryCollection coll_;
};

TEST_F(DenormPipelineTest, Alpha) {
  AddAlpha();

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok()) << res.status;

  auto docs = coll_.ById();
  ASSERT_EQ(1, docs.size());
  EXPECT_EQ(
      R"({"id":"m1","title":"Alpha","year":2000,"runtime":100,)"
      R"("rating":{"average":8.5,"votes":1000},"genres":["Drama"],)"
      R"("directors":[{"person_id":"p2","name":"B. Director"}],)"
      R"("cast":[{"person_id":"p1","name":"A. Actor","characters":["Hero","Narrator"]}],)"
      R"("writers":[]})",
      docs["m1"]);

  const pb::BuildSummary& summary = res.obj;
  EXPECT_EQ(1, summary.movies());
  EXPECT_EQ(1, summary.ratings());
  EXPECT_EQ(1, summary.movies_with_genres());
  EXPECT_EQ(2, summary.persons());
  EXPECT_EQ(1, summary.movies_with_directors());
  EXPECT_EQ(1, summary.movies_with_cast());
  EXPECT_EQ(0, summary.movies_with_writers());
  EXPECT_EQ(1, summary.documents_written());
  EXPECT_EQ(1, summary.batches_written());
  EXPECT_EQ(0, summary.unresolved_persons());
  EXPECT_EQ(0, summary.orphaned_characters());

  vector<string> phases;
  for (const auto& p : summary.phase()) {
    phases.push_back(p.name());
  }
  EXPECT_THAT(phases, ElementsAre("persons", "ratings", "genres", "directors", "writers", "cast",
                                  "movies", "load", "indexes"));
  EXPECT_THAT(summary.indexes_created(),
              ElementsAre("title_1", "year_1", "genres_1", "rating.average_1"));

  // Each relation is drained exactly once.
  for (const char* rel : {kMoviesRelation, kRatingsRelation, kGenresRelation, kPersonsRelation,
                          kDirectorsRelation, kWritersRelation, kPrincipalsRelation,
                          kCharactersRelation}) {
    EXPECT_EQ(1, src_.open_count(rel)) << rel;
  }
}

TEST_F(DenormPipelineTest, Orphans) {
  src_.AddRows(kMoviesRelation, {"movie_id", "primary_title", "start_year", "runtime_minutes"},
               {{"m2", "Beta", "\\N", "\\N"}});
  src_.AddRows(kPrincipalsRelation, {"movie_id", "person_id"}, {{"m2", "p9"}});
  src_.AddRows(kCharactersRelation, {"movie_id", "person_id", "name"},
               {{"m2", "p8", "Ghost"}, {"m5", "p9", "Ghost"}});
  src_.AddRows(kWritersRelation, {"movie_id", "person_id"}, {{"m2", "p7"}});

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok()) << res.status;

  MovieDocument doc = ParseDoc(coll_.ById()["m2"]);
  EXPECT_THAT(doc.cast, ElementsAre(CastEntry{"p9", "Unknown", {}}));
  EXPECT_THAT(doc.writers, ElementsAre(PersonRef{"p7", "Unknown"}));
  EXPECT_FALSE(doc.year);
  EXPECT_FALSE(doc.rating.average);
  EXPECT_EQ(0, doc.rating.votes);
  EXPECT_THAT(doc.genres, IsEmpty());
  EXPECT_THAT(doc.directors, IsEmpty());

  EXPECT_EQ(2, res.obj.unresolved_persons());
  EXPECT_EQ(2, res.obj.orphaned_characters());
}

TEST_F(DenormPipelineTest, OneDocumentPerMovie) {
  AddMovies(25);
  src_.AddRows(kPersonsRelation, {"person_id", "name"}, {{"p1", "A"}, {"p2", "B"}});
  src_.AddRows(kPrincipalsRelation, {"movie_id", "person_id"},
               {{"t1", "p1"}, {"t1", "p2"}, {"t1", "p1"}, {"t2", "p2"}, {"t99", "p1"}});
  src_.AddRows(kCharactersRelation, {"movie_id", "person_id", "name"},
               {{"t1", "p2", "X"}, {"t2", "p2", "Y"}, {"t1", "p2", "Z"}});
  opts_.loader.batch_size = 10;

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok()) << res.status;
  EXPECT_EQ(25, res.obj.documents_written());
  EXPECT_EQ(3, res.obj.batches_written());

  auto docs = coll_.ById();
  ASSERT_EQ(25, docs.size());
  EXPECT_EQ(0, docs.count("t99"));

  MovieDocument t1 = ParseDoc(docs["t1"]);
  EXPECT_THAT(t1.cast, ElementsAre(CastEntry{"p1", "A", {}}, CastEntry{"p2", "B", {"X", "Z"}}));
  MovieDocument t2 = ParseDoc(docs["t2"]);
  EXPECT_THAT(t2.cast, ElementsAre(CastEntry{"p2", "B", {"Y"}}));
}

TEST_F(DenormPipelineTest, Empty) {
  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok()) << res.status;

  EXPECT_EQ(0, res.obj.movies());
  EXPECT_EQ(0, res.obj.documents_written());
  EXPECT_FALSE(res.obj.has_example_document());
  EXPECT_EQ(1, coll_.drop_count());
}

TEST_F(DenormPipelineTest, MissingRelation) {
  for (const char* missing : {kPersonsRelation, kRatingsRelation, kGenresRelation,
                              kDirectorsRelation, kWritersRelation, kPrincipalsRelation,
                              kCharactersRelation, kMoviesRelation}) {
    TestRelationSource src;
    for (const char* rel : {kPersonsRelation, kRatingsRelation, kGenresRelation,
                            kDirectorsRelation, kWritersRelation, kPrincipalsRelation,
                            kCharactersRelation, kMoviesRelation}) {
      if (string(rel) == missing)
        continue;
      TestRelationSource all;
      AddEmptyRelations(&all);
      auto rd = all.Open(rel);
      ASSERT_TRUE(rd.ok());
      src.AddRows(rel, rd.obj->columns(), {});
      delete rd.obj;
    }

    MemoryCollection coll;
    ASSERT_TRUE(coll.InsertMany({"{\"id\":\"old\"}"}).ok());

    DenormPipeline pipeline(&src, &coll);
    auto res = pipeline.Run();
    ASSERT_FALSE(res.ok()) << missing;
    EXPECT_EQ(StatusCode::NOT_FOUND, res.status.code());
    EXPECT_THAT(res.status.error_str(), HasSubstr(missing));

    // The destination is untouched.
    EXPECT_EQ(0, coll.drop_count());
    EXPECT_EQ(1, coll.Count().obj);
  }
}

TEST_F(DenormPipelineTest, PhaseInError) {
  src_.FailReadAfter(kGenresRelation, 0);

  auto res = Run(&coll_);
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(StatusCode::IO_ERROR, res.status.code());
  EXPECT_THAT(res.status.error_str(), HasSubstr("phase genres: "));
  EXPECT_EQ(0, coll_.drop_count());
}

TEST_F(DenormPipelineTest, WriteFailure) {
  AddMovies(10);
  opts_.loader.batch_size = 2;
  coll_.fail_insert_at_batch = 4;

  auto res = Run(&coll_);
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(StatusCode::IO_ERROR, res.status.code());
  EXPECT_THAT(res.status.error_str(), HasSubstr("phase load: "));

  EXPECT_EQ(3, coll_.batches().size());
  EXPECT_EQ(6, coll_.Count().obj);
  EXPECT_THAT(coll_.ListIndexes().obj, IsEmpty());
}

TEST_F(DenormPipelineTest, StopBeforeRun) {
  AddAlpha();
  DenormPipeline pipeline(&src_, &coll_, opts_);
  pipeline.Stop();

  auto res = pipeline.Run();
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(res.status.IsCancelled());
  EXPECT_THAT(res.status.error_str(), HasSubstr("phase persons"));
  EXPECT_EQ(0, src_.open_count(kPersonsRelation));
  EXPECT_EQ(0, coll_.drop_count());
}

TEST_F(DenormPipelineTest, StopDuringLoad) {
  AddMovies(10);
  opts_.loader.batch_size = 3;

  DenormPipeline* pipeline_ptr = nullptr;
  StoppingCollection coll(&pipeline_ptr, 2);
  DenormPipeline pipeline(&src_, &coll, opts_);
  pipeline_ptr = &pipeline;

  auto res = pipeline.Run();
  ASSERT_FALSE(res.ok());
  EXPECT_TRUE(res.status.IsCancelled());
  EXPECT_THAT(res.status.error_str(), HasSubstr("phase load"));
  EXPECT_EQ(2, coll.batches().size());
  EXPECT_THAT(coll.ListIndexes().obj, IsEmpty());
}

TEST_F(DenormPipelineTest, NoIndexes) {
  AddAlpha();
  opts_.create_indexes = false;

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok());
  EXPECT_THAT(coll_.ListIndexes().obj, IsEmpty());
  EXPECT_EQ(0, res.obj.indexes_created_size());
}

TEST_F(DenormPipelineTest, IndexFailure) {
  AddAlpha();
  coll_.fail_create_index.insert("genres_1");

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok()) << res.status;
  EXPECT_EQ(3, res.obj.indexes_created_size());
  ASSERT_EQ(1, res.obj.index_errors_size());
  EXPECT_THAT(res.obj.index_errors(0), HasSubstr("genres_1"));
  EXPECT_EQ(1, coll_.Count().obj);
}

TEST_F(DenormPipelineTest, ExampleDocument) {
  src_.AddRows(kMoviesRelation, {"movie_id", "primary_title", "start_year", "runtime_minutes"},
               {{"m1", "Small", "2001", "90"}, {"m2", "Big", "2002", "120"},
                {"m3", "Bigger", "2003", "130"}});
  src_.AddRows(kRatingsRelation, {"movie_id", "average_rating", "num_votes"},
               {{"m1", "5.0", "10"}, {"m2", "9.0", "2000000"}, {"m3", "9.1", "3000000"}});

  auto res = Run(&coll_);
  ASSERT_TRUE(res.ok());
  EXPECT_EQ(R"({"id":"m2","title":"Big","year":2002,"rating":{"average":9.0,"votes":2000000},)"
            R"("genres":[],"directors":0,"cast":0,"writers":0})",
            res.obj.example_document());

  // Falls back to the first document.
  MemoryCollection other;
  opts_.example_min_votes = 5000000;
  res = Run(&other);
  ASSERT_TRUE(res.ok());
  EXPECT_THAT(res.obj.example_document(), HasSubstr("\"id\":\"m1\""));
}

TEST_F(DenormPipelineTest, Idempotent) {
  AddAlpha();
  AddMovies(7);
  string root = base::TestTempDir();
  LocalCollection coll(root, "movies_complete");
  opts_.loader.batch_size = 3;

  auto collect = [&coll] {
    vector<string> docs;
    CHECK_STATUS(coll.ForEach([&docs](StringPiece d) { docs.emplace_back(d); }));
    std::sort(docs.begin(), docs.end());
    return docs;
  };

  ASSERT_TRUE(Run(&coll).ok());
  vector<string> first = collect();
  auto first_indexes = coll.ListIndexes();

  ASSERT_TRUE(Run(&coll).ok());
  EXPECT_EQ(first, collect());
  EXPECT_EQ(8, first.size());
  EXPECT_EQ(first_indexes.obj, coll.ListIndexes().obj);
}

class DirPipelineTest : public testing::Test {
 protected:
  void SetUp() override {
    root_ = base::TestTempDir();
    src_dir_ = file_util::JoinPath(root_, "src");
    ASSERT_TRUE(file_util::RecursivelyCreateDir(src_dir_, 0755));
  }

  void Write(const string& name, const string& contents, bool gzip = false) {
    string data = contents;
    if (gzip) {
      util::StringSink* ssink = new util::StringSink;
      util::ZlibSink zsink(ssink);
      CHECK_STATUS(zsink.Append(strings::ToByteRange(contents)));
      CHECK_STATUS(zsink.Flush());
      data = ssink->contents();
    }
    CHECK_STATUS(file_util::WriteStringToFile(data, file_util::JoinPath(src_dir_, name)));
  }

  string root_, src_dir_;
};

TEST_F(DirPipelineTest, EndToEnd) {
  Write("movies.tsv",
        "movie_id\tprimary_title\tstart_year\truntime_minutes\n"
        "tt1\tAlpha\t2000\t100\n"
        "tt2\tBeta\t2005\t\\N\n"
        "tt3\tGamma\t\\N\t95\n");
  Write("ratings.csv", "movie_id,average_rating,num_votes\ntt1,8.5,1000\ntt3,6.0,12\n");
  Write("genres.tsv.gz", "movie_id\tgenre\ntt1\tDrama\ntt2\tComedy\ntt3\tDrama\n", true);
  Write("persons.csv", "person_id,name\np1,A. Actor\np2,B. Director\n");
  Write("directors.csv", "movie_id,person_id\ntt1,p2\n");
  Write("writers.csv", "movie_id,person_id\n");
  Write("principals.csv.gz", "movie_id,person_id\ntt1,p1\n", true);
  Write("characters.tsv", "movie_id\tperson_id\tname\ntt1\tp1\tHero\ntt1\tp1\tNarrator\n");

  DirRelationSource src(src_dir_);
  LocalCollection coll(file_util::JoinPath(root_, "dest"), "movies_complete");
  DenormPipeline pipeline(&src, &coll);

  auto res = pipeline.Run();
  ASSERT_TRUE(res.ok()) << res.status;
  EXPECT_EQ(3, res.obj.documents_written());

  auto drama = coll.Find("genres", "Drama");
  ASSERT_TRUE(drama.ok()) << drama.status;
  ASSERT_EQ(2, drama.obj.size());

  MovieDocument alpha = ParseDoc(drama.obj[0]);
  EXPECT_EQ("tt1", alpha.id);
  EXPECT_THAT(alpha.cast, ElementsAre(CastEntry{"p1", "A. Actor", {"Hero", "Narrator"}}));
  EXPECT_THAT(alpha.directors, ElementsAre(PersonRef{"p2", "B. Director"}));
  EXPECT_EQ("tt3", ParseDoc(drama.obj[1]).id);

  auto by_year = coll.FindByKey("year", "2005");
  ASSERT_TRUE(by_year.ok());
  ASSERT_EQ(1, by_year.obj.size());
  EXPECT_EQ("Beta", ParseDoc(by_year.obj[0]).title);
}

}  // namespace cinedoc
