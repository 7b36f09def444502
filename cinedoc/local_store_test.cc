// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/local_store.h"

#include <gmock/gmock.h>

#include <cstring>

#include "absl/strings/str_cat.h"
#include "base/gtest.h"
#include "base/logging.h"
#include "file/file.h"
#include "file/file_util.h"

namespace cinedoc {

using testing::ElementsAre;
using testing::IsEmpty;
using testing::UnorderedElementsAre;
using std::string;
using std::vector;
using util::StatusCode;

class LocalStoreTest : public testing::Test {
 protected:
  void SetUp() override {
    root_ = base::TestTempDir();
    coll_.reset(new LocalCollection(root_, "movies"));
  }

  static pb::IndexSpec Spec(const string& field) {
    pb::IndexSpec spec;
    spec.set_field(field);
    return spec;
  }

  vector<string> Ids(const vector<string>& docs) {
    vector<string> res;
    for (const string& d : docs) {
      auto id = ExtractDocumentId(d);
      CHECK(id.ok()) << id.status;
      res.push_back(id.obj);
    }
    return res;
  }

  vector<string> FindIds(const string& field, const string& key_json) {
    auto res = coll_->FindByKey(field, key_json);
    CHECK(res.ok()) << res.status;
    return Ids(res.obj);
  }

  string Path(StringPiece rel) const { return file_util::JoinPath(coll_->dir(), rel); }

  string root_;
  std::unique_ptr<LocalCollection> coll_;
};

const char kDoc1[] = R"({"id":"m1","title":"Alpha","year":2000,"rating":{"average":8.5},)"
                     R"("genres":["Drama","Crime"]})";
const char kDoc2[] =
    R"({"id":"m2","title":"Beta","year":null,"rating":{"average":7},"genres":[]})";
const char kDoc3[] =
    R"({"id":"m3","title":"Gamma","year":2000,"rating":{"average":7.0},"genres":["Drama"]})";

TEST_F(LocalStoreTest, InsertAndScan) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1, kDoc2}).ok());
  ASSERT_TRUE(coll_->InsertMany({kDoc3}).ok());
  ASSERT_TRUE(coll_->InsertMany({}).ok());

  EXPECT_TRUE(file::Exists(Path("data/part-00000.jsonl")));
  EXPECT_TRUE(file::Exists(Path("data/part-00001.jsonl")));
  EXPECT_FALSE(file::Exists(Path("data/part-00002.jsonl")));

  auto cnt = coll_->Count();
  ASSERT_TRUE(cnt.ok());
  EXPECT_EQ(3, cnt.obj);

  vector<string> docs;
  ASSERT_TRUE(coll_->ForEach([&docs](StringPiece d) { docs.emplace_back(d); }).ok());
  EXPECT_THAT(docs, ElementsAre(kDoc1, kDoc2, kDoc3));
}

TEST_F(LocalStoreTest, Reopen) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1}).ok());

  // A new handle continues the numbering of the committed batches.
  LocalCollection other(root_, "movies");
  ASSERT_TRUE(other.InsertMany({kDoc2}).ok());
  EXPECT_TRUE(file::Exists(Path("data/part-00001.jsonl")));

  auto cnt = coll_->Count();
  ASSERT_TRUE(cnt.ok());
  EXPECT_EQ(2, cnt.obj);
}

TEST_F(LocalStoreTest, Drop) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1, kDoc2}).ok());
  ASSERT_TRUE(coll_->CreateIndex(Spec("title")).ok());

  ASSERT_TRUE(coll_->Drop().ok());
  EXPECT_FALSE(file::Exists(coll_->dir()));
  EXPECT_EQ(0, coll_->Count().obj);
  EXPECT_THAT(coll_->ListIndexes().obj, IsEmpty());

  // Dropping twice is fine.
  EXPECT_TRUE(coll_->Drop().ok());

  ASSERT_TRUE(coll_->InsertMany({kDoc3}).ok());
  EXPECT_TRUE(file::Exists(Path("data/part-00000.jsonl")));
  EXPECT_EQ(1, coll_->Count().obj);
}

TEST_F(LocalStoreTest, CreateIndex) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1, kDoc2, kDoc3}).ok());

  for (const char* field : {"title", "year", "genres", "rating.average"}) {
    auto st = coll_->CreateIndex(Spec(field));
    ASSERT_TRUE(st.ok()) << st;
  }
  auto indexes = coll_->ListIndexes();
  ASSERT_TRUE(indexes.ok());
  EXPECT_THAT(indexes.obj, UnorderedElementsAre("title_1", "year_1", "genres_1",
                                                "rating.average_1"));

  size_t len1 = strlen(kDoc1), len3 = strlen(kDoc3);
  size_t offset3 = len1 + strlen(kDoc2) + 2;

  string contents;
  ASSERT_TRUE(file_util::ReadFileToString(Path("indexes/genres_1.idx"), &contents));
  EXPECT_EQ(absl::StrCat("{\"field\":\"genres\"}\n"
                         "{\"k\":\"Crime\",\"ids\":[\"m1\"],\"at\":[[0,0,", len1, "]]}\n"
                         "{\"k\":\"Drama\",\"ids\":[\"m1\",\"m3\"],\"at\":[[0,0,", len1,
                         "],[0,", offset3, ",", len3, "]]}\n"),
            contents);

  // Creating it again is a no-op.
  EXPECT_TRUE(coll_->CreateIndex(Spec("genres")).ok());
  EXPECT_EQ(4, coll_->ListIndexes().obj.size());

  EXPECT_EQ(StatusCode::INVALID_ARGUMENT, coll_->CreateIndex(Spec("")).code());
}

TEST_F(LocalStoreTest, Find) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1, kDoc2, kDoc3}).ok());

  // By scan.
  EXPECT_THAT(FindIds("genres", "\"Drama\""), ElementsAre("m1", "m3"));
  EXPECT_THAT(FindIds("year", "2000"), ElementsAre("m1", "m3"));
  EXPECT_THAT(FindIds("year", "null"), ElementsAre("m2"));
  EXPECT_THAT(FindIds("rating.average", "7"), ElementsAre("m2", "m3"));
  EXPECT_THAT(FindIds("runtime", "null"), ElementsAre("m1", "m2", "m3"));
  EXPECT_THAT(FindIds("title", "\"Delta\""), IsEmpty());

  for (const char* field : {"title", "year", "genres", "rating.average"}) {
    ASSERT_TRUE(coll_->CreateIndex(Spec(field)).ok());
  }

  // By index, same results.
  EXPECT_THAT(FindIds("genres", "\"Drama\""), ElementsAre("m1", "m3"));
  EXPECT_THAT(FindIds("year", "2000.0"), ElementsAre("m1", "m3"));
  EXPECT_THAT(FindIds("rating.average", "7"), ElementsAre("m2", "m3"));
  EXPECT_THAT(FindIds("title", "\"Delta\""), IsEmpty());

  auto res = coll_->Find("genres", "Crime");
  ASSERT_TRUE(res.ok());
  EXPECT_THAT(res.obj, ElementsAre(kDoc1));

  EXPECT_FALSE(coll_->FindByKey("year", "{bad").ok());
}

TEST_F(LocalStoreTest, IndexFollowsInserts) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1}).ok());
  ASSERT_TRUE(coll_->CreateIndex(Spec("genres")).ok());
  ASSERT_TRUE(coll_->InsertMany({kDoc3}).ok());

  EXPECT_THAT(FindIds("genres", "\"Drama\""), ElementsAre("m1", "m3"));
}

TEST_F(LocalStoreTest, IndexReadsOnlyReferencedDocuments) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1}).ok());
  ASSERT_TRUE(coll_->InsertMany({kDoc2}).ok());
  ASSERT_TRUE(coll_->CreateIndex(Spec("genres")).ok());

  // Rewrite the second part behind the collection's back. Nothing in the genres index points
  // there, so an indexed lookup never sees the new document while a scan does.
  const char kDrama[] = R"({"id":"m9","title":"Alpha","genres":["Drama"]})";
  ASSERT_TRUE(file_util::WriteStringToFile(absl::StrCat(kDrama, "\n"),
                                           Path("data/part-00001.jsonl")).ok());

  EXPECT_THAT(FindIds("genres", "\"Drama\""), ElementsAre("m1"));
  EXPECT_THAT(FindIds("title", "\"Alpha\""), ElementsAre("m1", "m9"));
}

TEST_F(LocalStoreTest, IndexLookupStopsAtGreaterKey) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1, kDoc3}).ok());
  ASSERT_TRUE(coll_->CreateIndex(Spec("genres")).ok());

  // Garbage after the last key is reached only by lookups of keys sorted past "Drama".
  string contents;
  ASSERT_TRUE(file_util::ReadFileToString(Path("indexes/genres_1.idx"), &contents));
  ASSERT_TRUE(
      file_util::WriteStringToFile(contents + "garbage\n", Path("indexes/genres_1.idx")).ok());

  EXPECT_THAT(FindIds("genres", "\"Crime\""), ElementsAre("m1"));
  EXPECT_THAT(FindIds("genres", "\"Drama\""), ElementsAre("m1", "m3"));
  EXPECT_THAT(FindIds("genres", "\"Action\""), IsEmpty());

  auto res = coll_->Find("genres", "Western");
  ASSERT_FALSE(res.ok());
  EXPECT_EQ(StatusCode::IO_ERROR, res.status.code());
}

TEST_F(LocalStoreTest, PartsInCommitOrder) {
  ASSERT_TRUE(coll_->InsertMany({kDoc1}).ok());
  ASSERT_TRUE(file::Rename(Path("data/part-00000.jsonl"), Path("data/part-99999.jsonl")).ok());

  LocalCollection other(root_, "movies");
  ASSERT_TRUE(other.InsertMany({kDoc2}).ok());
  EXPECT_TRUE(file::Exists(Path("data/part-100000.jsonl")));

  vector<string> docs;
  ASSERT_TRUE(other.ForEach([&docs](StringPiece d) { docs.emplace_back(d); }).ok());
  EXPECT_THAT(docs, ElementsAre(kDoc1, kDoc2));

  ASSERT_TRUE(other.CreateIndex(Spec("title")).ok());
  auto res = other.Find("title", "Beta");
  ASSERT_TRUE(res.ok()) << res.status;
  EXPECT_THAT(res.obj, ElementsAre(kDoc2));
}

TEST_F(LocalStoreTest, WriteFailure) {
  // A file where the collection directory should be.
  ASSERT_TRUE(file_util::WriteStringToFile("x", coll_->dir()).ok());

  auto st = coll_->InsertMany({kDoc1});
  EXPECT_FALSE(st.ok());
}

TEST_F(LocalStoreTest, Keys) {
  vector<string> keys;
  ASSERT_TRUE(ExtractIndexKeys(kDoc1, "genres", &keys).ok());
  ASSERT_TRUE(ExtractIndexKeys(kDoc1, "rating.average", &keys).ok());
  ASSERT_TRUE(ExtractIndexKeys(kDoc1, "year.month", &keys).ok());
  ASSERT_TRUE(ExtractIndexKeys(kDoc2, "genres", &keys).ok());
  EXPECT_THAT(keys, ElementsAre("\"Drama\"", "\"Crime\"", "8.5", "null"));

  EXPECT_FALSE(ExtractIndexKeys("not json", "genres", &keys).ok());

  EXPECT_EQ("2000.0", CanonicalKey("2000").obj);
  EXPECT_EQ("\"a\"", CanonicalKey(" \"a\" ").obj);
  EXPECT_EQ("rating.average_1", IndexName(Spec("rating.average")));

  pb::IndexSpec named = Spec("title");
  named.set_name("by_title");
  EXPECT_EQ("by_title", IndexName(named));
}

}  // namespace cinedoc
