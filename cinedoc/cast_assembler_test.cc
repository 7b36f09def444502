// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/cast_assembler.h"

#include <gmock/gmock.h>

#include "base/gtest.h"
#include "base/logging.h"
#include "cinedoc/test_utils.h"

namespace cinedoc {

using testing::ElementsAre;
using testing::IsEmpty;
using std::string;
using util::StatusCode;

class CastAssemblerTest : public testing::Test {
 protected:
  void SetUp() override {
    src_.AddRows(kPersonsRelation, {"person_id", "name"},
                 {{"p1", "A. Actor"}, {"p2", "B. Actress"}, {"p3", "C. Extra"}});
    auto res = PersonResolver::Build(&src_);
    CHECK(res.ok()) << res.status;
    resolver_ = std::move(res.obj);
  }

  void AddPrincipals(const std::vector<TestRelationSource::StrRow>& rows) {
    src_.AddRows(kPrincipalsRelation, {"movie_id", "person_id"}, rows);
  }

  void AddCharacters(const std::vector<TestRelationSource::StrRow>& rows) {
    src_.AddRows(kCharactersRelation, {"movie_id", "person_id", "name"}, rows);
  }

  TestRelationSource src_;
  PersonResolver resolver_;
};

TEST_F(CastAssemblerTest, Basic) {
  AddPrincipals({{"m1", "p1"}});
  AddCharacters({{"m1", "p1", "Hero"}, {"m1", "p1", "Narrator"}});

  CastAssembler cast(&resolver_);
  auto st = cast.Build(&src_);
  ASSERT_TRUE(st.ok()) << st;

  const auto& entries = cast.Get("m1");
  ASSERT_EQ(1, entries.size());
  EXPECT_EQ("p1", entries[0].person_id);
  EXPECT_EQ("A. Actor", entries[0].name);
  EXPECT_THAT(entries[0].characters, ElementsAre("Hero", "Narrator"));
  EXPECT_THAT(cast.Get("m2"), IsEmpty());
}

TEST_F(CastAssemblerTest, DedupKeepsFirstAppearance) {
  AddPrincipals({{"m1", "p2"}, {"m1", "p1"}, {"m1", "p2"}, {"m2", "p2"}, {"m1", "p3"}});
  AddCharacters({{"m1", "p1", "Hero"},
                 {"m1", "p2", "Villain"},
                 {"m2", "p2", "Doctor"},
                 {"m1", "p2", "Villain"},
                 {"m1", "p1", "Narrator"}});

  CastAssembler cast(&resolver_);
  ASSERT_TRUE(cast.Build(&src_).ok());

  const auto& m1 = cast.Get("m1");
  ASSERT_EQ(3, m1.size());
  EXPECT_EQ("p2", m1[0].person_id);
  EXPECT_EQ("p1", m1[1].person_id);
  EXPECT_EQ("p3", m1[2].person_id);

  // Character names are not deduplicated and do not leak across movies.
  EXPECT_THAT(m1[0].characters, ElementsAre("Villain", "Villain"));
  EXPECT_THAT(m1[1].characters, ElementsAre("Hero", "Narrator"));
  EXPECT_THAT(m1[2].characters, IsEmpty());

  const auto& m2 = cast.Get("m2");
  ASSERT_EQ(1, m2.size());
  EXPECT_THAT(m2[0].characters, ElementsAre("Doctor"));

  EXPECT_EQ(2, cast.movie_count());
  EXPECT_EQ(4, cast.entry_count());
}

TEST_F(CastAssemblerTest, Orphans) {
  AddPrincipals({{"m2", "p9"}});
  AddCharacters({{"m2", "p1", "Ghost"}, {"m3", "p1", "Ghost"}});

  CastAssembler cast(&resolver_);
  ASSERT_TRUE(cast.Build(&src_).ok());

  const auto& m2 = cast.Get("m2");
  ASSERT_EQ(1, m2.size());
  EXPECT_EQ("p9", m2[0].person_id);
  EXPECT_EQ("Unknown", m2[0].name);
  EXPECT_THAT(m2[0].characters, IsEmpty());

  EXPECT_EQ(2, cast.orphaned_characters());
  EXPECT_EQ(1, cast.unresolved_persons());
  EXPECT_THAT(cast.Get("m3"), IsEmpty());
}

TEST_F(CastAssemblerTest, AddDirect) {
  CastAssembler cast(&resolver_);

  EXPECT_TRUE(cast.AddPrincipal(PersonAssoc{"m1", "p1"}));
  EXPECT_FALSE(cast.AddPrincipal(PersonAssoc{"m1", "p1"}));
  EXPECT_TRUE(cast.AddCharacter(CharacterAssoc{"m1", "p1", "Hero"}));
  EXPECT_FALSE(cast.AddCharacter(CharacterAssoc{"m1", "p2", "Hero"}));

  ASSERT_EQ(1, cast.Get("m1").size());
  EXPECT_THAT(cast.Get("m1")[0].characters, ElementsAre("Hero"));
}

TEST_F(CastAssemblerTest, MissingCharacters) {
  AddPrincipals({{"m1", "p1"}});

  CastAssembler cast(&resolver_);
  auto st = cast.Build(&src_);
  ASSERT_FALSE(st.ok());
  EXPECT_EQ(StatusCode::NOT_FOUND, st.code());
}

}  // namespace cinedoc
