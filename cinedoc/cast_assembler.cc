// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/cast_assembler.h"

#include "base/logging.h"
#include "base/map-util.h"

namespace cinedoc {

using std::string;
using util::Status;

Status CastAssembler::Build(RelationSource* src) {
  auto principals = ForEachRecord<PersonAssoc>(
      src, kPrincipalsRelation, [this](PersonAssoc&& assoc) { AddPrincipal(assoc); });
  if (!principals.ok())
    return principals.status;

  auto characters = ForEachRecord<CharacterAssoc>(
      src, kCharactersRelation, [this](CharacterAssoc&& assoc) {
        if (!AddCharacter(std::move(assoc))) {
          ++orphaned_characters_;
        }
      });
  if (!characters.ok())
    return characters.status;

  malformed_rows_ += principals.obj.malformed + characters.obj.malformed;

  LOG_IF(WARNING, orphaned_characters_ > 0)
      << "Dropped " << orphaned_characters_ << " character rows without a principal";
  VLOG(1) << "Cast for " << casts_.size() << " movies, " << entry_count_ << " entries";

  return Status::OK;
}

bool CastAssembler::AddPrincipal(const PersonAssoc& assoc) {
  MovieCast& mc = casts_[assoc.movie_id];
  if (!InsertIfNotPresent(&mc.pos, assoc.person_id, unsigned(mc.entries.size())))
    return false;

  CastEntry entry;
  entry.person_id = assoc.person_id;

  bool resolved;
  entry.name = string(resolver_->DisplayName(assoc.person_id, &resolved));
  if (!resolved)
    ++unresolved_persons_;
  mc.entries.push_back(std::move(entry));
  ++entry_count_;

  return true;
}

bool CastAssembler::AddCharacter(CharacterAssoc&& assoc) {
  auto it = casts_.find(assoc.movie_id);
  if (it == casts_.end())
    return false;

  MovieCast& mc = it->second;
  const unsigned* pos = FindOrNull(mc.pos, assoc.person_id);
  if (!pos)
    return false;

  mc.entries[*pos].characters.push_back(std::move(assoc.name));
  return true;
}

const std::vector<CastEntry>& CastAssembler::Get(StringPiece movie_id) const {
  static const std::vector<CastEntry>* empty = new std::vector<CastEntry>;

  auto it = casts_.find(movie_id);
  return it == casts_.end() ? *empty : it->second.entries;
}

}  // namespace cinedoc
