// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/person_resolver.h"

#include "base/logging.h"
#include "cinedoc/records.h"

namespace cinedoc {

const char kUnknownPerson[] = "Unknown";

util::StatusObject<PersonResolver> PersonResolver::Build(RelationSource* src) {
  auto res = UniqueIndex<std::string>::Build<PersonRecord>(
      src, kPersonsRelation, [](PersonRecord&& rec) {
        return std::make_pair(std::move(rec.person_id), std::move(rec.name));
      });
  if (!res.ok())
    return res.status;

  VLOG(1) << "Resolved " << res.obj.size() << " persons";
  return PersonResolver(std::move(res.obj));
}

StringPiece PersonResolver::DisplayName(StringPiece person_id, bool* resolved) const {
  const std::string* name = Find(person_id);
  if (resolved)
    *resolved = name != nullptr;
  return name ? StringPiece(*name) : StringPiece(kUnknownPerson);
}

}  // namespace cinedoc
