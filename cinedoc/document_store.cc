// Copyright 2019, Beeri 15.  All rights reserved.
//
#include "cinedoc/document_store.h"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "base/logging.h"

namespace cinedoc {

namespace rj = ::rapidjson;

using std::string;
using util::Status;
using util::StatusCode;

namespace {

using RapidWriter = rj::Writer<rj::StringBuffer>;

void WriteCanonical(const rj::Value& val, RapidWriter* w) {
  switch (val.GetType()) {
    case rj::kNumberType:
      w->Double(val.GetDouble());
      break;
    case rj::kArrayType:
      w->StartArray();
      for (const auto& v : val.GetArray()) {
        WriteCanonical(v, w);
      }
      w->EndArray();
      break;
    case rj::kObjectType:
      w->StartObject();
      for (const auto& m : val.GetObject()) {
        w->Key(m.name.GetString(), m.name.GetStringLength());
        WriteCanonical(m.value, w);
      }
      w->EndObject();
      break;
    default:
      val.Accept(*w);
  }
}

string Canonical(const rj::Value& val) {
  rj::StringBuffer sb;
  RapidWriter w(sb);
  WriteCanonical(val, &w);
  return string(sb.GetString(), sb.GetSize());
}

Status ParseJson(StringPiece json, rj::Document* d) {
  if (d->Parse(json.data(), json.size()).HasParseError()) {
    return Status(StatusCode::INVALID_ARGUMENT,
                  absl::StrCat("Bad json: ", rj::GetParseError_En(d->GetParseError()),
                               " at offset ", d->GetErrorOffset()));
  }
  return Status::OK;
}

}  // namespace

util::StatusObject<DocumentCollection::DocList> DocumentCollection::Find(const std::string& field,
                                                                         StringPiece value) {
  rj::StringBuffer sb;
  RapidWriter w(sb);
  w.String(value.data(), value.size());

  return FindByKey(field, string(sb.GetString(), sb.GetSize()));
}

string IndexName(const pb::IndexSpec& spec) {
  if (spec.has_name() && !spec.name().empty())
    return spec.name();
  return absl::StrCat(spec.field(), "_1");
}

util::StatusObject<string> CanonicalKey(StringPiece key_json) {
  rj::Document d;
  RETURN_IF_ERROR(ParseJson(key_json, &d));

  return Canonical(d);
}

Status ExtractIndexKeys(StringPiece doc_json, StringPiece field, std::vector<string>* keys) {
  rj::Document d;
  RETURN_IF_ERROR(ParseJson(doc_json, &d));

  const rj::Value* val = &d;
  for (StringPiece part : absl::StrSplit(field, '.')) {
    if (!val->IsObject()) {
      val = nullptr;
      break;
    }
    rj::Value key(rj::StringRef(part.data(), part.size()));
    auto it = val->FindMember(key);
    if (it == val->MemberEnd()) {
      val = nullptr;
      break;
    }
    val = &it->value;
  }

  if (!val) {
    keys->push_back("null");
  } else if (val->IsArray()) {
    for (const auto& v : val->GetArray()) {
      keys->push_back(Canonical(v));
    }
  } else {
    keys->push_back(Canonical(*val));
  }

  return Status::OK;
}

util::StatusObject<string> ExtractDocumentId(StringPiece doc_json) {
  rj::Document d;
  RETURN_IF_ERROR(ParseJson(doc_json, &d));

  if (!d.IsObject())
    return Status(StatusCode::INVALID_ARGUMENT, "Document is not a json object");
  auto it = d.FindMember("id");
  if (it == d.MemberEnd() || !it->value.IsString())
    return Status(StatusCode::INVALID_ARGUMENT, "Document has no string id");

  return string(it->value.GetString(), it->value.GetStringLength());
}

}  // namespace cinedoc
