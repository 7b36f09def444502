// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <cstdint>
#include <string>

#include "absl/strings/string_view.h"
#include "absl/types/span.h"

typedef absl::string_view StringPiece;

namespace strings {

typedef absl::Span<const uint8_t> ByteRange;
typedef absl::Span<uint8_t> MutableByteRange;

inline const char* charptr(const unsigned char* ptr) {
  return reinterpret_cast<const char*>(ptr);
}

inline char* charptr(unsigned char* ptr) {
  return reinterpret_cast<char*>(ptr);
}

inline const uint8_t* u8ptr(const char* ptr) {
  return reinterpret_cast<const uint8_t*>(ptr);
}

inline uint8_t* u8ptr(char* ptr) {
  return reinterpret_cast<uint8_t*>(ptr);
}

inline ByteRange ToByteRange(StringPiece s) {
  return ByteRange(u8ptr(s.data()), s.size());
}

inline MutableByteRange AsMutableByteRange(std::string& s) {
  return MutableByteRange(u8ptr(&s.front()), s.size());
}

inline std::string AsString(StringPiece piece) { return std::string(piece.data(), piece.size()); }

inline StringPiece FromBuf(const uint8_t* ptr, size_t len) {
  return StringPiece(charptr(ptr), len);
}

}  // namespace strings
