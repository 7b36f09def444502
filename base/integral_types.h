// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <cstdint>
#include <limits>

typedef int8_t int8;
typedef int16_t int16;
typedef int32_t int32;
typedef int64_t int64;

typedef uint8_t uint8;
typedef uint16_t uint16;
typedef uint32_t uint32;
typedef uint64_t uint64;

static constexpr uint16 kuint16max = std::numeric_limits<uint16>::max();
static constexpr uint32 kuint32max = std::numeric_limits<uint32>::max();
static constexpr uint64 kuint64max = std::numeric_limits<uint64>::max();
static constexpr int32 kint32max = std::numeric_limits<int32>::max();
static constexpr int64 kint64max = std::numeric_limits<int64>::max();
