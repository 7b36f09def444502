// Copyright 2017, Beeri 15.  All rights reserved.
//
#pragma once

#include <glog/logging.h>
