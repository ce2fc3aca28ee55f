// base/slotcodec-common.h

// Copyright 2009-2011  Microsoft Corporation
// Copyright 2026  slotcodec authors

// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//  http://www.apache.org/licenses/LICENSE-2.0
//
// THIS CODE IS PROVIDED *AS IS* BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
// KIND, EITHER EXPRESS OR IMPLIED, INCLUDING WITHOUT LIMITATION ANY IMPLIED
// WARRANTIES OR CONDITIONS OF TITLE, FITNESS FOR A PARTICULAR PURPOSE,
// MERCHANTABLITY OR NON-INFRINGEMENT.
// See the Apache 2 License for the specific language governing permissions and
// limitations under the License.

#ifndef SLOTCODEC_BASE_SLOTCODEC_COMMON_H_
#define SLOTCODEC_BASE_SLOTCODEC_COMMON_H_ 1

#include <cstddef>
#include <cstdlib>
#include <cstring>  // C string stuff like strcpy
#include <string>
#include <sstream>
#include <stdexcept>
#include <cassert>
#include <vector>
#include <iostream>
#include <fstream>

#include "base/slotcodec-utils.h"
#include "base/slotcodec-error.h"
#include "base/slotcodec-types.h"
#include "base/slotcodec-math.h"

#endif  // SLOTCODEC_BASE_SLOTCODEC_COMMON_H_
