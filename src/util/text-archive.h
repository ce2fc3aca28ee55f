// util/text-archive.h

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

#ifndef SLOTCODEC_UTIL_TEXT_ARCHIVE_H_
#define SLOTCODEC_UTIL_TEXT_ARCHIVE_H_

#include <iostream>
#include <string>
#include <vector>

#include "base/slotcodec-common.h"
#include "matrix/codec-matrix.h"

namespace slotcodec {

/// Text archives hold one keyed object after another.  A matrix entry is
///   key [
///     1 0 0
///     0 1 0 ]
/// and an integer-vector entry is one line "key i0 i1 ...".  Keys must be
/// tokens (non-empty, no whitespace).

void WriteMatrixEntry(std::ostream &os, const std::string &key,
                      const Matrix<BaseFloat> &mat);

/// Returns false at the end of the stream; throws for a malformed entry.
bool ReadMatrixEntry(std::istream &is, std::string *key,
                     Matrix<BaseFloat> *mat);

void WriteIntVectorEntry(std::ostream &os, const std::string &key,
                         const std::vector<int32> &vec);

/// Blank lines are skipped.  Returns false at the end of the stream.
bool ReadIntVectorEntry(std::istream &is, std::string *key,
                        std::vector<int32> *vec);

}  // namespace slotcodec

#endif  // SLOTCODEC_UTIL_TEXT_ARCHIVE_H_
