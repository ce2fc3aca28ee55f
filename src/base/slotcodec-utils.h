// base/slotcodec-utils.h

// Copyright 2009-2011  Ondrej Glembek;  Microsoft Corporation;
//                      Saarland University;  Karel Vesely;  Yanmin Qian
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

#ifndef SLOTCODEC_BASE_SLOTCODEC_UTILS_H_
#define SLOTCODEC_BASE_SLOTCODEC_UTILS_H_ 1

#include <limits>
#include <string>

namespace slotcodec {

// CharToString prints the character in a human-readable form, for debugging
// and for error messages about malformed input.
std::string CharToString(const char &c);

}  // namespace slotcodec

// Makes copy constructor and operator= private.  Same as in compat.h of OpenFst
// toolkit.
#define SLOTCODEC_DISALLOW_COPY_AND_ASSIGN(type)    \
  type(const type&);                  \
  void operator = (const type&)

#define SLOTCODEC_STRTOLL(cur_cstr, end_cstr) strtoll(cur_cstr, end_cstr, 10);

#define SLOTCODEC_STRTOD(cur_cstr, end_cstr) strtod(cur_cstr, end_cstr)

#endif  // SLOTCODEC_BASE_SLOTCODEC_UTILS_H_
