// util/text-archive.cc

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

#include <cctype>

#include "util/text-archive.h"
#include "util/text-utils.h"

namespace slotcodec {

static void CheckKey(const std::string &key) {
  if (IsToken(key)) return;
  if (key.empty())
    SLOTCODEC_THROW(FormatError) << "Empty archive key";
  for (size_t i = 0; i < key.size(); i++) {
    unsigned char c = key[i];
    if ((!isprint(c) || isspace(c)) && (isascii(c) || c == 255))
      SLOTCODEC_THROW(FormatError) << "Invalid archive key \"" << key
                                   << "\": " << CharToString(key[i])
                                   << " at position " << i;
  }
  SLOTCODEC_THROW(FormatError) << "Invalid archive key \"" << key << "\"";
}

void WriteMatrixEntry(std::ostream &os, const std::string &key,
                      const Matrix<BaseFloat> &mat) {
  CheckKey(key);
  os << key;  // Matrix::Write() starts with a space.
  mat.Write(os);
}

bool ReadMatrixEntry(std::istream &is, std::string *key,
                     Matrix<BaseFloat> *mat) {
  SLOTCODEC_ASSERT(key != NULL && mat != NULL);
  if (!(is >> *key)) return false;
  CheckKey(*key);
  mat->Read(is);
  return true;
}

void WriteIntVectorEntry(std::ostream &os, const std::string &key,
                         const std::vector<int32> &vec) {
  CheckKey(key);
  os << key;
  for (size_t i = 0; i < vec.size(); i++)
    os << ' ' << vec[i];
  os << '\n';
}

bool ReadIntVectorEntry(std::istream &is, std::string *key,
                        std::vector<int32> *vec) {
  SLOTCODEC_ASSERT(key != NULL && vec != NULL);
  std::string line;
  while (std::getline(is, line)) {
    std::vector<std::string> fields;
    SplitStringToVector(line, " \t\r", true, &fields);
    if (fields.empty()) continue;
    *key = fields[0];
    vec->resize(fields.size() - 1);
    for (size_t i = 1; i < fields.size(); i++)
      if (!ConvertStringToInteger(fields[i], &((*vec)[i - 1])))
        SLOTCODEC_THROW(FormatError) << "Bad integer \"" << fields[i]
                                     << "\" for key " << *key;
    return true;
  }
  return false;
}

}  // namespace slotcodec
