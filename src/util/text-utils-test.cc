// util/text-utils-test.cc

// Copyright 2009-2011     Microsoft Corporation
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

#include "base/slotcodec-common.h"
#include "util/text-utils.h"

namespace slotcodec {

void TestSplitStringToVector() {
  std::vector<std::string> str_vec;
  SplitStringToVector("", " ", false, &str_vec);
  SLOTCODEC_ASSERT(str_vec.size() == 1);  // If this fails it may just mean
  // that someone changed the
  // semantics of SplitStringToVector in a reasonable way.
  SplitStringToVector("", " ", true, &str_vec);
  SLOTCODEC_ASSERT(str_vec.empty());
  SplitStringToVector(". ", " ", false, &str_vec);
  SLOTCODEC_ASSERT(str_vec.size() == 2);
  SplitStringToVector(". ", " ", true, &str_vec);
  SLOTCODEC_ASSERT(str_vec.size() == 1);
  SplitStringToVector("food,,area", ",", true, &str_vec);
  SLOTCODEC_ASSERT(str_vec.size() == 2 && str_vec[1] == "area");
  SplitStringToVector("food,,area", ",", false, &str_vec);
  SLOTCODEC_ASSERT(str_vec.size() == 3 && str_vec[1] == "");
}

void TestJoinVectorToString() {
  std::vector<std::string> str_vec;
  std::string tmp;
  JoinVectorToString(str_vec, " ", true, &tmp);
  SLOTCODEC_ASSERT(tmp == "");
  str_vec.push_back("Paris");
  str_vec.push_back("Texas");
  JoinVectorToString(str_vec, " ", false, &tmp);
  SLOTCODEC_ASSERT(tmp == "Paris Texas");
  str_vec.push_back("");
  str_vec.push_back("USA");
  JoinVectorToString(str_vec, " ", true, &tmp);
  SLOTCODEC_ASSERT(tmp == "Paris Texas USA");
  JoinVectorToString(str_vec, " ", false, &tmp);
  SLOTCODEC_ASSERT(tmp == "Paris Texas  USA");
}

void TestConvertStringToInteger() {
  int32 i;
  SLOTCODEC_ASSERT(ConvertStringToInteger("12345", &i) && i == 12345);
  SLOTCODEC_ASSERT(ConvertStringToInteger("-12345", &i) && i == -12345);
  char j;
  SLOTCODEC_ASSERT(!ConvertStringToInteger("-12345", &j));  // too big for char.
  SLOTCODEC_ASSERT(ConvertStringToInteger(" -12345 ", &i));  // whitespace accepted
  SLOTCODEC_ASSERT(!ConvertStringToInteger("a ", &i));  // non-integers rejected.
  SLOTCODEC_ASSERT(ConvertStringToInteger("0", &i) && i == 0);
  uint64 k;
  SLOTCODEC_ASSERT(ConvertStringToInteger("12345", &k) && k == 12345);
  SLOTCODEC_ASSERT(!ConvertStringToInteger("-12345", &k));  // unsigned,
                                                            // cannot convert.
}

void TestConvertStringToReal() {
  double d;
  SLOTCODEC_ASSERT(ConvertStringToReal("1", &d) && d == 1.0);
  SLOTCODEC_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  SLOTCODEC_ASSERT(ConvertStringToReal("-1", &d) && d == -1.0);
  SLOTCODEC_ASSERT(ConvertStringToReal(" -1 ", &d) && d == -1.0);
  SLOTCODEC_ASSERT(!ConvertStringToReal("-1 x", &d));
  SLOTCODEC_ASSERT(!ConvertStringToReal("-1f", &d));
  SLOTCODEC_ASSERT(ConvertStringToReal("12e+3", &d) && d == 12000.0);
  float f;
  SLOTCODEC_ASSERT(ConvertStringToReal("0.25", &f) && f == 0.25);
}

void TestTrim() {
  std::string s = " \t slot value \n";
  Trim(&s);
  SLOTCODEC_ASSERT(s == "slot value");
  s = "   ";
  Trim(&s);
  SLOTCODEC_ASSERT(s.empty());
}

void TestIsToken() {
  SLOTCODEC_ASSERT(IsToken("t1-u1"));
  SLOTCODEC_ASSERT(!IsToken(""));
  SLOTCODEC_ASSERT(!IsToken("t1 u1"));
  SLOTCODEC_ASSERT(!IsToken("t1\tu1"));
}

}  // end namespace slotcodec

int main() {
  using namespace slotcodec;
  TestSplitStringToVector();
  TestJoinVectorToString();
  TestConvertStringToInteger();
  TestConvertStringToReal();
  TestTrim();
  TestIsToken();
  std::cout << "Test OK\n";
}
