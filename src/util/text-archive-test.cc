// util/text-archive-test.cc

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

#include <sstream>

#include "util/text-archive.h"

namespace slotcodec {

static void QuietLogHandler(const LogMessageEnvelope &envelope,
                            const char *message) {
  if (envelope.severity == LogMessageEnvelope::kAssertFailed)
    std::cerr << "ASSERTION_FAILED (" << envelope.func << "():"
              << envelope.file << ':' << envelope.line << ") " << message
              << '\n';
}

void UnitTestMatrixEntries() {
  Matrix<BaseFloat> a(2, 3), b;
  a(0, 1) = 2.0;
  a(1, 2) = 0.5;
  std::ostringstream os;
  WriteMatrixEntry(os, "t1-1", a);
  WriteMatrixEntry(os, "t1-2", b);
  SLOTCODEC_ASSERT(os.str().compare(0, 7, "t1-1 [\n") == 0);

  std::istringstream is(os.str());
  std::string key;
  Matrix<BaseFloat> m;
  SLOTCODEC_ASSERT(ReadMatrixEntry(is, &key, &m));
  SLOTCODEC_ASSERT(key == "t1-1" && m.ApproxEqual(a));
  SLOTCODEC_ASSERT(ReadMatrixEntry(is, &key, &m));
  SLOTCODEC_ASSERT(key == "t1-2" && m.NumRows() == 0);
  SLOTCODEC_ASSERT(!ReadMatrixEntry(is, &key, &m));

  try {
    WriteMatrixEntry(os, "two words", a);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
  std::istringstream bad("t1 [\n 1 x\n ]\n");
  try {
    ReadMatrixEntry(bad, &key, &m);
    SLOTCODEC_ERR << "Expected an error for a bad number.";
  } catch (const SlotCodecFatalError &e) { }
}

void UnitTestIntVectorEntries() {
  std::vector<int32> v;
  v.push_back(1);
  v.push_back(0);
  std::ostringstream os;
  WriteIntVectorEntry(os, "t1", v);
  WriteIntVectorEntry(os, "t2", std::vector<int32>());
  SLOTCODEC_ASSERT(os.str() == "t1 1 0\nt2\n");

  std::istringstream is("t1 1 0\n\n  t2 -1\t3 \n");
  std::string key;
  std::vector<int32> w;
  SLOTCODEC_ASSERT(ReadIntVectorEntry(is, &key, &w));
  SLOTCODEC_ASSERT(key == "t1" && w == v);
  SLOTCODEC_ASSERT(ReadIntVectorEntry(is, &key, &w));
  SLOTCODEC_ASSERT(key == "t2" && w.size() == 2 && w[0] == -1 && w[1] == 3);
  SLOTCODEC_ASSERT(!ReadIntVectorEntry(is, &key, &w));

  std::istringstream bad("t1 1 one\n");
  try {
    ReadIntVectorEntry(bad, &key, &w);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestMatrixEntries();
  UnitTestIntVectorEntries();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
