// base/slotcodec-error-test.cc

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

#include <algorithm>

#include "base/slotcodec-common.h"

namespace slotcodec {

static std::vector<std::string> captured_messages;
static std::vector<int> captured_severities;
static std::vector<std::string> captured_files;

void CapturingLogHandler(const LogMessageEnvelope &envelope,
                         const char *message) {
  captured_severities.push_back(envelope.severity);
  captured_messages.push_back(message);
  captured_files.push_back(envelope.file);
}

void MyFunction2() { SLOTCODEC_ERR << "Ignore this error"; }

void MyFunction1() { MyFunction2(); }

void UnitTestError() {
  {
    std::cerr << "Ignore next error:\n";
    MyFunction1();
  }
}

void UnitTestTypedErrors() {
  LogHandler old_handler = SetLogHandler(CapturingLogHandler);
  captured_messages.clear();
  captured_severities.clear();
  try {
    SLOTCODEC_THROW(FormatError) << "Wrong tag format: X-city";
    SLOTCODEC_ASSERT(0);
  } catch (const FormatError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()) ==
                     "Wrong tag format: X-city");
    SLOTCODEC_ASSERT(std::string(e.what()) == "slotcodec::FormatError");
  }
  // Every typed error is also the generic fatal error.
  try {
    SLOTCODEC_THROW(UnknownSlotError) << "slot 'area'";
    SLOTCODEC_ASSERT(0);
  } catch (const UnknownNameError &e) {
    SLOTCODEC_ASSERT(std::string(e.what()) == "slotcodec::UnknownSlotError");
  }
  try {
    SLOTCODEC_THROW(UnsupportedBatchShapeError) << "batch of 2";
    SLOTCODEC_ASSERT(0);
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()) == "batch of 2");
  }
  try {
    SLOTCODEC_THROW(CandidateMismatchError) << "value";
    SLOTCODEC_ASSERT(0);
  } catch (const std::runtime_error &e) {
    // caught through the standard base class.
  }
  SLOTCODEC_ASSERT(captured_messages.size() == 4);
  for (size_t i = 0; i < captured_severities.size(); i++)
    SLOTCODEC_ASSERT(captured_severities[i] == LogMessageEnvelope::kError);
  SetLogHandler(old_handler);
}

void UnitTestVerboseLogging() {
  LogHandler old_handler = SetLogHandler(CapturingLogHandler);
  captured_messages.clear();
  captured_severities.clear();
  captured_files.clear();
  int32 old_level = GetVerboseLevel();
  SetVerboseLevel(1);
  SLOTCODEC_VLOG(2) << "not shown";
  SLOTCODEC_VLOG(1) << "shown";
  SLOTCODEC_WARN << "warning";
  SLOTCODEC_LOG << "info " << 3;
  SLOTCODEC_ASSERT(captured_messages.size() == 3);
  SLOTCODEC_ASSERT(captured_messages[0] == "shown");
  SLOTCODEC_ASSERT(captured_severities[0] == 1);
  SLOTCODEC_ASSERT(captured_severities[1] == LogMessageEnvelope::kWarning);
  SLOTCODEC_ASSERT(captured_messages[2] == "info 3");
  // file names keep at most one leading directory.
  for (size_t i = 0; i < captured_files.size(); i++) {
    const std::string &file = captured_files[i];
    SLOTCODEC_ASSERT(file.find("slotcodec-error-test.cc") != std::string::npos);
    SLOTCODEC_ASSERT(std::count(file.begin(), file.end(), '/') <= 1);
  }
  SetVerboseLevel(old_level);
  SetLogHandler(old_handler);
}

} // namespace slotcodec

int main() {
  slotcodec::SetProgramName("/foo/bar/slotcodec-error-test");
  try {
    slotcodec::UnitTestError();
    SLOTCODEC_ASSERT(0); // should not happen.
    exit(1);
  } catch (slotcodec::SlotCodecFatalError &e) {
    std::cout << "The error we generated was: '" << e.SlotCodecMessage()
              << "'\n";
  }
  slotcodec::UnitTestTypedErrors();
  slotcodec::UnitTestVerboseLogging();
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
