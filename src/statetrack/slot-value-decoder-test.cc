// statetrack/slot-value-decoder-test.cc

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

#include "statetrack/slot-matrix-builders.h"
#include "statetrack/slot-value-decoder.h"

namespace slotcodec {

static void QuietLogHandler(const LogMessageEnvelope &envelope,
                            const char *message) {
  if (envelope.severity == LogMessageEnvelope::kAssertFailed)
    std::cerr << "ASSERTION_FAILED (" << envelope.func << "():"
              << envelope.file << ':' << envelope.line << ") " << message
              << '\n';
}

// city -> 0, food -> 1.
static void FitSlots(Vocabulary *vocab) {
  std::vector<std::vector<std::string> > batch(1);
  batch[0].push_back("city");
  batch[0].push_back("food");
  vocab->Fit(batch);
}

static CandidateSet ParisCandidates() {
  CandidateSet candidates;
  candidates["city"].push_back("Paris Texas");
  candidates["city"].push_back("London");
  candidates["food"].push_back("steak");
  return candidates;
}

static std::vector<int32> Indices(int32 city, int32 food) {
  std::vector<int32> v(2);
  v[0] = city;
  v[1] = food;
  return v;
}

void UnitTestDecode() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotValueDecoder decoder(slots, SlotValueDecoderOptions());
  CandidateSet candidates = ParisCandidates();
  SlotDict dict;
  decoder.Decode(Indices(1, 0), candidates, &dict);
  SLOTCODEC_ASSERT(dict.size() == 2);
  SLOTCODEC_ASSERT(dict["city"] == "London" && dict["food"] == "steak");

  decoder.Decode(Indices(0, 0), candidates, &dict);
  SLOTCODEC_ASSERT(dict["city"] == "Paris Texas" && dict["food"] == "steak");
}

void UnitTestDecodeClamps() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotValueDecoder decoder(slots, SlotValueDecoderOptions());
  CandidateSet candidates = ParisCandidates();
  SlotDict dict;
  // food has a single candidate; index 1 is out of its range.
  decoder.Decode(Indices(1, 1), candidates, &dict);
  SLOTCODEC_ASSERT(dict["city"] == "London" && dict["food"] == "steak");
  decoder.Decode(Indices(-1, 7), candidates, &dict);
  SLOTCODEC_ASSERT(dict["city"] == "Paris Texas" && dict["food"] == "steak");
  decoder.Decode(Indices(2, 0), candidates, &dict);
  SLOTCODEC_ASSERT(dict["city"] == "Paris Texas");
}

void UnitTestDecodeExcludes() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotValueDecoderOptions opts;
  opts.exclude_values = "dontcare,steak";
  SlotValueDecoder decoder(slots, opts);
  SLOTCODEC_ASSERT(decoder.IsExcluded("dontcare"));
  SLOTCODEC_ASSERT(!decoder.IsExcluded("London"));
  SlotDict dict;
  decoder.Decode(Indices(1, 0), ParisCandidates(), &dict);
  SLOTCODEC_ASSERT(dict.size() == 1 && dict["city"] == "London");
}

void UnitTestDecodeScores() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotValueDecoder decoder(slots, SlotValueDecoderOptions());
  Matrix<BaseFloat> scores(2, 4);
  scores(0, 1) = 0.9;
  scores(0, 3) = 0.2;
  scores(1, 2) = 0.1;  // beyond the single food candidate: clamps to 0.
  SlotDict dict;
  decoder.Decode(scores, ParisCandidates(), &dict);
  SLOTCODEC_ASSERT(dict["city"] == "London" && dict["food"] == "steak");
}

// Building a score matrix from a state and decoding it gives the state back.
void UnitTestRoundTrip() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotsValuesMatrixBuilderOptions opts;
  opts.max_num_values = 3;
  SlotsValuesMatrixBuilder builder(slots, opts);
  SlotValueDecoder decoder(slots, SlotValueDecoderOptions());
  CandidateSet candidates = ParisCandidates();
  candidates["food"].push_back("fish");
  candidates["food"].push_back("curry");
  for (size_t c = 0; c < candidates["city"].size(); c++) {
    for (size_t f = 0; f < candidates["food"].size(); f++) {
      SlotDict state;
      state["city"] = candidates["city"][c];
      state["food"] = candidates["food"][f];
      Matrix<BaseFloat> mat;
      builder.Build(state, candidates, &mat);
      SlotDict decoded;
      decoder.Decode(mat, candidates, &decoded);
      SLOTCODEC_ASSERT(decoded == state);
    }
  }
}

void UnitTestDecodeErrors() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotValueDecoder decoder(slots, SlotValueDecoderOptions());
  CandidateSet candidates = ParisCandidates();
  SlotDict dict;
  std::vector<SlotDict> dicts;

  std::vector<CandidateSet> batch(1, candidates);
  decoder.Decode(Indices(1, 0), batch, &dicts);
  SLOTCODEC_ASSERT(dicts.size() == 1 && dicts[0]["city"] == "London");

  batch.push_back(candidates);
  try {
    decoder.Decode(Indices(0, 0), batch, &dicts);
    SLOTCODEC_ERR << "Expected UnsupportedBatchShapeError.";
  } catch (const UnsupportedBatchShapeError &e) { }

  try {
    decoder.Decode(std::vector<int32>(3, 0), candidates, &dict);
    SLOTCODEC_ERR << "Expected an error for a wrong length.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("one value index")
                     != std::string::npos);
  }

  candidates["food"].clear();
  try {
    decoder.Decode(Indices(0, 0), candidates, &dict);
    SLOTCODEC_ERR << "Expected CandidateMismatchError.";
  } catch (const CandidateMismatchError &e) { }
  candidates.erase("food");
  try {
    decoder.Decode(Indices(0, 0), candidates, &dict);
    SLOTCODEC_ERR << "Expected CandidateMismatchError.";
  } catch (const CandidateMismatchError &e) { }
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestDecode();
  UnitTestDecodeClamps();
  UnitTestDecodeExcludes();
  UnitTestDecodeScores();
  UnitTestRoundTrip();
  UnitTestDecodeErrors();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
