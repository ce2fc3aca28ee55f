// statetrack/bio-tags-test.cc

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

#include "statetrack/bio-tags.h"
#include "util/text-utils.h"

namespace slotcodec {

static void QuietLogHandler(const LogMessageEnvelope &envelope,
                            const char *message) {
  if (envelope.severity == LogMessageEnvelope::kAssertFailed)
    std::cerr << "ASSERTION_FAILED (" << envelope.func << "():"
              << envelope.file << ':' << envelope.line << ") " << message
              << '\n';
}

static std::vector<std::string> Split(const char *str) {
  std::vector<std::string> out;
  SplitStringToVector(str, " ", true, &out);
  return out;
}

void UnitTestTagToSlot() {
  std::string slot;
  SLOTCODEC_ASSERT(!TagToSlot("O", &slot));
  SLOTCODEC_ASSERT(TagToSlot("B-city", &slot) && slot == "city");
  SLOTCODEC_ASSERT(TagToSlot("I-price_range", &slot) && slot == "price_range");
  const char *bad[] = { "X-city", "B", "city", "b-city", "o" };
  for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
    try {
      TagToSlot(bad[i], &slot);
      SLOTCODEC_ERR << "Expected FormatError for " << bad[i];
    } catch (const FormatError &e) {
      SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()) ==
                       std::string("Wrong tag format: ") + bad[i]);
    }
  }
}

void UnitTestExtractSpans() {
  std::vector<SlotSpan> spans;
  ExtractSlotSpans(Split("O O O O"), &spans);
  SLOTCODEC_ASSERT(spans.empty());
  ExtractSlotSpans(TagSequence(), &spans);
  SLOTCODEC_ASSERT(spans.empty());

  // "I want Paris Texas food"
  ExtractSlotSpans(Split("O O B-city I-city O"), &spans);
  SLOTCODEC_ASSERT(spans.size() == 1);
  SLOTCODEC_ASSERT(spans[0] == SlotSpan("city", 2, 2));

  ExtractSlotSpans(Split("B-food I-food I-food B-food O B-area"), &spans);
  SLOTCODEC_ASSERT(spans.size() == 3);
  SLOTCODEC_ASSERT(spans[0] == SlotSpan("food", 0, 3));
  SLOTCODEC_ASSERT(spans[1] == SlotSpan("food", 3, 1));
  SLOTCODEC_ASSERT(spans[2] == SlotSpan("area", 5, 1));

  // an I- tag of another slot closes the span and opens a new one.
  ExtractSlotSpans(Split("B-city I-food I-food"), &spans);
  SLOTCODEC_ASSERT(spans.size() == 2);
  SLOTCODEC_ASSERT(spans[0] == SlotSpan("city", 0, 1));
  SLOTCODEC_ASSERT(spans[1] == SlotSpan("food", 1, 2));

  // a lone I- tag opens a span.
  ExtractSlotSpans(Split("O I-city"), &spans);
  SLOTCODEC_ASSERT(spans.size() == 1 && spans[0] == SlotSpan("city", 1, 1));

  try {
    ExtractSlotSpans(Split("O X-city"), &spans);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
}

void UnitTestSpansAreOrdered() {
  const char *tags[] = {
    "B-a I-a B-b I-b I-b O B-a",
    "I-a I-a I-b O O B-c I-c I-a",
    "O O O B-x",
  };
  for (size_t t = 0; t < sizeof(tags) / sizeof(tags[0]); t++) {
    TagSequence seq = Split(tags[t]);
    std::vector<SlotSpan> spans;
    ExtractSlotSpans(seq, &spans);
    int32 end = 0;
    for (size_t i = 0; i < spans.size(); i++) {
      SLOTCODEC_ASSERT(spans[i].length >= 1);
      SLOTCODEC_ASSERT(spans[i].start >= end);
      end = spans[i].start + spans[i].length;
      SLOTCODEC_ASSERT(end <= static_cast<int32>(seq.size()));
    }
  }
}

void UnitTestDelexicalize() {
  Delexicalizer delex;
  TokenSequence out;
  delex.Delexicalize(Split("I want Chinese food"), Split("O O B-food O"), &out);
  SLOTCODEC_ASSERT(out == Split("I want #food food"));

  std::vector<TokenSequence> utts, outs;
  std::vector<TagSequence> tags;
  utts.push_back(Split("in Paris Texas please"));
  tags.push_back(Split("O B-city I-city O"));
  utts.push_back(TokenSequence());
  tags.push_back(TagSequence());
  delex.Delexicalize(utts, tags, &outs);
  SLOTCODEC_ASSERT(outs.size() == 2);
  SLOTCODEC_ASSERT(outs[0] == Split("in #city #city please"));
  SLOTCODEC_ASSERT(outs[1].empty());

  try {
    delex.Delexicalize(Split("a b"), Split("O"), &out);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
  tags.pop_back();
  try {
    delex.Delexicalize(utts, tags, &outs);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
  try {
    delex.Delexicalize(Split("a"), Split("X-a"), &out);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestTagToSlot();
  UnitTestExtractSpans();
  UnitTestSpansAreOrdered();
  UnitTestDelexicalize();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
