// statetrack/slot-matrix-builders-test.cc

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

// city -> 0, food -> 1.
static void FitSlots(Vocabulary *vocab) {
  std::vector<std::vector<std::string> > batch(1, Split("city food"));
  vocab->Fit(batch);
}

static CandidateSet ParisCandidates() {
  CandidateSet candidates;
  candidates["city"].push_back("Paris Texas");
  candidates["city"].push_back("London");
  candidates["food"].push_back("steak");
  return candidates;
}

void UnitTestPresenceMatrix() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotsTokensMatrixBuilder builder(slots);
  Matrix<BaseFloat> mat;
  builder.Build(Split("I want Paris Texas steak"),
                Split("O O B-city I-city B-food"), NULL, &mat);
  SLOTCODEC_ASSERT(mat.NumRows() == 2 && mat.NumCols() == 5);
  SLOTCODEC_ASSERT(mat(0, 2) == 1.0 && mat(1, 4) == 1.0);
  SLOTCODEC_ASSERT(mat.Sum() == 2.0);

  builder.Build(Split("hello there"), Split("O O"), NULL, &mat);
  SLOTCODEC_ASSERT(mat.NumRows() == 2 && mat.NumCols() == 2 && mat.IsZero());

  // the slot vocabulary must know the slot.
  try {
    builder.Build(Split("cheap"), Split("B-price"), NULL, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }
  try {
    builder.Build(Split("a b"), Split("O"), NULL, &mat);
    SLOTCODEC_ERR << "Expected FormatError.";
  } catch (const FormatError &e) { }
}

void UnitTestIndexMatrix() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotsTokensMatrixBuilder builder(slots);
  std::vector<CandidateSet> candidates(1, ParisCandidates());
  std::vector<TokenSequence> utts(1, Split("I want Paris Texas"));
  std::vector<TagSequence> tags(1, Split("O O B-city I-city"));
  std::vector<Matrix<BaseFloat> > mats;
  builder.Build(utts, tags, candidates, &mats);
  SLOTCODEC_ASSERT(mats.size() == 1);
  Matrix<BaseFloat> expected(2, 4);
  expected(0, 2) = 1.0;
  expected(0, 3) = 1.0;
  SLOTCODEC_ASSERT(mats[0].ApproxEqual(expected));

  // second candidate gets 2, over every token of the span.
  utts.push_back(Split("London steak"));
  tags.push_back(Split("B-city B-food"));
  builder.Build(utts, tags, &candidates[0], &mats);
  SLOTCODEC_ASSERT(mats.size() == 2);
  SLOTCODEC_ASSERT(mats[1](0, 0) == 2.0 && mats[1](1, 1) == 1.0);
  SLOTCODEC_ASSERT(mats[1].Sum() == 3.0);

  Matrix<BaseFloat> mat;
  try {
    builder.Build(Split("Paris"), Split("B-city"), &candidates[0], &mat);
    SLOTCODEC_ERR << "Expected CandidateMismatchError.";
  } catch (const CandidateMismatchError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("Paris") !=
                     std::string::npos);
  }
  CandidateSet no_food;
  no_food["city"].push_back("London");
  try {
    builder.Build(Split("steak"), Split("B-food"), &no_food, &mat);
    SLOTCODEC_ERR << "Expected CandidateMismatchError.";
  } catch (const CandidateMismatchError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()) ==
                     "slot `food` is not in candidates");
  }
  // candidates are checked before the vocabulary.
  CandidateSet price;
  price["price"].push_back("cheap");
  try {
    builder.Build(Split("cheap"), Split("B-price"), &price, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }

  candidates.push_back(ParisCandidates());
  try {
    builder.Build(utts, tags, candidates, &mats);
    SLOTCODEC_ERR << "Expected UnsupportedBatchShapeError.";
  } catch (const UnsupportedBatchShapeError &e) { }
  candidates.clear();
  try {
    builder.Build(utts, tags, candidates, &mats);
    SLOTCODEC_ERR << "Expected UnsupportedBatchShapeError.";
  } catch (const UnsupportedBatchShapeError &e) { }
}

void UnitTestValueMatrix() {
  Vocabulary slots;
  FitSlots(&slots);
  SlotsValuesMatrixBuilderOptions opts;
  opts.max_num_values = 2;
  SlotsValuesMatrixBuilder builder(slots, opts);
  CandidateSet candidates = ParisCandidates();

  std::vector<SlotValueRecord> records;
  records.push_back(SlotValueRecord("city", "London", 0.75));
  records.push_back(SlotValueRecord("food", "fish", 0.5));
  Matrix<BaseFloat> mat;
  builder.Build(records, candidates, &mat);
  SLOTCODEC_ASSERT(mat.NumRows() == 2 && mat.NumCols() == 4);
  SLOTCODEC_ASSERT(mat(0, 1) == 0.75);
  // not a candidate: column 0.
  SLOTCODEC_ASSERT(mat(1, 0) == 0.5);
  SLOTCODEC_ASSERT(ApproxEqual(mat.Sum(), 1.25));

  // later records overwrite earlier ones.
  records.push_back(SlotValueRecord("city", "London", 0.25));
  builder.Build(records, candidates, &mat);
  SLOTCODEC_ASSERT(mat(0, 1) == 0.25);

  SlotDict dict;
  dict["city"] = "Paris Texas";
  builder.Build(dict, candidates, &mat);
  SLOTCODEC_ASSERT(mat(0, 0) == 1.0 && mat.Sum() == 1.0);

  std::vector<std::vector<SlotValueRecord> > batch(2);
  batch[1] = records;
  std::vector<Matrix<BaseFloat> > mats;
  std::vector<CandidateSet> candidate_batch(1, candidates);
  builder.Build(batch, candidate_batch, &mats);
  SLOTCODEC_ASSERT(mats.size() == 2 && mats[0].IsZero());
  SLOTCODEC_ASSERT(mats[0].NumCols() == 4 && mats[1](0, 1) == 0.25);

  candidate_batch.push_back(candidates);
  try {
    builder.Build(batch, candidate_batch, &mats);
    SLOTCODEC_ERR << "Expected UnsupportedBatchShapeError.";
  } catch (const UnsupportedBatchShapeError &e) { }

  records.clear();
  records.push_back(SlotValueRecord("area", "north"));
  candidates["area"].push_back("north");
  try {
    builder.Build(records, candidates, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }

  records[0] = SlotValueRecord("food", "steak");
  candidates.erase("food");
  try {
    builder.Build(records, candidates, &mat);
    SLOTCODEC_ERR << "Expected CandidateMismatchError.";
  } catch (const CandidateMismatchError &e) { }

  // a candidate position beyond max-num-values + 1 does not fit.
  opts.max_num_values = 0;
  SlotsValuesMatrixBuilder narrow(slots, opts);
  records[0] = SlotValueRecord("city", "c");
  candidates["city"].push_back("b");
  candidates["city"].push_back("c");
  try {
    narrow.Build(records, candidates, &mat);
    SLOTCODEC_ERR << "Expected an error for a candidate that does not fit.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("max-num-values")
                     != std::string::npos);
  }
}

void UnitTestActionMatrix() {
  Vocabulary slots;
  FitSlots(&slots);
  ActionVocabulary acts;
  std::vector<std::vector<ActionRecord> > fit_batch(1);
  fit_batch[0].push_back(ActionRecord("inform"));
  acts.FitActions(fit_batch);
  SlotsActionsMatrixBuilder builder(slots, acts);

  std::vector<ActionRecord> actions;
  actions.push_back(ActionRecord("inform", Split("city")));
  Matrix<BaseFloat> mat;
  builder.Build(actions, &mat);
  SLOTCODEC_ASSERT(mat.NumRows() == 2 && mat.NumCols() == 1);
  SLOTCODEC_ASSERT(mat(0, 0) == 1.0 && mat(1, 0) == 0.0);

  actions.push_back(ActionRecord("inform", Split("food city")));
  std::vector<std::vector<ActionRecord> > batch(2);
  batch[0] = actions;
  std::vector<Matrix<BaseFloat> > mats;
  builder.Build(batch, &mats);
  SLOTCODEC_ASSERT(mats.size() == 2);
  SLOTCODEC_ASSERT(mats[0].Sum() == 2.0 && mats[1].IsZero());

  actions.push_back(ActionRecord("request", Split("city")));
  try {
    builder.Build(actions, &mat);
    SLOTCODEC_ERR << "Expected UnknownActionError.";
  } catch (const UnknownActionError &e) { }
  actions.back() = ActionRecord("inform", Split("area"));
  try {
    builder.Build(actions, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }
}

// Rows belong to real slots; the unk token of the slot vocabulary does not
// apply to the builders.
void UnitTestUnknownSlotWithUnkToken() {
  VocabularyOptions opts;
  opts.special_tokens = "<unk>";
  opts.unk_token = "<unk>";
  Vocabulary slots(opts);
  FitSlots(&slots);
  SLOTCODEC_ASSERT(slots.HasUnkToken() && slots.Index("price") == 0);

  SlotsTokensMatrixBuilder tokens_builder(slots);
  Matrix<BaseFloat> mat;
  try {
    tokens_builder.Build(Split("cheap"), Split("B-price"), NULL, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }
  CandidateSet candidates = ParisCandidates();
  candidates["price"].push_back("cheap");
  try {
    tokens_builder.Build(Split("cheap"), Split("B-price"), &candidates, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }

  SlotsValuesMatrixBuilderOptions value_opts;
  value_opts.max_num_values = 2;
  SlotsValuesMatrixBuilder values_builder(slots, value_opts);
  std::vector<SlotValueRecord> records(1, SlotValueRecord("price", "cheap",
                                                          0.5));
  try {
    values_builder.Build(records, candidates, &mat);
    SLOTCODEC_ERR << "Expected UnknownSlotError.";
  } catch (const UnknownSlotError &e) { }

  // known slots still get their own rows.
  records[0] = SlotValueRecord("city", "London");
  values_builder.Build(records, candidates, &mat);
  SLOTCODEC_ASSERT(mat.NumRows() == 3 && mat(slots.Index("city"), 1) == 1.0);
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestPresenceMatrix();
  UnitTestIndexMatrix();
  UnitTestValueMatrix();
  UnitTestActionMatrix();
  UnitTestUnknownSlotWithUnkToken();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
