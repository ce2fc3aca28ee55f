// statetrack/slot-matrix-builders.cc

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
#include "statetrack/bio-tags.h"
#include "util/text-utils.h"

namespace slotcodec {

SlotsTokensMatrixBuilder::SlotsTokensMatrixBuilder(
    const Vocabulary &slot_vocab): slot_vocab_(slot_vocab) {
  std::string names;
  JoinVectorToString(slot_vocab_.Names(), " ", false, &names);
  SLOTCODEC_LOG << "Found vocabulary with the following slot names: " << names;
}

void SlotsTokensMatrixBuilder::Build(const TokenSequence &tokens,
                                     const TagSequence &tags,
                                     const CandidateSet *candidates,
                                     Matrix<BaseFloat> *mat) const {
  SLOTCODEC_ASSERT(mat != NULL);
  CheckTokensAndTags(tokens, tags);
  std::vector<SlotSpan> spans;
  ExtractSlotSpans(tags, &spans);
  mat->Resize(slot_vocab_.Size(), tags.size());
  for (size_t i = 0; i < spans.size(); i++) {
    const SlotSpan &span = spans[i];
    if (candidates != NULL) {
      std::vector<std::string> words(tokens.begin() + span.start,
                                     tokens.begin() + span.start + span.length);
      std::string value;
      JoinVectorToString(words, " ", false, &value);
      int32 pos = CandidatePosition(*candidates, span.slot, value);
      if (pos < 0)
        SLOTCODEC_THROW(CandidateMismatchError)
            << "value `" << value << "` of slot `" << span.slot
            << "` is not in candidates";
      int32 row = SlotRow(slot_vocab_, span.slot);
      mat->SetRowRange(row, span.start, span.length, pos + 1);
    } else {
      int32 row = SlotRow(slot_vocab_, span.slot);
      (*mat)(row, span.start) = 1.0;
    }
  }
}

void SlotsTokensMatrixBuilder::Build(
    const std::vector<TokenSequence> &utterances,
    const std::vector<TagSequence> &tags,
    const CandidateSet *candidates,
    std::vector<Matrix<BaseFloat> > *mats) const {
  SLOTCODEC_ASSERT(mats != NULL);
  if (utterances.size() != tags.size())
    SLOTCODEC_THROW(FormatError) << "Got " << utterances.size()
                                 << " utterances but " << tags.size()
                                 << " tag sequences";
  mats->resize(utterances.size());
  for (size_t i = 0; i < utterances.size(); i++)
    Build(utterances[i], tags[i], candidates, &((*mats)[i]));
}

void SlotsTokensMatrixBuilder::Build(
    const std::vector<TokenSequence> &utterances,
    const std::vector<TagSequence> &tags,
    const std::vector<CandidateSet> &candidates,
    std::vector<Matrix<BaseFloat> > *mats) const {
  Build(utterances, tags, &SingleCandidateSet(candidates), mats);
}


SlotsValuesMatrixBuilder::SlotsValuesMatrixBuilder(
    const Vocabulary &slot_vocab, const SlotsValuesMatrixBuilderOptions &opts):
    slot_vocab_(slot_vocab), opts_(opts) {
  if (opts_.max_num_values < 0)
    SLOTCODEC_ERR << "--max-num-values must be set to a non-negative value, "
                  << "got " << opts_.max_num_values;
}

int32 SlotsValuesMatrixBuilder::ValueColumn(
    const CandidateSet &candidates, const SlotValueRecord &record) const {
  int32 pos = CandidatePosition(candidates, record.slot, record.value);
  if (pos < 0) {
    SLOTCODEC_VLOG(2) << "Value `" << record.value << "` of slot `"
                      << record.slot << "` is not a candidate, using column 0";
    return 0;
  }
  if (pos >= NumCols())
    SLOTCODEC_ERR << "Value `" << record.value << "` is candidate " << pos
                  << " of slot `" << record.slot << "`, which does not fit in "
                  << NumCols() << " columns; increase --max-num-values";
  return pos;
}

void SlotsValuesMatrixBuilder::Build(
    const std::vector<SlotValueRecord> &records,
    const CandidateSet &candidates, Matrix<BaseFloat> *mat) const {
  SLOTCODEC_ASSERT(mat != NULL);
  mat->Resize(slot_vocab_.Size(), NumCols());
  for (size_t i = 0; i < records.size(); i++) {
    int32 row = SlotRow(slot_vocab_, records[i].slot),
        col = ValueColumn(candidates, records[i]);
    (*mat)(row, col) = records[i].score;
  }
}

void SlotsValuesMatrixBuilder::Build(const SlotDict &dict,
                                     const CandidateSet &candidates,
                                     Matrix<BaseFloat> *mat) const {
  std::vector<SlotValueRecord> records;
  SlotDictToRecords(dict, &records);
  Build(records, candidates, mat);
}

void SlotsValuesMatrixBuilder::Build(
    const std::vector<std::vector<SlotValueRecord> > &batch,
    const CandidateSet &candidates,
    std::vector<Matrix<BaseFloat> > *mats) const {
  SLOTCODEC_ASSERT(mats != NULL);
  mats->resize(batch.size());
  for (size_t i = 0; i < batch.size(); i++)
    Build(batch[i], candidates, &((*mats)[i]));
}

void SlotsValuesMatrixBuilder::Build(
    const std::vector<std::vector<SlotValueRecord> > &batch,
    const std::vector<CandidateSet> &candidates,
    std::vector<Matrix<BaseFloat> > *mats) const {
  Build(batch, SingleCandidateSet(candidates), mats);
}


void SlotsActionsMatrixBuilder::Build(const std::vector<ActionRecord> &actions,
                                      Matrix<BaseFloat> *mat) const {
  SLOTCODEC_ASSERT(mat != NULL);
  mat->Resize(slot_vocab_.Size(), action_vocab_.Size());
  for (size_t i = 0; i < actions.size(); i++) {
    int32 col = action_vocab_.ActionIndex(actions[i]);
    for (size_t j = 0; j < actions[i].slots.size(); j++) {
      int32 row = SlotRow(slot_vocab_, actions[i].slots[j]);
      (*mat)(row, col) = 1.0;
    }
  }
}

void SlotsActionsMatrixBuilder::Build(
    const std::vector<std::vector<ActionRecord> > &batch,
    std::vector<Matrix<BaseFloat> > *mats) const {
  SLOTCODEC_ASSERT(mats != NULL);
  mats->resize(batch.size());
  for (size_t i = 0; i < batch.size(); i++)
    Build(batch[i], &((*mats)[i]));
}

}  // namespace slotcodec
