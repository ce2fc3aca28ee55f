// statetrack/slot-matrix-builders.h

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

#ifndef SLOTCODEC_STATETRACK_SLOT_MATRIX_BUILDERS_H_
#define SLOTCODEC_STATETRACK_SLOT_MATRIX_BUILDERS_H_

#include <string>
#include <vector>

#include "itf/options-itf.h"
#include "matrix/codec-matrix.h"
#include "statetrack/slot-types.h"

namespace slotcodec {

/// Builds one [num-slots x num-tokens] matrix per utterance from its BIO tags.
/// Without candidates the matrix is a presence mask: the first token of each
/// slot span is set to 1.  With candidates, every token of a span holds the
/// position of the span's text in the slot's candidate list, plus one, so
/// that zero still means "no slot here".
class SlotsTokensMatrixBuilder {
 public:
  explicit SlotsTokensMatrixBuilder(const Vocabulary &slot_vocab);

  /// "candidates" may be NULL, which requests the presence mask.  A span whose
  /// slot or text is not among the candidates is a CandidateMismatchError.
  void Build(const TokenSequence &tokens, const TagSequence &tags,
             const CandidateSet *candidates, Matrix<BaseFloat> *mat) const;

  void Build(const std::vector<TokenSequence> &utterances,
             const std::vector<TagSequence> &tags,
             const CandidateSet *candidates,
             std::vector<Matrix<BaseFloat> > *mats) const;

  /// Batch of candidate sets; only batches of exactly one set are supported.
  void Build(const std::vector<TokenSequence> &utterances,
             const std::vector<TagSequence> &tags,
             const std::vector<CandidateSet> &candidates,
             std::vector<Matrix<BaseFloat> > *mats) const;

 private:
  const Vocabulary &slot_vocab_;
};


struct SlotsValuesMatrixBuilderOptions {
  int32 max_num_values;

  SlotsValuesMatrixBuilderOptions(): max_num_values(-1) { }

  void Register(OptionsItf *opts) {
    opts->Register("max-num-values", &max_num_values,
                   "Maximum number of candidate values of a slot; the "
                   "matrices get max-num-values + 2 columns (required)");
  }
};

/// Builds one [num-slots x max-num-values+2] score matrix per utterance.  The
/// score of each slot value goes to the column of the value's position in the
/// slot's candidate list; values that are not candidates go to column 0.
class SlotsValuesMatrixBuilder {
 public:
  SlotsValuesMatrixBuilder(const Vocabulary &slot_vocab,
                           const SlotsValuesMatrixBuilderOptions &opts);

  int32 NumCols() const { return opts_.max_num_values + 2; }

  void Build(const std::vector<SlotValueRecord> &records,
             const CandidateSet &candidates, Matrix<BaseFloat> *mat) const;

  /// Each entry of the dictionary has score 1.0.
  void Build(const SlotDict &dict, const CandidateSet &candidates,
             Matrix<BaseFloat> *mat) const;

  void Build(const std::vector<std::vector<SlotValueRecord> > &batch,
             const CandidateSet &candidates,
             std::vector<Matrix<BaseFloat> > *mats) const;

  void Build(const std::vector<std::vector<SlotValueRecord> > &batch,
             const std::vector<CandidateSet> &candidates,
             std::vector<Matrix<BaseFloat> > *mats) const;

 private:
  int32 ValueColumn(const CandidateSet &candidates,
                    const SlotValueRecord &record) const;

  const Vocabulary &slot_vocab_;
  SlotsValuesMatrixBuilderOptions opts_;
};


/// Builds one binary [num-slots x num-actions] matrix per utterance, with a 1
/// for every (slot, action) pair that appears in its action records.
class SlotsActionsMatrixBuilder {
 public:
  SlotsActionsMatrixBuilder(const Vocabulary &slot_vocab,
                            const ActionVocabulary &action_vocab):
      slot_vocab_(slot_vocab), action_vocab_(action_vocab) { }

  void Build(const std::vector<ActionRecord> &actions,
             Matrix<BaseFloat> *mat) const;

  void Build(const std::vector<std::vector<ActionRecord> > &batch,
             std::vector<Matrix<BaseFloat> > *mats) const;

 private:
  const Vocabulary &slot_vocab_;
  const ActionVocabulary &action_vocab_;
};

}  // namespace slotcodec

#endif  // SLOTCODEC_STATETRACK_SLOT_MATRIX_BUILDERS_H_
