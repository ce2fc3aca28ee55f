// statetrack/slot-value-decoder.h

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

#ifndef SLOTCODEC_STATETRACK_SLOT_VALUE_DECODER_H_
#define SLOTCODEC_STATETRACK_SLOT_VALUE_DECODER_H_

#include <string>
#include <vector>

#include "itf/options-itf.h"
#include "matrix/codec-matrix.h"
#include "statetrack/slot-types.h"

namespace slotcodec {

struct SlotValueDecoderOptions {
  std::string exclude_values;

  SlotValueDecoderOptions() { }

  void Register(OptionsItf *opts) {
    opts->Register("exclude-values", &exclude_values,
                   "Comma-separated values that are left out of the decoded "
                   "state, e.g. \"dontcare\"");
  }
};

/// Turns one value index per slot (the row order of the slot vocabulary) back
/// into a slot -> value dictionary, by looking the index up in the slot's
/// candidate list.  Indices outside the list select its first value.
class SlotValueDecoder {
 public:
  SlotValueDecoder(const Vocabulary &slot_vocab,
                   const SlotValueDecoderOptions &opts);

  /// "value_indices" must have one entry per slot in the vocabulary.
  void Decode(const std::vector<int32> &value_indices,
              const CandidateSet &candidates, SlotDict *dict) const;

  /// Decodes a [num-slots x max-num-values+2] score matrix by taking the
  /// highest scoring column of each row.
  void Decode(const Matrix<BaseFloat> &scores,
              const CandidateSet &candidates, SlotDict *dict) const;

  /// Batch form; the candidate batch must hold exactly one set and the
  /// output holds exactly one dictionary.
  void Decode(const std::vector<int32> &value_indices,
              const std::vector<CandidateSet> &candidates,
              std::vector<SlotDict> *dicts) const;

  bool IsExcluded(const std::string &value) const;

 private:
  const Vocabulary &slot_vocab_;
  std::vector<std::string> exclude_values_;
};

}  // namespace slotcodec

#endif  // SLOTCODEC_STATETRACK_SLOT_VALUE_DECODER_H_
