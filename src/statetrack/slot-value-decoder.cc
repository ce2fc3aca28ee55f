// statetrack/slot-value-decoder.cc

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

#include "statetrack/slot-value-decoder.h"
#include "util/text-utils.h"

namespace slotcodec {

SlotValueDecoder::SlotValueDecoder(const Vocabulary &slot_vocab,
                                   const SlotValueDecoderOptions &opts):
    slot_vocab_(slot_vocab) {
  SplitStringToVector(opts.exclude_values, ",", true, &exclude_values_);
}

bool SlotValueDecoder::IsExcluded(const std::string &value) const {
  return std::find(exclude_values_.begin(), exclude_values_.end(), value) !=
      exclude_values_.end();
}

void SlotValueDecoder::Decode(const std::vector<int32> &value_indices,
                              const CandidateSet &candidates,
                              SlotDict *dict) const {
  SLOTCODEC_ASSERT(dict != NULL);
  if (static_cast<int32>(value_indices.size()) != slot_vocab_.Size())
    SLOTCODEC_ERR << "Expected one value index per slot (" << slot_vocab_.Size()
                  << "), got " << value_indices.size();
  dict->clear();
  for (size_t s = 0; s < value_indices.size(); s++) {
    std::string slot = slot_vocab_.Name(s);
    CandidateSet::const_iterator it = candidates.find(slot);
    if (it == candidates.end())
      SLOTCODEC_THROW(CandidateMismatchError)
          << "slot `" << slot << "` is not in candidates";
    const std::vector<std::string> &values = it->second;
    if (values.empty())
      SLOTCODEC_THROW(CandidateMismatchError)
          << "slot `" << slot << "` has no candidate values";
    int32 index = value_indices[s];
    if (index < 0 || index >= static_cast<int32>(values.size())) {
      SLOTCODEC_VLOG(2) << "Value index " << index << " of slot `" << slot
                        << "` is out of range, using 0";
      index = 0;
    }
    if (!IsExcluded(values[index]))
      (*dict)[slot] = values[index];
  }
}

void SlotValueDecoder::Decode(const Matrix<BaseFloat> &scores,
                              const CandidateSet &candidates,
                              SlotDict *dict) const {
  std::vector<int32> value_indices(scores.NumRows());
  for (MatrixIndexT r = 0; r < scores.NumRows(); r++)
    scores.RowMax(r, &value_indices[r]);
  Decode(value_indices, candidates, dict);
}

void SlotValueDecoder::Decode(const std::vector<int32> &value_indices,
                              const std::vector<CandidateSet> &candidates,
                              std::vector<SlotDict> *dicts) const {
  SLOTCODEC_ASSERT(dicts != NULL);
  const CandidateSet &single = SingleCandidateSet(candidates);
  dicts->resize(1);
  Decode(value_indices, single, &((*dicts)[0]));
}

}  // namespace slotcodec
