// statetrack/slot-types.cc

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

#include "statetrack/slot-types.h"

namespace slotcodec {

void SlotDictToRecords(const SlotDict &dict,
                       std::vector<SlotValueRecord> *records) {
  SLOTCODEC_ASSERT(records != NULL);
  records->clear();
  for (SlotDict::const_iterator it = dict.begin(); it != dict.end(); ++it)
    records->push_back(SlotValueRecord(it->first, it->second));
}

const CandidateSet &SingleCandidateSet(const std::vector<CandidateSet> &batch) {
  if (batch.size() != 1)
    SLOTCODEC_THROW(UnsupportedBatchShapeError)
        << "not implemented for candidates with length > 1 (got "
        << batch.size() << " candidate sets)";
  return batch[0];
}

int32 CandidatePosition(const CandidateSet &candidates,
                        const std::string &slot, const std::string &value) {
  CandidateSet::const_iterator it = candidates.find(slot);
  if (it == candidates.end())
    SLOTCODEC_THROW(CandidateMismatchError)
        << "slot `" << slot << "` is not in candidates";
  const std::vector<std::string> &values = it->second;
  for (size_t i = 0; i < values.size(); i++)
    if (values[i] == value) return static_cast<int32>(i);
  return -1;
}

int32 SlotRow(const Vocabulary &slot_vocab, const std::string &slot) {
  if (!slot_vocab.Contains(slot))
    SLOTCODEC_THROW(UnknownSlotError)
        << "slot `" << slot << "` is not in the slot vocabulary";
  return slot_vocab.Index(slot);
}

}  // namespace slotcodec
