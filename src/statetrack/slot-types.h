// statetrack/slot-types.h

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

#ifndef SLOTCODEC_STATETRACK_SLOT_TYPES_H_
#define SLOTCODEC_STATETRACK_SLOT_TYPES_H_

#include <map>
#include <string>
#include <vector>

#include "base/slotcodec-common.h"
#include "vocab/vocabulary.h"
#include "vocab/action-vocabulary.h"

namespace slotcodec {

/// Tokens of one utterance, and the BIO tags parallel to them.
typedef std::vector<std::string> TokenSequence;
typedef std::vector<std::string> TagSequence;

/// A maximal run of tokens tagged with one slot: B-<slot> (or a lone
/// I-<slot>) followed by I-<slot> tags.
struct SlotSpan {
  std::string slot;
  int32 start;
  int32 length;

  SlotSpan(): start(0), length(0) { }
  SlotSpan(const std::string &slot, int32 start, int32 length):
      slot(slot), start(start), length(length) { }

  bool operator == (const SlotSpan &other) const {
    return slot == other.slot && start == other.start &&
        length == other.length;
  }
};

/// Legal values of each slot for the current turn; the position of a value
/// in its list is the value index used by the matrices.
typedef std::map<std::string, std::vector<std::string> > CandidateSet;

/// A slot value with a belief score.
struct SlotValueRecord {
  std::string slot;
  std::string value;
  BaseFloat score;

  SlotValueRecord(): score(1.0) { }
  SlotValueRecord(const std::string &slot, const std::string &value,
                  BaseFloat score = 1.0):
      slot(slot), value(value), score(score) { }
};

/// Dialogue state: slot -> value.
typedef std::map<std::string, std::string> SlotDict;

/// Converts a dictionary to records with score 1.0, in key order.
void SlotDictToRecords(const SlotDict &dict,
                       std::vector<SlotValueRecord> *records);

/// Candidate sets only come one per turn.  Returns the single set of the
/// batch, or throws UnsupportedBatchShapeError if the batch does not hold
/// exactly one.
const CandidateSet &SingleCandidateSet(const std::vector<CandidateSet> &batch);

/// Position of "value" in the candidate list of "slot", or -1 if the value is
/// not listed.  Throws CandidateMismatchError if the slot has no entry.
int32 CandidatePosition(const CandidateSet &candidates,
                        const std::string &slot, const std::string &value);

/// Row index of "slot" in the slot vocabulary; throws UnknownSlotError for
/// slots outside it, even if the vocabulary has an unk token.
int32 SlotRow(const Vocabulary &slot_vocab, const std::string &slot);

}  // namespace slotcodec

#endif  // SLOTCODEC_STATETRACK_SLOT_TYPES_H_
