// vocab/action-vocabulary.h

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

#ifndef SLOTCODEC_VOCAB_ACTION_VOCABULARY_H_
#define SLOTCODEC_VOCAB_ACTION_VOCABULARY_H_

#include <string>
#include <vector>

#include "base/slotcodec-common.h"
#include "vocab/vocabulary.h"

namespace slotcodec {

/// A system action and the slots it affects, e.g. {act: "inform",
/// slots: ["city"]}.
struct ActionRecord {
  std::string act;
  std::vector<std::string> slots;

  ActionRecord() { }
  explicit ActionRecord(const std::string &act): act(act) { }
  ActionRecord(const std::string &act, const std::vector<std::string> &slots):
      act(act), slots(slots) { }
};

/// Vocabulary over action names.  Fitting and lookup accept structured action
/// records and use only their action name.
class ActionVocabulary: public Vocabulary {
 public:
  explicit ActionVocabulary(const VocabularyOptions &opts = VocabularyOptions())
      : Vocabulary(opts) { }

  /// Fits over the action names of all records of all batches.
  void FitActions(const std::vector<std::vector<ActionRecord> > &batches);

  /// Flattens one level of batching and outputs one index per record.
  /// Unknown actions are an UnknownActionError unless an unk token is set.
  void LookupActions(const std::vector<std::vector<ActionRecord> > &batch,
                     std::vector<int32> *indices) const;

  /// Same, for batches of plain action names.
  void LookupActions(const std::vector<std::vector<std::string> > &batch,
                     std::vector<int32> *indices) const;

  int32 ActionIndex(const std::string &act) const;

  int32 ActionIndex(const ActionRecord &record) const {
    return ActionIndex(record.act);
  }
};

}  // namespace slotcodec

#endif  // SLOTCODEC_VOCAB_ACTION_VOCABULARY_H_
