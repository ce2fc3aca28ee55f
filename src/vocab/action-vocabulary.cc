// vocab/action-vocabulary.cc

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

#include "vocab/action-vocabulary.h"

namespace slotcodec {

void ActionVocabulary::FitActions(
    const std::vector<std::vector<ActionRecord> > &batches) {
  std::vector<std::vector<std::string> > names(1);
  for (size_t i = 0; i < batches.size(); i++)
    for (size_t j = 0; j < batches[i].size(); j++)
      names[0].push_back(batches[i][j].act);
  Fit(names);
}

int32 ActionVocabulary::ActionIndex(const std::string &act) const {
  if (!Contains(act) && !HasUnkToken())
    SLOTCODEC_THROW(UnknownActionError) << "Action '" << act
                                        << "' is not in the action vocabulary.";
  return Index(act);
}

void ActionVocabulary::LookupActions(
    const std::vector<std::vector<ActionRecord> > &batch,
    std::vector<int32> *indices) const {
  SLOTCODEC_ASSERT(indices != NULL);
  indices->clear();
  for (size_t i = 0; i < batch.size(); i++)
    for (size_t j = 0; j < batch[i].size(); j++)
      indices->push_back(ActionIndex(batch[i][j]));
}

void ActionVocabulary::LookupActions(
    const std::vector<std::vector<std::string> > &batch,
    std::vector<int32> *indices) const {
  SLOTCODEC_ASSERT(indices != NULL);
  indices->clear();
  for (size_t i = 0; i < batch.size(); i++)
    for (size_t j = 0; j < batch[i].size(); j++)
      indices->push_back(ActionIndex(batch[i][j]));
}

}  // namespace slotcodec
