// statetrack/bio-tags.cc

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

namespace slotcodec {

bool TagToSlot(const std::string &tag, std::string *slot) {
  if (tag == "O") return false;
  if (tag.size() < 2 || (tag.compare(0, 2, "B-") != 0 &&
                         tag.compare(0, 2, "I-") != 0))
    SLOTCODEC_THROW(FormatError) << "Wrong tag format: " << tag;
  *slot = tag.substr(2);
  return true;
}

void ExtractSlotSpans(const TagSequence &tags, std::vector<SlotSpan> *spans) {
  SLOTCODEC_ASSERT(spans != NULL);
  spans->clear();
  size_t n = tags.size(), i = 0;
  std::string slot;
  while (i < n) {
    if (!TagToSlot(tags[i], &slot)) {
      i++;
      continue;
    }
    std::string inside = "I-" + slot;
    size_t length = 1;
    while (i + length < n && tags[i + length] == inside)
      length++;
    spans->push_back(SlotSpan(slot, i, length));
    i += length;
  }
}

void CheckTokensAndTags(const TokenSequence &tokens, const TagSequence &tags) {
  if (tokens.size() != tags.size())
    SLOTCODEC_THROW(FormatError) << "Utterance has " << tokens.size()
                                 << " tokens but " << tags.size() << " tags";
}

void Delexicalizer::Delexicalize(const TokenSequence &tokens,
                                 const TagSequence &tags,
                                 TokenSequence *out) const {
  SLOTCODEC_ASSERT(out != NULL);
  CheckTokensAndTags(tokens, tags);
  out->resize(tokens.size());
  std::string slot;
  for (size_t i = 0; i < tokens.size(); i++) {
    if (TagToSlot(tags[i], &slot))
      (*out)[i] = "#" + slot;
    else
      (*out)[i] = tokens[i];
  }
}

void Delexicalizer::Delexicalize(const std::vector<TokenSequence> &utterances,
                                 const std::vector<TagSequence> &tags,
                                 std::vector<TokenSequence> *out) const {
  SLOTCODEC_ASSERT(out != NULL);
  if (utterances.size() != tags.size())
    SLOTCODEC_THROW(FormatError) << "Got " << utterances.size()
                                 << " utterances but " << tags.size()
                                 << " tag sequences";
  out->resize(utterances.size());
  for (size_t i = 0; i < utterances.size(); i++)
    Delexicalize(utterances[i], tags[i], &((*out)[i]));
}

}  // namespace slotcodec
