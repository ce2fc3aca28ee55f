// statetrack/bio-tags.h

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

#ifndef SLOTCODEC_STATETRACK_BIO_TAGS_H_
#define SLOTCODEC_STATETRACK_BIO_TAGS_H_

#include <string>
#include <vector>

#include "statetrack/slot-types.h"

namespace slotcodec {

/// Returns false for the "O" tag.  Otherwise the tag must start with "B-" or
/// "I-"; the rest is written to "slot" and true is returned.  Any other tag
/// is a FormatError.
bool TagToSlot(const std::string &tag, std::string *slot);

/// Splits a tag sequence into slot spans, left to right.  A span is opened by
/// any non-O tag and continues while the following tags are literally
/// "I-<slot>".  The spans come out ordered by start and do not overlap.
void ExtractSlotSpans(const TagSequence &tags, std::vector<SlotSpan> *spans);

/// Replaces every slot-tagged token by "#<slot>", e.g.
/// "I want Chinese food" with tags "O O B-food O" becomes
/// "I want #food food".
class Delexicalizer {
 public:
  Delexicalizer() { }

  void Delexicalize(const TokenSequence &tokens, const TagSequence &tags,
                    TokenSequence *out) const;

  /// Batch version; utterances and tags must have the same shape.
  void Delexicalize(const std::vector<TokenSequence> &utterances,
                    const std::vector<TagSequence> &tags,
                    std::vector<TokenSequence> *out) const;
};

/// Throws FormatError unless tokens and tags are parallel.
void CheckTokensAndTags(const TokenSequence &tokens, const TagSequence &tags);

}  // namespace slotcodec

#endif  // SLOTCODEC_STATETRACK_BIO_TAGS_H_
