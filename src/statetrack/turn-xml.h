// statetrack/turn-xml.h

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

#ifndef SLOTCODEC_STATETRACK_TURN_XML_H_
#define SLOTCODEC_STATETRACK_TURN_XML_H_

#include <iostream>
#include <string>
#include <vector>

#include <pugixml.hpp>

#include "statetrack/slot-types.h"

namespace slotcodec {

/// The contents of one <turn> element of a dialogue document:
///
///  <dialogue>
///    <turn id="t1">
///      <utt id="t1-u1"><tk tag="O">I</tk><tk tag="B-city">Paris</tk></utt>
///      <candidates><slot name="city"><value>Paris</value></slot></candidates>
///      <slots><slot name="city" value="Paris" score="0.7"/></slots>
///      <acts><act name="inform"><slot name="city"/></act></acts>
///    </turn>
///  </dialogue>
///
/// Every <utt>, <slots> and <acts> element is one entry of the corresponding
/// batch, and every <candidates> element one candidate set.
struct DialogueTurn {
  std::string id;
  std::vector<std::string> utterance_ids;
  std::vector<TokenSequence> tokens;
  std::vector<TagSequence> tags;
  std::vector<CandidateSet> candidates;
  std::vector<std::vector<SlotValueRecord> > slots;
  std::vector<std::vector<ActionRecord> > actions;
};

/// Parses an XML document from a stream; throws FormatError on parse errors.
void LoadDialogueDocument(std::istream &is, pugi::xml_document *doc);

/// Reads one <turn> element.  Missing tag attributes mean "O", missing utt ids
/// default to "<turn-id>-<n>" and missing scores to 1.0.
void ReadTurn(const pugi::xml_node &turn_node, DialogueTurn *turn);

/// Reads all turns under the <dialogue> root element, in document order.
void ReadTurns(const pugi::xml_document &doc, std::vector<DialogueTurn> *turns);

/// Replaces the <state> child of "turn_node" by
/// <state><slot name="..." value="..."/>...</state>.
void WriteTurnState(const SlotDict &state, pugi::xml_node turn_node);

/// Archive key of entry "index" of a per-turn batch of "size" entries:
/// the turn id if the batch has one entry, "<turn-id>-<index+1>" otherwise.
std::string TurnBatchKey(const DialogueTurn &turn, size_t index, size_t size);

}  // namespace slotcodec

#endif  // SLOTCODEC_STATETRACK_TURN_XML_H_
