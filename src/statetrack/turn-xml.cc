// statetrack/turn-xml.cc

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

#include <sstream>

#include "statetrack/turn-xml.h"
#include "util/text-utils.h"

namespace slotcodec {

static std::string RequiredAttribute(const pugi::xml_node &node,
                                     const char *name) {
  pugi::xml_attribute attr = node.attribute(name);
  if (!attr)
    SLOTCODEC_THROW(FormatError) << "<" << node.name() << "> element at offset "
                                 << node.offset_debug() << " has no \"" << name
                                 << "\" attribute";
  return attr.value();
}

void LoadDialogueDocument(std::istream &is, pugi::xml_document *doc) {
  SLOTCODEC_ASSERT(doc != NULL);
  pugi::xml_parse_result r = doc->load(is, pugi::parse_default,
                                       pugi::encoding_utf8);
  if (!r)
    SLOTCODEC_THROW(FormatError) << "PugiXML Parse Error in Input Stream: "
                                 << r.description() << " Error offset: "
                                 << r.offset;
}

static void ReadUtterance(const pugi::xml_node &utt, const std::string &key,
                          TokenSequence *tokens, TagSequence *tags) {
  for (pugi::xml_node tk = utt.child("tk"); tk; tk = tk.next_sibling("tk")) {
    std::string token = tk.child_value();
    Trim(&token);
    if (token.empty())
      SLOTCODEC_THROW(FormatError) << "Empty token in utterance " << key;
    tokens->push_back(token);
    tags->push_back(tk.attribute("tag").as_string("O"));
  }
}

static void ReadCandidates(const pugi::xml_node &node,
                           CandidateSet *candidates) {
  for (pugi::xml_node slot = node.child("slot"); slot;
       slot = slot.next_sibling("slot")) {
    std::vector<std::string> &values =
        (*candidates)[RequiredAttribute(slot, "name")];
    for (pugi::xml_node value = slot.child("value"); value;
         value = value.next_sibling("value")) {
      std::string text = value.child_value();
      Trim(&text);
      values.push_back(text);
    }
  }
}

static void ReadSlotValues(const pugi::xml_node &node,
                           std::vector<SlotValueRecord> *records) {
  for (pugi::xml_node slot = node.child("slot"); slot;
       slot = slot.next_sibling("slot")) {
    SlotValueRecord record(RequiredAttribute(slot, "name"),
                           RequiredAttribute(slot, "value"));
    pugi::xml_attribute score = slot.attribute("score");
    if (score && !ConvertStringToReal(score.value(), &record.score))
      SLOTCODEC_THROW(FormatError) << "Bad score \"" << score.value()
                                   << "\" for slot " << record.slot;
    records->push_back(record);
  }
}

static void ReadActions(const pugi::xml_node &node,
                        std::vector<ActionRecord> *actions) {
  for (pugi::xml_node act = node.child("act"); act;
       act = act.next_sibling("act")) {
    ActionRecord record(RequiredAttribute(act, "name"));
    for (pugi::xml_node slot = act.child("slot"); slot;
         slot = slot.next_sibling("slot"))
      record.slots.push_back(RequiredAttribute(slot, "name"));
    actions->push_back(record);
  }
}

void ReadTurn(const pugi::xml_node &turn_node, DialogueTurn *turn) {
  SLOTCODEC_ASSERT(turn != NULL);
  *turn = DialogueTurn();
  turn->id = RequiredAttribute(turn_node, "id");
  if (!IsToken(turn->id))
    SLOTCODEC_THROW(FormatError) << "Invalid turn id \"" << turn->id << "\"";
  for (pugi::xml_node child = turn_node.first_child(); child;
       child = child.next_sibling()) {
    std::string name = child.name();
    if (name == "utt") {
      std::ostringstream default_id;
      default_id << turn->id << '-' << (turn->tokens.size() + 1);
      std::string utt_id = child.attribute("id").as_string(
          default_id.str().c_str());
      if (!IsToken(utt_id))
        SLOTCODEC_THROW(FormatError) << "Invalid utterance id \"" << utt_id
                                     << "\"";
      turn->utterance_ids.push_back(utt_id);
      turn->tokens.resize(turn->tokens.size() + 1);
      turn->tags.resize(turn->tags.size() + 1);
      ReadUtterance(child, utt_id, &turn->tokens.back(), &turn->tags.back());
    } else if (name == "candidates") {
      turn->candidates.resize(turn->candidates.size() + 1);
      ReadCandidates(child, &turn->candidates.back());
    } else if (name == "slots") {
      turn->slots.resize(turn->slots.size() + 1);
      ReadSlotValues(child, &turn->slots.back());
    } else if (name == "acts") {
      turn->actions.resize(turn->actions.size() + 1);
      ReadActions(child, &turn->actions.back());
    } else if (name != "state" && !name.empty()) {
      SLOTCODEC_VLOG(1) << "Ignoring <" << name << "> in turn " << turn->id;
    }
  }
}

void ReadTurns(const pugi::xml_document &doc,
               std::vector<DialogueTurn> *turns) {
  SLOTCODEC_ASSERT(turns != NULL);
  turns->clear();
  pugi::xml_node root = doc.document_element();
  if (std::string(root.name()) != "dialogue")
    SLOTCODEC_THROW(FormatError) << "Expected <dialogue> root element, got <"
                                 << root.name() << ">";
  for (pugi::xml_node node = root.child("turn"); node;
       node = node.next_sibling("turn")) {
    turns->resize(turns->size() + 1);
    ReadTurn(node, &turns->back());
  }
}

void WriteTurnState(const SlotDict &state, pugi::xml_node turn_node) {
  while (turn_node.child("state"))
    turn_node.remove_child("state");
  pugi::xml_node state_node = turn_node.append_child("state");
  for (SlotDict::const_iterator it = state.begin(); it != state.end(); ++it) {
    pugi::xml_node slot = state_node.append_child("slot");
    slot.append_attribute("name").set_value(it->first.c_str());
    slot.append_attribute("value").set_value(it->second.c_str());
  }
}

std::string TurnBatchKey(const DialogueTurn &turn, size_t index, size_t size) {
  if (size == 1) return turn.id;
  std::ostringstream key;
  key << turn.id << '-' << (index + 1);
  return key.str();
}

}  // namespace slotcodec
