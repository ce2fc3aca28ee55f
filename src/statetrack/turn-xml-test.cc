// statetrack/turn-xml-test.cc

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

namespace slotcodec {

static void QuietLogHandler(const LogMessageEnvelope &envelope,
                            const char *message) {
  if (envelope.severity == LogMessageEnvelope::kAssertFailed)
    std::cerr << "ASSERTION_FAILED (" << envelope.func << "():"
              << envelope.file << ':' << envelope.line << ") " << message
              << '\n';
}

static const char *kDialogue =
    "<dialogue>\n"
    " <turn id=\"t1\">\n"
    "  <utt id=\"t1-a\"><tk tag=\"O\">I</tk><tk>want</tk>"
    "<tk tag=\"B-city\">Paris</tk><tk tag=\"I-city\"> Texas </tk></utt>\n"
    "  <utt><tk tag=\"B-food\">steak</tk></utt>\n"
    "  <candidates>\n"
    "   <slot name=\"city\"><value>Paris Texas</value><value>London</value>"
    "</slot>\n"
    "   <slot name=\"food\"><value>steak</value></slot>\n"
    "  </candidates>\n"
    "  <slots><slot name=\"city\" value=\"Paris Texas\" score=\"0.5\"/>"
    "<slot name=\"food\" value=\"steak\"/></slots>\n"
    "  <acts><act name=\"inform\"><slot name=\"city\"/></act>"
    "<act name=\"bye\"/></acts>\n"
    " </turn>\n"
    " <turn id=\"t2\"/>\n"
    "</dialogue>\n";

static void Load(const char *xml, pugi::xml_document *doc) {
  std::istringstream is(xml);
  LoadDialogueDocument(is, doc);
}

void UnitTestReadTurns() {
  pugi::xml_document doc;
  Load(kDialogue, &doc);
  std::vector<DialogueTurn> turns;
  ReadTurns(doc, &turns);
  SLOTCODEC_ASSERT(turns.size() == 2);
  const DialogueTurn &turn = turns[0];
  SLOTCODEC_ASSERT(turn.id == "t1");
  SLOTCODEC_ASSERT(turn.utterance_ids.size() == 2);
  SLOTCODEC_ASSERT(turn.utterance_ids[0] == "t1-a");
  SLOTCODEC_ASSERT(turn.utterance_ids[1] == "t1-2");
  SLOTCODEC_ASSERT(turn.tokens[0].size() == 4 && turn.tokens[0][3] == "Texas");
  SLOTCODEC_ASSERT(turn.tags[0][1] == "O" && turn.tags[0][3] == "I-city");
  SLOTCODEC_ASSERT(turn.tags[1].size() == 1 && turn.tags[1][0] == "B-food");
  SLOTCODEC_ASSERT(turn.candidates.size() == 1);
  const CandidateSet &candidates = turn.candidates[0];
  SLOTCODEC_ASSERT(candidates.size() == 2);
  SLOTCODEC_ASSERT(candidates.find("city")->second.size() == 2);
  SLOTCODEC_ASSERT(candidates.find("city")->second[1] == "London");
  SLOTCODEC_ASSERT(turn.slots.size() == 1 && turn.slots[0].size() == 2);
  SLOTCODEC_ASSERT(turn.slots[0][0].value == "Paris Texas");
  SLOTCODEC_ASSERT(turn.slots[0][0].score == 0.5);
  SLOTCODEC_ASSERT(turn.slots[0][1].score == 1.0);
  SLOTCODEC_ASSERT(turn.actions.size() == 1 && turn.actions[0].size() == 2);
  SLOTCODEC_ASSERT(turn.actions[0][0].act == "inform");
  SLOTCODEC_ASSERT(turn.actions[0][0].slots.size() == 1);
  SLOTCODEC_ASSERT(turn.actions[0][1].slots.empty());

  SLOTCODEC_ASSERT(turns[1].id == "t2" && turns[1].tokens.empty());
  SLOTCODEC_ASSERT(turns[1].candidates.empty());

  SLOTCODEC_ASSERT(TurnBatchKey(turn, 0, 1) == "t1");
  SLOTCODEC_ASSERT(TurnBatchKey(turn, 1, 2) == "t1-2");
}

void UnitTestWriteState() {
  pugi::xml_document doc;
  Load(kDialogue, &doc);
  pugi::xml_node turn = doc.document_element().child("turn");
  SlotDict state;
  state["city"] = "London";
  WriteTurnState(state, turn);
  state["food"] = "steak";
  WriteTurnState(state, turn);

  std::ostringstream os;
  doc.save(os, "", pugi::format_raw);
  pugi::xml_document doc2;
  Load(os.str().c_str(), &doc2);
  pugi::xml_node turn2 = doc2.document_element().child("turn");
  SLOTCODEC_ASSERT(turn2.child("state").next_sibling("state").empty());
  pugi::xml_node slot = turn2.child("state").child("slot");
  SLOTCODEC_ASSERT(std::string(slot.attribute("name").value()) == "city");
  SLOTCODEC_ASSERT(std::string(slot.attribute("value").value()) == "London");
  slot = slot.next_sibling("slot");
  SLOTCODEC_ASSERT(std::string(slot.attribute("value").value()) == "steak");
  SLOTCODEC_ASSERT(slot.next_sibling("slot").empty());

  // the state is not turn data.
  std::vector<DialogueTurn> turns;
  ReadTurns(doc2, &turns);
  SLOTCODEC_ASSERT(turns[0].utterance_ids.size() == 2);
}

void UnitTestMalformed() {
  const char *bad[] = {
    "<dialogue><turn id=\"t1\"",
    "<turns><turn id=\"t1\"/></turns>",
    "<dialogue><turn/></dialogue>",
    "<dialogue><turn id=\"t 1\"/></dialogue>",
    "<dialogue><turn id=\"t1\"><utt><tk tag=\"O\"> </tk></utt></turn>"
    "</dialogue>",
    "<dialogue><turn id=\"t1\"><slots><slot name=\"a\" value=\"b\" "
    "score=\"high\"/></slots></turn></dialogue>",
    "<dialogue><turn id=\"t1\"><acts><act/></acts></turn></dialogue>",
  };
  for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
    try {
      pugi::xml_document doc;
      Load(bad[i], &doc);
      std::vector<DialogueTurn> turns;
      ReadTurns(doc, &turns);
      SLOTCODEC_ERR << "Expected FormatError for " << bad[i];
    } catch (const FormatError &e) { }
  }
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestReadTurns();
  UnitTestWriteState();
  UnitTestMalformed();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
