// statetrackbin/decode-slot-values.cc

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

#include <map>

#include "base/slotcodec-common.h"
#include "util/parse-options.h"
#include "util/slotcodec-io.h"
#include "util/text-archive.h"
#include "statetrack/slot-value-decoder.h"
#include "statetrack/turn-xml.h"

int main(int argc, char *argv[]) {
  using namespace slotcodec;
  try {
    const char *usage =
        "Decode per-slot value indices back into a dialogue state and write it\n"
        "as a <state> element into each turn of the document.  The input holds\n"
        "one line \"<turn-id> <index-slot-0> <index-slot-1> ...\" per turn, or\n"
        "with --from-scores=true one score matrix per turn, in which case the\n"
        "best column of each row is taken.\n"
        "Usage: decode-slot-values [options] <turns-xml> <indices-in> "
        "<turns-xml-out>\n"
        "e.g.: decode-slot-values --slot-vocab=slots.txt "
        "--exclude-values=dontcare dev.xml indices.txt dev_state.xml\n";

    ParseOptions po(usage);
    VocabularyOptions slot_opts;
    SlotValueDecoderOptions decoder_opts;
    std::string slot_vocab_rxfilename;
    bool from_scores = false, pretty = false;
    slot_opts.Register("slot", &po);
    decoder_opts.Register(&po);
    po.Register("slot-vocab", &slot_vocab_rxfilename,
                "Slot vocabulary, as an OpenFst text symbol table (required)");
    po.Register("from-scores", &from_scores,
                "If true, the input is an archive of score matrices");
    po.Register("pretty", &pretty,
                "Output XML with tabbing and line breaks to make it readable");
    po.Read(argc, argv);

    if (po.NumArgs() != 3 || slot_vocab_rxfilename.empty()) {
      po.PrintUsage();
      exit(1);
    }

    std::string turns_rxfilename = po.GetArg(1),
        indices_rxfilename = po.GetArg(2),
        turns_wxfilename = po.GetArg(3);

    Vocabulary slot_vocab(slot_opts);
    slot_vocab.ReadText(slot_vocab_rxfilename);
    SlotValueDecoder decoder(slot_vocab, decoder_opts);

    pugi::xml_document doc;
    {
      Input ki(turns_rxfilename);
      LoadDialogueDocument(ki.Stream(), &doc);
    }
    std::vector<DialogueTurn> turns;
    ReadTurns(doc, &turns);
    std::map<std::string, size_t> turn_index;
    for (size_t t = 0; t < turns.size(); t++)
      turn_index[turns[t].id] = t;
    std::vector<pugi::xml_node> turn_nodes;
    for (pugi::xml_node node = doc.document_element().child("turn"); node;
         node = node.next_sibling("turn"))
      turn_nodes.push_back(node);
    SLOTCODEC_ASSERT(turn_nodes.size() == turns.size());

    int64 num_done = 0, num_err = 0;
    Input ii(indices_rxfilename);
    std::string key;
    std::vector<int32> indices;
    Matrix<BaseFloat> scores;
    while (from_scores ? ReadMatrixEntry(ii.Stream(), &key, &scores)
           : ReadIntVectorEntry(ii.Stream(), &key, &indices)) {
      std::map<std::string, size_t>::const_iterator it = turn_index.find(key);
      if (it == turn_index.end()) {
        SLOTCODEC_WARN << "No turn " << key << " in the document.";
        num_err++;
        continue;
      }
      const DialogueTurn &turn = turns[it->second];
      SlotDict state;
      if (from_scores) {
        decoder.Decode(scores, SingleCandidateSet(turn.candidates), &state);
      } else {
        std::vector<SlotDict> states;
        decoder.Decode(indices, turn.candidates, &states);
        state = states[0];
      }
      WriteTurnState(state, turn_nodes[it->second]);
      num_done++;
    }

    Output ko(turns_wxfilename);
    if (!pretty)
      doc.save(ko.Stream(), "", pugi::format_raw);
    else
      doc.save(ko.Stream(), "\t");
    ko.Close();
    SLOTCODEC_LOG << "Decoded the state of " << num_done << " turns, "
                  << num_err << " with errors.";
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
