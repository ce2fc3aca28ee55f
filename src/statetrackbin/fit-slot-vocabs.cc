// statetrackbin/fit-slot-vocabs.cc

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

#include "base/slotcodec-common.h"
#include "util/parse-options.h"
#include "util/slotcodec-io.h"
#include "statetrack/bio-tags.h"
#include "statetrack/turn-xml.h"

int main(int argc, char *argv[]) {
  using namespace slotcodec;
  try {
    const char *usage =
        "Fit the slot and action vocabularies over a dialogue document.  Slot\n"
        "names are collected from the BIO tags, the candidate sets, the slot\n"
        "values and the actions of every turn; action names from the actions.\n"
        "Both are written as OpenFst text symbol tables.\n"
        "Usage: fit-slot-vocabs [options] <turns-xml> <slot-symtab-out> "
        "<action-symtab-out>\n"
        "e.g.: fit-slot-vocabs --action-special-tokens=<unk> "
        "--action-unk-token=<unk> train.xml slots.txt actions.txt\n";

    ParseOptions po(usage);
    VocabularyOptions slot_opts, action_opts;
    slot_opts.Register("slot", &po);
    action_opts.Register("action", &po);

    po.Read(argc, argv);

    if (po.NumArgs() != 3) {
      po.PrintUsage();
      exit(1);
    }

    std::string turns_rxfilename = po.GetArg(1),
        slot_wxfilename = po.GetArg(2),
        action_wxfilename = po.GetArg(3);

    std::vector<DialogueTurn> turns;
    {
      Input ki(turns_rxfilename);
      pugi::xml_document doc;
      LoadDialogueDocument(ki.Stream(), &doc);
      ReadTurns(doc, &turns);
    }

    // One name sequence per turn, so that first occurrence follows the
    // document order.
    std::vector<std::vector<std::string> > slot_batch(turns.size());
    std::vector<std::vector<ActionRecord> > action_batch;
    for (size_t t = 0; t < turns.size(); t++) {
      const DialogueTurn &turn = turns[t];
      std::vector<std::string> &names = slot_batch[t];
      for (size_t u = 0; u < turn.tags.size(); u++) {
        std::vector<SlotSpan> spans;
        ExtractSlotSpans(turn.tags[u], &spans);
        for (size_t i = 0; i < spans.size(); i++)
          names.push_back(spans[i].slot);
      }
      for (size_t c = 0; c < turn.candidates.size(); c++)
        for (CandidateSet::const_iterator it = turn.candidates[c].begin();
             it != turn.candidates[c].end(); ++it)
          names.push_back(it->first);
      for (size_t s = 0; s < turn.slots.size(); s++)
        for (size_t i = 0; i < turn.slots[s].size(); i++)
          names.push_back(turn.slots[s][i].slot);
      for (size_t a = 0; a < turn.actions.size(); a++) {
        for (size_t i = 0; i < turn.actions[a].size(); i++)
          names.insert(names.end(), turn.actions[a][i].slots.begin(),
                       turn.actions[a][i].slots.end());
        action_batch.push_back(turn.actions[a]);
      }
    }

    Vocabulary slot_vocab(slot_opts);
    slot_vocab.Fit(slot_batch);
    ActionVocabulary action_vocab(action_opts);
    action_vocab.FitActions(action_batch);
    slot_vocab.WriteText(slot_wxfilename);
    action_vocab.WriteText(action_wxfilename);

    SLOTCODEC_LOG << "Fit " << slot_vocab.Size() << " slots and "
                  << action_vocab.Size() << " actions over " << turns.size()
                  << " turns.";
    return (slot_vocab.Size() != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
