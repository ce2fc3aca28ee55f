// statetrackbin/build-slot-token-matrices.cc

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
#include "util/text-archive.h"
#include "statetrack/slot-matrix-builders.h"
#include "statetrack/turn-xml.h"

int main(int argc, char *argv[]) {
  using namespace slotcodec;
  try {
    const char *usage =
        "Build one [num-slots x num-tokens] matrix per utterance from its BIO\n"
        "tags.  With --use-candidates=true the tokens of each slot span hold\n"
        "the position of the span text among the turn's candidates plus one;\n"
        "otherwise the first token of each span is marked with 1.\n"
        "Usage: build-slot-token-matrices [options] <turns-xml> "
        "<matrix-ark-out>\n"
        "e.g.: build-slot-token-matrices --slot-vocab=slots.txt train.xml "
        "slot_tokens.ark\n";

    ParseOptions po(usage);
    VocabularyOptions slot_opts;
    std::string slot_vocab_rxfilename;
    bool use_candidates = true;
    slot_opts.Register("slot", &po);
    po.Register("slot-vocab", &slot_vocab_rxfilename,
                "Slot vocabulary, as an OpenFst text symbol table (required)");
    po.Register("use-candidates", &use_candidates,
                "If true, output candidate indices instead of a presence mask");
    po.Read(argc, argv);

    if (po.NumArgs() != 2 || slot_vocab_rxfilename.empty()) {
      po.PrintUsage();
      exit(1);
    }

    std::string turns_rxfilename = po.GetArg(1),
        matrix_wxfilename = po.GetArg(2);

    Vocabulary slot_vocab(slot_opts);
    slot_vocab.ReadText(slot_vocab_rxfilename);
    SlotsTokensMatrixBuilder builder(slot_vocab);

    Input ki(turns_rxfilename);
    pugi::xml_document doc;
    LoadDialogueDocument(ki.Stream(), &doc);
    std::vector<DialogueTurn> turns;
    ReadTurns(doc, &turns);

    Output ko(matrix_wxfilename);
    int64 num_done = 0;
    for (size_t t = 0; t < turns.size(); t++) {
      const DialogueTurn &turn = turns[t];
      if (turn.tokens.empty()) {
        SLOTCODEC_VLOG(1) << "Turn " << turn.id << " has no utterances.";
        continue;
      }
      std::vector<Matrix<BaseFloat> > mats;
      if (use_candidates)
        builder.Build(turn.tokens, turn.tags, turn.candidates, &mats);
      else
        builder.Build(turn.tokens, turn.tags, NULL, &mats);
      for (size_t u = 0; u < mats.size(); u++) {
        WriteMatrixEntry(ko.Stream(), turn.utterance_ids[u], mats[u]);
        num_done++;
      }
    }
    ko.Close();
    SLOTCODEC_LOG << "Wrote " << num_done << " slot-token matrices for "
                  << turns.size() << " turns.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
