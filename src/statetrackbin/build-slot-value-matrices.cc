// statetrackbin/build-slot-value-matrices.cc

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
        "Build one [num-slots x max-num-values+2] score matrix per <slots>\n"
        "element of each turn: the score of each slot value goes to the column\n"
        "of the value's position among the turn's candidates, or to column 0\n"
        "if it is not a candidate.  Keys are the turn id, or <turn-id>-<n>\n"
        "for turns with several <slots> elements.\n"
        "Usage: build-slot-value-matrices [options] <turns-xml> "
        "<matrix-ark-out>\n"
        "e.g.: build-slot-value-matrices --max-num-values=20 "
        "--slot-vocab=slots.txt train.xml slot_values.ark\n";

    ParseOptions po(usage);
    VocabularyOptions slot_opts;
    SlotsValuesMatrixBuilderOptions builder_opts;
    std::string slot_vocab_rxfilename;
    slot_opts.Register("slot", &po);
    builder_opts.Register(&po);
    po.Register("slot-vocab", &slot_vocab_rxfilename,
                "Slot vocabulary, as an OpenFst text symbol table (required)");
    po.Read(argc, argv);

    if (po.NumArgs() != 2 || slot_vocab_rxfilename.empty()) {
      po.PrintUsage();
      exit(1);
    }

    std::string turns_rxfilename = po.GetArg(1),
        matrix_wxfilename = po.GetArg(2);

    Vocabulary slot_vocab(slot_opts);
    slot_vocab.ReadText(slot_vocab_rxfilename);
    SlotsValuesMatrixBuilder builder(slot_vocab, builder_opts);

    Input ki(turns_rxfilename);
    pugi::xml_document doc;
    LoadDialogueDocument(ki.Stream(), &doc);
    std::vector<DialogueTurn> turns;
    ReadTurns(doc, &turns);

    Output ko(matrix_wxfilename);
    int64 num_done = 0, num_skipped = 0;
    for (size_t t = 0; t < turns.size(); t++) {
      const DialogueTurn &turn = turns[t];
      if (turn.slots.empty()) {
        SLOTCODEC_VLOG(1) << "Turn " << turn.id << " has no slot values.";
        num_skipped++;
        continue;
      }
      std::vector<Matrix<BaseFloat> > mats;
      builder.Build(turn.slots, turn.candidates, &mats);
      for (size_t i = 0; i < mats.size(); i++) {
        WriteMatrixEntry(ko.Stream(), TurnBatchKey(turn, i, mats.size()),
                         mats[i]);
        num_done++;
      }
    }
    ko.Close();
    SLOTCODEC_LOG << "Wrote " << num_done << " slot-value matrices; skipped "
                  << num_skipped << " turns without slot values.";
    return (num_done != 0 ? 0 : 1);
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
