// statetrackbin/delexicalize-turns.cc

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
#include "util/text-utils.h"
#include "statetrack/bio-tags.h"
#include "statetrack/turn-xml.h"

int main(int argc, char *argv[]) {
  using namespace slotcodec;
  try {
    const char *usage =
        "Replace the slot-tagged tokens of every utterance by \"#<slot>\" and\n"
        "write one line \"<utt-id> <token> <token> ...\" per utterance.\n"
        "Usage: delexicalize-turns [options] <turns-xml> <text-out>\n"
        "e.g.: delexicalize-turns train.xml - | head\n";

    ParseOptions po(usage);
    po.Read(argc, argv);

    if (po.NumArgs() != 2) {
      po.PrintUsage();
      exit(1);
    }

    std::string turns_rxfilename = po.GetArg(1),
        text_wxfilename = po.GetArg(2);

    Input ki(turns_rxfilename);
    pugi::xml_document doc;
    LoadDialogueDocument(ki.Stream(), &doc);
    std::vector<DialogueTurn> turns;
    ReadTurns(doc, &turns);

    Output ko(text_wxfilename);
    Delexicalizer delexicalizer;
    int64 num_utts = 0;
    for (size_t t = 0; t < turns.size(); t++) {
      std::vector<TokenSequence> delexicalized;
      delexicalizer.Delexicalize(turns[t].tokens, turns[t].tags,
                                 &delexicalized);
      for (size_t u = 0; u < delexicalized.size(); u++) {
        std::string line;
        JoinVectorToString(delexicalized[u], " ", false, &line);
        ko.Stream() << turns[t].utterance_ids[u];
        if (!line.empty()) ko.Stream() << ' ' << line;
        ko.Stream() << '\n';
        num_utts++;
      }
    }
    ko.Close();
    SLOTCODEC_LOG << "Delexicalized " << num_utts << " utterances of "
                  << turns.size() << " turns.";
    return 0;
  } catch(const std::exception &e) {
    std::cerr << e.what() << '\n';
    return -1;
  }
}
