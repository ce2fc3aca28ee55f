// vocab/vocabulary-test.cc

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

#include <cstdio>

#include "util/text-utils.h"
#include "vocab/vocabulary.h"
#include "vocab/action-vocabulary.h"

namespace slotcodec {

// The error paths below log before throwing; only assertion failures are
// worth seeing.
static void QuietLogHandler(const LogMessageEnvelope &envelope,
                            const char *message) {
  if (envelope.severity == LogMessageEnvelope::kAssertFailed)
    std::cerr << "ASSERTION_FAILED (" << envelope.func << "():"
              << envelope.file << ':' << envelope.line << ") " << message
              << '\n';
}

static std::vector<std::vector<std::string> > MakeBatch(
    const char *first, const char *second) {
  std::vector<std::vector<std::string> > batch(2);
  SplitStringToVector(first, " ", true, &batch[0]);
  SplitStringToVector(second, " ", true, &batch[1]);
  return batch;
}

void UnitTestFitOrder() {
  Vocabulary vocab;
  // counts: food 3, area 2, city 2, price 1; area is seen before city.
  vocab.Fit(MakeBatch("food area food", "city area city food price"));
  SLOTCODEC_ASSERT(vocab.Size() == 4);
  SLOTCODEC_ASSERT(vocab.Index("food") == 0);
  SLOTCODEC_ASSERT(vocab.Index("area") == 1);
  SLOTCODEC_ASSERT(vocab.Index("city") == 2);
  SLOTCODEC_ASSERT(vocab.Index("price") == 3);
  SLOTCODEC_ASSERT(vocab.Name(2) == "city");
  SLOTCODEC_ASSERT(vocab.Contains("price"));
  SLOTCODEC_ASSERT(!vocab.Contains("name"));
  std::vector<std::string> names = vocab.Names();
  SLOTCODEC_ASSERT(names.size() == 4 && names[3] == "price");

  // refitting rebuilds from scratch.
  vocab.Fit(MakeBatch("name", ""));
  SLOTCODEC_ASSERT(vocab.Size() == 1);
  SLOTCODEC_ASSERT(!vocab.Contains("food"));
  SLOTCODEC_ASSERT(vocab.Index("name") == 0);
}

void UnitTestFitOptions() {
  VocabularyOptions opts;
  opts.special_tokens = "<pad>,<unk>";
  opts.unk_token = "<unk>";
  opts.min_freq = 2;
  Vocabulary vocab(opts);
  vocab.Fit(MakeBatch("food area food <unk>", "city area price"));
  // special tokens first, price and city dropped by min-freq.
  SLOTCODEC_ASSERT(vocab.Size() == 4);
  SLOTCODEC_ASSERT(vocab.Index("<pad>") == 0);
  SLOTCODEC_ASSERT(vocab.Index("<unk>") == 1);
  SLOTCODEC_ASSERT(vocab.Index("food") == 2);
  SLOTCODEC_ASSERT(vocab.Index("area") == 3);
  SLOTCODEC_ASSERT(vocab.HasUnkToken());
  SLOTCODEC_ASSERT(vocab.Index("price") == 1);
  SLOTCODEC_ASSERT(!vocab.Contains("price"));

  VocabularyOptions opts2;
  opts2.max_tokens = 2;
  Vocabulary vocab2(opts2);
  vocab2.Fit(MakeBatch("a b b c c c", "d"));
  SLOTCODEC_ASSERT(vocab2.Size() == 2);
  SLOTCODEC_ASSERT(vocab2.Index("c") == 0 && vocab2.Index("b") == 1);
}

void UnitTestLookup() {
  Vocabulary vocab;
  vocab.Fit(MakeBatch("city food", ""));
  std::vector<std::vector<std::string> > names(2);
  names[0].push_back("food");
  names[1].push_back("city");
  names[1].push_back("food");
  std::vector<std::vector<int32> > indices;
  vocab.Lookup(names, &indices);
  SLOTCODEC_ASSERT(indices.size() == 2);
  SLOTCODEC_ASSERT(indices[0].size() == 1 && indices[0][0] == 1);
  SLOTCODEC_ASSERT(indices[1].size() == 2 && indices[1][0] == 0 &&
                   indices[1][1] == 1);
  std::vector<std::vector<std::string> > names2;
  vocab.Lookup(indices, &names2);
  SLOTCODEC_ASSERT(names2 == names);

  try {
    vocab.Index("area");
    SLOTCODEC_ERR << "Expected UnknownNameError.";
  } catch (const UnknownNameError &e) { }
  try {
    vocab.Name(2);
    SLOTCODEC_ERR << "Expected UnknownNameError.";
  } catch (const UnknownNameError &e) { }
  try {
    vocab.Name(-1);
    SLOTCODEC_ERR << "Expected UnknownNameError.";
  } catch (const UnknownNameError &e) { }
}

void UnitTestReadWrite() {
  std::string filename = "tmp.slotcodec.symtab";
  Vocabulary vocab;
  vocab.Fit(MakeBatch("city food area", "area"));
  vocab.WriteText(filename);
  Vocabulary vocab2;
  vocab2.ReadText(filename);
  SLOTCODEC_ASSERT(vocab2.Names() == vocab.Names());
  std::remove(filename.c_str());

  // keys must be dense.
  {
    std::ofstream os(filename.c_str());
    os << "city\t0\nfood\t2\n";
  }
  try {
    vocab2.ReadText(filename);
    SLOTCODEC_ERR << "Expected an error for a sparse symbol table.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("not dense")
                     != std::string::npos);
  }
  std::remove(filename.c_str());
}

void UnitTestActionVocabulary() {
  std::vector<std::vector<ActionRecord> > batches(2);
  std::vector<std::string> city(1, "city");
  batches[0].push_back(ActionRecord("inform", city));
  batches[0].push_back(ActionRecord("request", city));
  batches[1].push_back(ActionRecord("inform"));
  ActionVocabulary vocab;
  vocab.FitActions(batches);
  SLOTCODEC_ASSERT(vocab.Size() == 2);
  SLOTCODEC_ASSERT(vocab.ActionIndex("inform") == 0);
  SLOTCODEC_ASSERT(vocab.ActionIndex(ActionRecord("request")) == 1);

  std::vector<int32> indices;
  vocab.LookupActions(batches, &indices);
  SLOTCODEC_ASSERT(indices.size() == 3);
  SLOTCODEC_ASSERT(indices[0] == 0 && indices[1] == 1 && indices[2] == 0);

  std::vector<std::vector<std::string> > names(1);
  names[0].push_back("request");
  names[0].push_back("inform");
  vocab.LookupActions(names, &indices);
  SLOTCODEC_ASSERT(indices.size() == 2 && indices[0] == 1 && indices[1] == 0);

  std::vector<std::vector<int32> > reverse(1, indices);
  std::vector<std::vector<std::string> > decoded;
  vocab.Lookup(reverse, &decoded);
  SLOTCODEC_ASSERT(decoded == names);

  try {
    vocab.ActionIndex("bye");
    SLOTCODEC_ERR << "Expected UnknownActionError.";
  } catch (const UnknownActionError &e) { }
}

}  // namespace slotcodec

int main() {
  using namespace slotcodec;
  SetLogHandler(QuietLogHandler);
  UnitTestFitOrder();
  UnitTestFitOptions();
  UnitTestLookup();
  UnitTestReadWrite();
  UnitTestActionVocabulary();
  SetLogHandler(NULL);
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
