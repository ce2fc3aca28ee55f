// vocab/vocabulary.h

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

#ifndef SLOTCODEC_VOCAB_VOCABULARY_H_
#define SLOTCODEC_VOCAB_VOCABULARY_H_

#include <string>
#include <vector>

#include <fst/symbol-table.h>

#include "base/slotcodec-common.h"
#include "itf/options-itf.h"

namespace slotcodec {

struct VocabularyOptions {
  std::string special_tokens;
  std::string unk_token;
  int32 min_freq;
  int32 max_tokens;

  VocabularyOptions(): min_freq(0), max_tokens(-1) { }

  /// "prefix" keeps the options of several vocabularies apart on one command
  /// line, e.g. prefix "slot" registers --slot-min-freq.
  void Register(const std::string &prefix, OptionsItf *opts) {
    opts->Register(prefix + "-special-tokens", &special_tokens,
                   "Comma-separated names that receive the first indices, in "
                   "the order given");
    opts->Register(prefix + "-unk-token", &unk_token,
                   "If set, unknown names map to the index of this name "
                   "instead of being an error (it must be in the vocabulary)");
    opts->Register(prefix + "-min-freq", &min_freq,
                   "Names seen fewer times than this during fitting are "
                   "dropped");
    opts->Register(prefix + "-max-tokens", &max_tokens,
                   "Maximum number of fitted (non-special) names; -1 means "
                   "no limit");
  }
};

/// Closed bijection between names and dense indices [0, Size()).
/// The table is an OpenFst symbol table whose keys are kept dense, so that it
/// can be read and written in the usual symbol-table text format.  Vocabularies
/// are fit or read once and are read-only afterwards; const methods may be
/// called concurrently.
class Vocabulary {
 public:
  explicit Vocabulary(const VocabularyOptions &opts = VocabularyOptions());

  virtual ~Vocabulary();

  /// Rebuilds the vocabulary from a batch of name sequences.  Empty names are
  /// ignored.  Special tokens come first, then names by decreasing count, ties
  /// broken by first occurrence.
  void Fit(const std::vector<std::vector<std::string> > &batch);

  /// Returns the index of "name".  Unknown names map to the unk token if one
  /// is configured, and are an UnknownNameError otherwise.
  int32 Index(const std::string &name) const;

  /// Returns the name with index "index"; UnknownNameError if out of range.
  std::string Name(int32 index) const;

  /// Batch lookup, names to indices.
  void Lookup(const std::vector<std::vector<std::string> > &names,
              std::vector<std::vector<int32> > *indices) const;

  /// Batch lookup, indices to names.
  void Lookup(const std::vector<std::vector<int32> > &indices,
              std::vector<std::vector<std::string> > *names) const;

  bool Contains(const std::string &name) const;

  /// True if unknown names map to a configured unk token.
  bool HasUnkToken() const { return unk_index_ != fst::kNoSymbol; }

  int32 Size() const;

  /// All names in index order.
  std::vector<std::string> Names() const;

  /// Replaces the contents by an OpenFst text symbol table.  The keys in the
  /// file must be exactly 0 .. n-1.
  void ReadText(const std::string &filename);

  void WriteText(const std::string &filename) const;

 private:
  void ResolveUnk();

  VocabularyOptions opts_;
  std::vector<std::string> special_tokens_;
  fst::SymbolTable *symbols_;
  int64 unk_index_;  // fst::kNoSymbol if there is no unk token.

  SLOTCODEC_DISALLOW_COPY_AND_ASSIGN(Vocabulary);
};

}  // namespace slotcodec

#endif  // SLOTCODEC_VOCAB_VOCABULARY_H_
