// vocab/vocabulary.cc

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

#include <algorithm>
#include <fstream>
#include <map>

#include "vocab/vocabulary.h"
#include "util/text-utils.h"

namespace slotcodec {

namespace {

// Orders (name, count, first-seen position) entries by decreasing count, ties
// by first occurrence.
struct CountEntry {
  std::string name;
  int64 count;
  size_t first_seen;
};

struct CountEntryGreater {
  bool operator()(const CountEntry &a, const CountEntry &b) const {
    if (a.count != b.count) return a.count > b.count;
    return a.first_seen < b.first_seen;
  }
};

}  // namespace

Vocabulary::Vocabulary(const VocabularyOptions &opts)
    : opts_(opts), symbols_(new fst::SymbolTable("vocabulary")),
      unk_index_(fst::kNoSymbol) {
  SplitStringToVector(opts_.special_tokens, ",", true, &special_tokens_);
}

Vocabulary::~Vocabulary() {
  delete symbols_;
}

void Vocabulary::Fit(const std::vector<std::vector<std::string> > &batch) {
  std::map<std::string, size_t> position;
  std::vector<CountEntry> entries;
  for (size_t i = 0; i < batch.size(); i++) {
    for (size_t j = 0; j < batch[i].size(); j++) {
      const std::string &name = batch[i][j];
      if (name.empty()) continue;
      std::map<std::string, size_t>::iterator iter = position.find(name);
      if (iter == position.end()) {
        position[name] = entries.size();
        CountEntry entry;
        entry.name = name;
        entry.count = 1;
        entry.first_seen = entries.size();
        entries.push_back(entry);
      } else {
        entries[iter->second].count++;
      }
    }
  }
  std::stable_sort(entries.begin(), entries.end(), CountEntryGreater());
  if (opts_.max_tokens >= 0 &&
      entries.size() > static_cast<size_t>(opts_.max_tokens))
    entries.resize(opts_.max_tokens);

  fst::SymbolTable *symbols = new fst::SymbolTable("vocabulary");
  for (size_t i = 0; i < special_tokens_.size(); i++) {
    if (symbols->Find(special_tokens_[i]) == fst::kNoSymbol)
      symbols->AddSymbol(special_tokens_[i]);
  }
  int32 num_dropped = 0;
  for (size_t i = 0; i < entries.size(); i++) {
    if (symbols->Find(entries[i].name) != fst::kNoSymbol) continue;
    if (entries[i].count >= opts_.min_freq) {
      symbols->AddSymbol(entries[i].name);
    } else {
      num_dropped++;
    }
  }
  delete symbols_;
  symbols_ = symbols;
  ResolveUnk();
  SLOTCODEC_VLOG(1) << "Fitted vocabulary of " << Size() << " names ("
                    << special_tokens_.size() << " special, " << num_dropped
                    << " dropped with count below " << opts_.min_freq << ")";
}

void Vocabulary::ResolveUnk() {
  unk_index_ = fst::kNoSymbol;
  if (opts_.unk_token.empty()) return;
  unk_index_ = symbols_->Find(opts_.unk_token);
  if (unk_index_ == fst::kNoSymbol)
    SLOTCODEC_WARN << "Unknown-name token '" << opts_.unk_token
                   << "' is not in the vocabulary; unknown names will be "
                   << "errors.";
}

int32 Vocabulary::Index(const std::string &name) const {
  int64 key = symbols_->Find(name);
  if (key == fst::kNoSymbol) {
    if (unk_index_ != fst::kNoSymbol)
      return static_cast<int32>(unk_index_);
    SLOTCODEC_THROW(UnknownNameError) << "Name '" << name
                                      << "' is not in the vocabulary.";
  }
  return static_cast<int32>(key);
}

std::string Vocabulary::Name(int32 index) const {
  if (index < 0 || index >= Size())
    SLOTCODEC_THROW(UnknownNameError) << "Index " << index
                                      << " is out of range for a vocabulary "
                                      << "of size " << Size();
  return symbols_->Find(static_cast<int64>(index));
}

void Vocabulary::Lookup(const std::vector<std::vector<std::string> > &names,
                        std::vector<std::vector<int32> > *indices) const {
  SLOTCODEC_ASSERT(indices != NULL);
  indices->resize(names.size());
  for (size_t i = 0; i < names.size(); i++) {
    (*indices)[i].resize(names[i].size());
    for (size_t j = 0; j < names[i].size(); j++)
      (*indices)[i][j] = Index(names[i][j]);
  }
}

void Vocabulary::Lookup(const std::vector<std::vector<int32> > &indices,
                        std::vector<std::vector<std::string> > *names) const {
  SLOTCODEC_ASSERT(names != NULL);
  names->resize(indices.size());
  for (size_t i = 0; i < indices.size(); i++) {
    (*names)[i].resize(indices[i].size());
    for (size_t j = 0; j < indices[i].size(); j++)
      (*names)[i][j] = Name(indices[i][j]);
  }
}

bool Vocabulary::Contains(const std::string &name) const {
  return symbols_->Find(name) != fst::kNoSymbol;
}

int32 Vocabulary::Size() const {
  return static_cast<int32>(symbols_->NumSymbols());
}

std::vector<std::string> Vocabulary::Names() const {
  std::vector<std::string> ans(Size());
  for (int32 i = 0; i < Size(); i++)
    ans[i] = symbols_->Find(static_cast<int64>(i));
  return ans;
}

void Vocabulary::ReadText(const std::string &filename) {
  fst::SymbolTable *symbols = fst::SymbolTable::ReadText(filename);
  if (symbols == NULL)
    SLOTCODEC_ERR << "Could not read symbol table from file " << filename;
  for (int64 key = 0; key < symbols->NumSymbols(); key++) {
    if (symbols->Find(key).empty()) {
      delete symbols;
      SLOTCODEC_ERR << "Symbol table " << filename << " is not dense: key "
                    << key << " is missing";
    }
  }
  delete symbols_;
  symbols_ = symbols;
  ResolveUnk();
  SLOTCODEC_VLOG(1) << "Read vocabulary of " << Size() << " names from "
                    << filename;
}

void Vocabulary::WriteText(const std::string &filename) const {
  std::ofstream os(filename.c_str());
  if (!os.good())
    SLOTCODEC_ERR << "Could not open " << filename << " for writing";
  if (!symbols_->WriteText(os) || !os.good())
    SLOTCODEC_ERR << "Error writing symbol table to " << filename;
}

}  // namespace slotcodec
