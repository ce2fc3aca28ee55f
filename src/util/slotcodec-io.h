// util/slotcodec-io.h

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

#ifndef SLOTCODEC_UTIL_SLOTCODEC_IO_H_
#define SLOTCODEC_UTIL_SLOTCODEC_IO_H_

#include <fstream>
#include <iostream>
#include <string>

#include "base/slotcodec-common.h"

namespace slotcodec {

/// Opens a file for reading; the filename "-" means the standard input.
/// Throws if the file cannot be opened.
class Input {
 public:
  explicit Input(const std::string &filename);

  std::istream &Stream() { return is_ == NULL ? std::cin : *is_; }

  ~Input() { delete is_; }

 private:
  std::ifstream *is_;  // NULL for the standard input.
  SLOTCODEC_DISALLOW_COPY_AND_ASSIGN(Input);
};

/// Opens a file for writing; the filename "-" means the standard output.
/// Close() checks that everything was written; the destructor only warns.
class Output {
 public:
  explicit Output(const std::string &filename);

  std::ostream &Stream() { return os_ == NULL ? std::cout : *os_; }

  void Close();

  ~Output();

 private:
  std::string filename_;
  std::ofstream *os_;  // NULL for the standard output.
  bool closed_;
  SLOTCODEC_DISALLOW_COPY_AND_ASSIGN(Output);
};

}  // namespace slotcodec

#endif  // SLOTCODEC_UTIL_SLOTCODEC_IO_H_
