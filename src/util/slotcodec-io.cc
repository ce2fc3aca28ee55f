// util/slotcodec-io.cc

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

#include "util/slotcodec-io.h"

namespace slotcodec {

Input::Input(const std::string &filename): is_(NULL) {
  if (filename == "-") return;
  is_ = new std::ifstream(filename.c_str());
  if (!is_->is_open()) {
    delete is_;
    is_ = NULL;
    SLOTCODEC_ERR << "Failed to open " << filename << " for reading";
  }
}

Output::Output(const std::string &filename):
    filename_(filename), os_(NULL), closed_(false) {
  if (filename == "-") return;
  os_ = new std::ofstream(filename.c_str());
  if (!os_->is_open()) {
    delete os_;
    os_ = NULL;
    SLOTCODEC_ERR << "Failed to open " << filename << " for writing";
  }
}

void Output::Close() {
  if (closed_) return;
  closed_ = true;
  Stream().flush();
  bool ok = Stream().good();
  if (os_ != NULL) {
    os_->close();
    ok = ok && !os_->fail();
  }
  if (!ok)
    SLOTCODEC_ERR << "Error writing to " << (os_ == NULL ? "standard output"
                                             : filename_.c_str());
}

Output::~Output() {
  if (!closed_) {
    closed_ = true;
    Stream().flush();
    if (!Stream().good())
      SLOTCODEC_WARN << "Error writing to " << filename_;
  }
  delete os_;
}

}  // namespace slotcodec
