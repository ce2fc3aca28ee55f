// base/slotcodec-error.cc

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Lukas Burget;  Ondrej Glembek
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

#include <cstdlib>
#include <iostream>

#include "base/slotcodec-common.h"
#include "base/slotcodec-error.h"

namespace slotcodec {

int32 g_slotcodec_verbose_level = 0;
static std::string program_name;
static LogHandler log_handler = NULL;

void SetProgramName(const char *basename) {
  program_name = basename;
}

// "/a/b/c/d.cc" -> "c/d.cc"; slash and backslash both separate directories.
static const char *ShortFileName(const char *path) {
  if (path == NULL) return "";
  const char *dir = path, *base = path;
  for (const char *p = path; *p != '\0'; p++) {
    if (*p == '/' || *p == '\\') {
      dir = base;
      base = p + 1;
    }
  }
  return dir;
}

static const char *SeverityName(int severity) {
  switch (severity) {
    case LogMessageEnvelope::kInfo: return "LOG";
    case LogMessageEnvelope::kWarning: return "WARNING";
    case LogMessageEnvelope::kAssertFailed: return "ASSERTION_FAILED";
    default: return "ERROR";
  }
}

MessageLogger::MessageLogger(LogMessageEnvelope::Severity severity,
                             const char *func, const char *file, int32 line) {
  envelope_.severity = severity;
  envelope_.func = func;
  envelope_.file = ShortFileName(file);  // points into "file".
  envelope_.line = line;
}

void MessageLogger::LogMessage() const {
  if (log_handler != NULL) {
    log_handler(envelope_, GetMessage().c_str());
    return;
  }
  // e.g. "WARNING (decode-slot-values:main():decode-slot-values.cc:97) ..."
  std::ostringstream header;
  if (envelope_.severity > LogMessageEnvelope::kInfo)
    header << "VLOG[" << envelope_.severity << "]";
  else
    header << SeverityName(envelope_.severity);
  header << " (" << program_name << ':' << envelope_.func << "():"
         << envelope_.file << ':' << envelope_.line << ") ";
  std::cerr << header.str() << GetMessage() << '\n';
}

void SlotCodecAssertFailure_(const char *func, const char *file, int32 line,
                             const char *cond_str) {
  MessageLogger::Log() =
      MessageLogger(LogMessageEnvelope::kAssertFailed, func, file, line)
      << "Assertion failed: (" << cond_str << ")";
  std::fflush(NULL);  // abort() need not flush stderr.
  std::abort();
}

LogHandler SetLogHandler(LogHandler handler) {
  LogHandler old_handler = log_handler;
  log_handler = handler;
  return old_handler;
}

}  // namespace slotcodec
