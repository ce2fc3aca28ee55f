// base/slotcodec-error.h

// Copyright 2019 LAIX (Yi Sun)
// Copyright 2019 SmartAction LLC (kkm)
// Copyright 2016 Brno University of Technology (author: Karel Vesely)
// Copyright 2009-2011  Microsoft Corporation;  Ondrej Glembek;  Lukas Burget;
//                      Saarland University
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

#ifndef SLOTCODEC_BASE_SLOTCODEC_ERROR_H_
#define SLOTCODEC_BASE_SLOTCODEC_ERROR_H_ 1

#include <cstdio>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "base/slotcodec-types.h"
#include "base/slotcodec-utils.h"
/* Important that this file does not depend on any other slotcodec headers. */

namespace slotcodec {

/// \addtogroup error_group
/// @{

/***** PROGRAM NAME AND VERBOSITY LEVEL *****/

/// Called by ParseOptions to set base name (no directory) of the executing
/// program. The name is printed in logging code along with every message.
/// This function is very thread-unsafe.
void SetProgramName(const char *basename);

/// This is set by util/parse-options.{h,cc} if you set --verbose=? option.
/// Do not use directly, prefer {Get,Set}VerboseLevel().
extern int32 g_slotcodec_verbose_level;

/// Get verbosity level, usually set via command line '--verbose=' switch.
inline int32 GetVerboseLevel() { return g_slotcodec_verbose_level; }

/// This should be rarely used, except by programs using slotcodec as library;
/// command-line programs set the verbose level automatically from ParseOptions.
inline void SetVerboseLevel(int32 i) { g_slotcodec_verbose_level = i; }

/***** LOGGING *****/

/// Log message severity and source location info.
struct LogMessageEnvelope {
  /// Message severity. In addition to these levels, positive values (1 to 6)
  /// specify verbose logging level. Verbose messages are produced only when
  /// SetVerboseLevel() has been called to set logging level to at least the
  /// corresponding value.
  enum Severity {
    kAssertFailed = -3, //!< Assertion failure. abort() will be called.
    kError = -2,        //!< Fatal error. An exception will be thrown.
    kWarning = -1,      //!< Indicates a recoverable but abnormal condition.
    kInfo = 0,          //!< Informational message.
  };
  int severity;     //!< A Severity value, or positive verbosity level.
  const char *func; //!< Name of the function invoking the logging.
  const char *file; //!< Source file name with up to 1 leading directory.
  int32 line;       //<! Line number in the source file.
};

/// Fatal runtime error exception. Thrown from any use of the SLOTCODEC_ERR
/// logging macro after the logging function, either set by SetLogHandler(),
/// or the internal one, has returned. The more specific errors below derive
/// from it, so catching SlotCodecFatalError catches every error of the codec.
class SlotCodecFatalError : public std::runtime_error {
public:
  explicit SlotCodecFatalError(const std::string &message)
      : std::runtime_error(message) {}
  explicit SlotCodecFatalError(const char *message)
      : std::runtime_error(message) {}

  /// Returns the exception name, e.g. "slotcodec::SlotCodecFatalError".
  virtual const char *what() const noexcept override {
    return "slotcodec::SlotCodecFatalError";
  }

  /// Returns the message logged by SLOTCODEC_ERR or SLOTCODEC_THROW.
  const char *SlotCodecMessage() const { return std::runtime_error::what(); }
};

/// A tag does not follow the BIO grammar, or token and tag sequences are not
/// parallel.
class FormatError : public SlotCodecFatalError {
public:
  explicit FormatError(const std::string &message)
      : SlotCodecFatalError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::FormatError";
  }
};

/// A name (or index) is absent from a vocabulary.
class UnknownNameError : public SlotCodecFatalError {
public:
  explicit UnknownNameError(const std::string &message)
      : SlotCodecFatalError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::UnknownNameError";
  }
};

/// A slot name is absent from the slot vocabulary.
class UnknownSlotError : public UnknownNameError {
public:
  explicit UnknownSlotError(const std::string &message)
      : UnknownNameError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::UnknownSlotError";
  }
};

/// An action name is absent from the action vocabulary.
class UnknownActionError : public UnknownNameError {
public:
  explicit UnknownActionError(const std::string &message)
      : UnknownNameError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::UnknownActionError";
  }
};

/// An observed slot, or slot value, is missing from the turn's candidates.
class CandidateMismatchError : public SlotCodecFatalError {
public:
  explicit CandidateMismatchError(const std::string &message)
      : SlotCodecFatalError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::CandidateMismatchError";
  }
};

/// A batch of candidate sets did not hold exactly one set.
class UnsupportedBatchShapeError : public SlotCodecFatalError {
public:
  explicit UnsupportedBatchShapeError(const std::string &message)
      : SlotCodecFatalError(message) {}
  virtual const char *what() const noexcept override {
    return "slotcodec::UnsupportedBatchShapeError";
  }
};

// Class MessageLogger is the workhorse behind the SLOTCODEC_ASSERT,
// SLOTCODEC_ERR, SLOTCODEC_THROW, SLOTCODEC_WARN, SLOTCODEC_LOG and
// SLOTCODEC_VLOG macros. It formats the message, then either prints it to
// stderr or passes to the custom logging handler if provided. Then, in case of
// an error, throws the requested exception, or in case of a failed
// SLOTCODEC_ASSERT, calls std::abort().
class MessageLogger {
public:
  /// The constructor stores the message's "envelope", a set of data which
  // identifies the location in source which is sending the message to log.
  // The pointers to strings are stored internally, and not owned or copied,
  // so that their storage must outlive this object.
  MessageLogger(LogMessageEnvelope::Severity severity, const char *func,
                const char *file, int32 line);

  // The stream insertion operator, used in e.g. 'SLOTCODEC_LOG << "Message"'.
  template <typename T> MessageLogger &operator<<(const T &val) {
    ss_ << val;
    return *this;
  }

  // When assigned a MessageLogger, log its contents.
  struct Log final {
    void operator=(const MessageLogger &logger) { logger.LogMessage(); }
  };

  // When assigned a MessageLogger, log its contents and then throw
  // an exception of type E, which must be constructible from the message.
  template <class E> struct LogAndThrow final {
    [[noreturn]] void operator=(const MessageLogger &logger) {
      logger.LogMessage();
      throw E(logger.GetMessage());
    }
  };

private:
  std::string GetMessage() const { return ss_.str(); }
  void LogMessage() const;

  LogMessageEnvelope envelope_;
  std::ostringstream ss_;
};

// Logging macros.
#define SLOTCODEC_THROW(ExceptionType)                                         \
  ::slotcodec::MessageLogger::LogAndThrow<ExceptionType>() =                   \
      ::slotcodec::MessageLogger(::slotcodec::LogMessageEnvelope::kError,      \
                                 __func__, __FILE__, __LINE__)
#define SLOTCODEC_ERR SLOTCODEC_THROW(::slotcodec::SlotCodecFatalError)
#define SLOTCODEC_WARN                                                         \
  ::slotcodec::MessageLogger::Log() = ::slotcodec::MessageLogger(              \
      ::slotcodec::LogMessageEnvelope::kWarning, __func__, __FILE__, __LINE__)
#define SLOTCODEC_LOG                                                          \
  ::slotcodec::MessageLogger::Log() = ::slotcodec::MessageLogger(              \
      ::slotcodec::LogMessageEnvelope::kInfo, __func__, __FILE__, __LINE__)
#define SLOTCODEC_VLOG(v)                                                      \
  if ((v) <= ::slotcodec::GetVerboseLevel())                                   \
  ::slotcodec::MessageLogger::Log() =                                          \
      ::slotcodec::MessageLogger((::slotcodec::LogMessageEnvelope::Severity)(v), \
                                 __func__, __FILE__, __LINE__)

/***** ASSERTS *****/

[[noreturn]] void SlotCodecAssertFailure_(const char *func, const char *file,
                                          int32 line, const char *cond_str);

// do {} while(0) -- note there is no semicolon at the end! -- keeps the macro
// usable as a single statement inside an unbraced if/else.
#ifndef NDEBUG
#define SLOTCODEC_ASSERT(cond)                                                 \
  do {                                                                         \
    if (cond)                                                                  \
      (void)0;                                                                 \
    else                                                                       \
      ::slotcodec::SlotCodecAssertFailure_(__func__, __FILE__, __LINE__,       \
                                           #cond);                             \
  } while (0)
#else
#define SLOTCODEC_ASSERT(cond) (void)0
#endif

/***** THIRD-PARTY LOG-HANDLER *****/

/// Type of third-party logging function.
typedef void (*LogHandler)(const LogMessageEnvelope &envelope,
                           const char *message);

/// Set logging handler. If called with a non-NULL function pointer, the
/// function pointed by it is called to send messages to a caller-provided log.
/// If called with a NULL pointer, restores default logging to stderr.
/// This function is obviously not thread safe; the log handler must be.
/// Returns a previously set logging handler pointer, or NULL.
LogHandler SetLogHandler(LogHandler);

/// @} end "addtogroup error_group"

} // namespace slotcodec

#endif // SLOTCODEC_BASE_SLOTCODEC_ERROR_H_
