// util/parse-options-test.cc

// Copyright 2009-2011  Karel Vesely;  Microsoft Corporation
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

#include "util/parse-options.h"

namespace slotcodec {

struct DummyOptions {
  int32 my_int;
  bool my_bool;
  std::string my_string;
  BaseFloat my_float;

  DummyOptions():
      my_int(0),
      my_bool(true),
      my_string("default dummy string"),
      my_float(1.0) {}

  void Register(OptionsItf *opts) {
    opts->Register("my-int", &my_int, "An int32 variable");
    opts->Register("my-bool", &my_bool, "A Boolean variable");
    opts->Register("my-str", &my_string, "A string variable");
    opts->Register("my-float", &my_float, "A float variable");
  }
};

void UnitTestParseOptions() {
  int argc = 7;
  std::string str="default_for_str";
  int32 num = 1;
  uint32 unum = 2;
  const char *argv[7] = { "program_name", "--unum=5", "--num=3", "--i=boo",
                          "a", "b", "c" };
  ParseOptions po("my usage msg");
  po.Register("i", &str, "My variable");
  po.Register("num", &num, "My int32 variable");
  po.Register("unum", &unum, "My uint32 variable");
  po.Read(argc, argv);
  SLOTCODEC_ASSERT(po.NumArgs() == 3);
  SLOTCODEC_ASSERT(po.GetArg(1) == "a");
  SLOTCODEC_ASSERT(po.GetArg(2) == "b");
  SLOTCODEC_ASSERT(po.GetArg(3) == "c");
  SLOTCODEC_ASSERT(unum == 5);
  SLOTCODEC_ASSERT(num == 3);
  SLOTCODEC_ASSERT(str == "boo");

  // options after "--" are positional
  ParseOptions po2("my another usage msg");
  int argc2 = 4;
  const char *argv2[4] = { "program_name", "--i=foo", "--", "--x" };
  po2.Register("i", &str, "My variable");
  po2.Read(argc2, argv2);
  SLOTCODEC_ASSERT(po2.NumArgs() == 1);
  SLOTCODEC_ASSERT(po2.GetArg(1) == "--x");
  SLOTCODEC_ASSERT(str == "foo");
  SLOTCODEC_ASSERT(po2.GetOptArg(2) == "");

  // option structs registered through the interface
  ParseOptions po3("struct usage");
  DummyOptions dummy_opts;
  dummy_opts.Register(&po3);
  int argc3 = 5;
  const char *argv3[5] = { "program_name", "--my-int=-7", "--my-bool=false",
                           "--my_str=Paris Texas", "--my-float=0.5" };
  po3.Read(argc3, argv3);
  SLOTCODEC_ASSERT(dummy_opts.my_int == -7);
  SLOTCODEC_ASSERT(!dummy_opts.my_bool);
  SLOTCODEC_ASSERT(dummy_opts.my_string == "Paris Texas");
  SLOTCODEC_ASSERT(dummy_opts.my_float == 0.5);

  // --x is the same as --x=true for bools
  ParseOptions po4("bool usage");
  bool flag = false;
  po4.Register("flag", &flag, "A flag");
  int argc4 = 2;
  const char *argv4[2] = { "program_name", "--flag" };
  po4.Read(argc4, argv4);
  SLOTCODEC_ASSERT(flag);

  // unregistered options are errors
  ParseOptions po5("error usage");
  int argc5 = 2;
  const char *argv5[2] = { "program_name", "--unknown-option=1" };
  try {
    po5.Read(argc5, argv5);
    SLOTCODEC_ERR << "Expected an error for an unregistered option.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("Invalid option")
                     != std::string::npos);
  }

  // invalid integer values are errors
  ParseOptions po6("int usage");
  int32 value = 0;
  po6.Register("value", &value, "A value");
  int argc6 = 2;
  const char *argv6[2] = { "program_name", "--value=abc" };
  try {
    po6.Read(argc6, argv6);
    SLOTCODEC_ERR << "Expected an error for a non-integer value.";
  } catch (const SlotCodecFatalError &e) {
    SLOTCODEC_ASSERT(std::string(e.SlotCodecMessage()).find("abc")
                     != std::string::npos);
  }
}

void UnitTestReadConfig() {
  std::string filename = "tmp.slotcodec.config";
  {
    std::ofstream os(filename.c_str());
    os << "# a comment line\n"
       << "--my-int=12   # trailing comment\n"
       << "\n"
       << "--my-str=steak house\n";
  }
  ParseOptions po("config usage");
  DummyOptions dummy_opts;
  dummy_opts.Register(&po);
  std::string config_arg = "--config=" + filename;
  const char *argv[3] = { "program_name", config_arg.c_str(), "--my-int=13" };
  po.Read(3, argv);
  // command line overrides the config file
  SLOTCODEC_ASSERT(dummy_opts.my_int == 13);
  SLOTCODEC_ASSERT(dummy_opts.my_string == "steak house");
  SLOTCODEC_ASSERT(po.NumArgs() == 0);
  std::remove(filename.c_str());
}

}  // end namespace slotcodec

int main() {
  using namespace slotcodec;
  // ParseOptions echoes command lines and usage to stderr; that is expected.
  UnitTestParseOptions();
  UnitTestReadConfig();
  SLOTCODEC_LOG << "Tests succeeded.";
  return 0;
}
