// options_test.cpp

#include <gtest/gtest.h>

#include <initializer_list>
#include <string>
#include <vector>

#include "options.h"

namespace {

// Owns a mutable argv for getopt_long.
struct Argv {
  std::vector<std::string> args;
  std::vector<char*> ptrs;

  Argv(std::initializer_list<const char*> list) {
    args.emplace_back("vanity_scanner");
    for (const char* a : list) args.emplace_back(a);
    for (auto& a : args) ptrs.push_back(&a[0]);
    ptrs.push_back(nullptr);
  }
  int argc() const { return int(args.size()); }
  char** argv() { return ptrs.data(); }
};

Options parse(std::initializer_list<const char*> list) {
  Argv a(list);
  return parseOptions(a.argc(), a.argv());
}

} // namespace

TEST(Options, Defaults) {
  Options o = parse({"-p", "qqq"});
  EXPECT_EQ("qqq", o.pattern);
  EXPECT_FALSE(o.suffix);
  EXPECT_EQ(0u, o.threads);
  EXPECT_EQ(5u, o.stats_interval);
  EXPECT_EQ(1000u, o.batch_size);
  EXPECT_EQ(&kMainnet, o.network);
  EXPECT_FALSE(o.quiet);
  EXPECT_GE(resolveThreads(o), 1u);
}

TEST(Options, LongAndShortForms) {
  Options o = parse({"--pattern", "ace", "-x", "DUD", "--threads", "3",
                     "-s", "0", "--batch-size", "64", "--testnet", "-q"});
  EXPECT_EQ("ace", o.pattern);
  ASSERT_TRUE(o.suffix);
  EXPECT_EQ("DUD", *o.suffix);
  EXPECT_EQ(3u, o.threads);
  EXPECT_EQ(3u, resolveThreads(o));
  EXPECT_EQ(0u, o.stats_interval);
  EXPECT_EQ(64u, o.batch_size);
  EXPECT_EQ(&kTestnet, o.network);
  EXPECT_TRUE(o.quiet);
}

TEST(Options, EmptyPatternAllowed) {
  Options o = parse({"-p", ""});
  EXPECT_EQ("", o.pattern);
}

TEST(Options, PatternRequired) {
  EXPECT_THROW(parse({"-t", "2"}), ConfigError);
}

TEST(Options, ZeroThreadsRejected) {
  EXPECT_THROW(parse({"-p", "q", "-t", "0"}), ConfigError);
}

TEST(Options, BadNumbersRejected) {
  EXPECT_THROW(parse({"-p", "q", "-t", "two"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "-t", "-1"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "-s", "5s"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "-s", ""}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "-b", "0"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "-t", "99999999999999999999999"}), ConfigError);
}

TEST(Options, NonBech32PatternRejected) {
  EXPECT_THROW(parse({"-p", "bob"}), ConfigError);
  EXPECT_THROW(parse({"-p", "qq", "-x", "i"}), ConfigError);
  EXPECT_NO_THROW(parse({"-p", "QPZ", "-x", "7L"}));
}

TEST(Options, OverlongPatternRejected) {
  EXPECT_THROW(parse({"-p", "qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqq"}), ConfigError);
  EXPECT_NO_THROW(parse({"-p", "qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqq"}));
}

TEST(Options, UnknownAndStrayArgumentsRejected) {
  EXPECT_THROW(parse({"-p", "q", "-z"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "--bogus"}), ConfigError);
  EXPECT_THROW(parse({"-p", "q", "extra"}), ConfigError);
  EXPECT_THROW(parse({"-p"}), ConfigError);
}

TEST(Options, HelpAndVersionSkipValidation) {
  EXPECT_TRUE(parse({"-h"}).help);
  EXPECT_TRUE(parse({"--version"}).version);
}

TEST(Options, ParsesRepeatedly) {
  EXPECT_EQ("qq", parse({"-p", "qq"}).pattern);
  EXPECT_EQ("pp", parse({"-p", "pp"}).pattern);
}
