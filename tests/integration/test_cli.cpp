#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "cli/app.hpp"

namespace {

struct CliRun {
  int code = -1;
  std::string out;
  std::string err;
};

/// Run the tool in-process with `args` (program name is prepended).
CliRun invoke(std::vector<std::string> args, const std::string& stdin_text = "") {
  args.insert(args.begin(), "ccwc");
  std::vector<const char*> argv;
  for (const auto& a : args) argv.push_back(a.c_str());

  std::istringstream in(stdin_text);
  std::ostringstream out;
  std::ostringstream err;
  CliRun r;
  r.code = ccwc::run_cli(static_cast<int>(argv.size()), argv.data(), in, out, err);
  r.out = out.str();
  r.err = err.str();
  return r;
}

std::string data(const std::string& name) { return std::string(CCWC_TEST_DATA_DIR) + "/" + name; }

}  // namespace

// ---------------------------------------------------------------------------
// Standard input
// ---------------------------------------------------------------------------

TEST(CliIntegration, DefaultMetricsOnStdin) {
  auto r = invoke({}, "foo bar\nbaz\n");
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 2 3 12\n");
  EXPECT_TRUE(r.err.empty());
}

TEST(CliIntegration, BundledShortFlagsMatchDefault) {
  auto r = invoke({"-lwc"}, "foo bar\nbaz\n");
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 2 3 12\n");
}

TEST(CliIntegration, MetricsPrintInFixedOrder) {
  auto r = invoke({"-c", "-m", "-l"}, "h\xc3\xa9llo\n");
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 1 6 7\n");
}

TEST(CliIntegration, ExplicitDashNamesStdin) {
  auto r = invoke({"-w", "-"}, "a b c");
  EXPECT_EQ(r.out, " 3 -\n");
}

TEST(CliIntegration, EmptyStdin) {
  auto r = invoke({}, "");
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 0 0 0\n");
}

// ---------------------------------------------------------------------------
// Files and totals
// ---------------------------------------------------------------------------

TEST(CliIntegration, SingleFileShowsName) {
  const auto path = data("foo_bar.txt");
  auto r = invoke({path});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 2 3 12 " + path + "\n");
}

TEST(CliIntegration, MultipleFilesPrintTotal) {
  const auto a = data("three_lines.txt");
  const auto b = data("five_lines.txt");
  auto r = invoke({"-l", a, b});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 3 " + a + "\n 5 " + b + "\n 8 total\n");
}

TEST(CliIntegration, TotalsSumEveryRequestedMetric) {
  const auto a = data("foo_bar.txt");
  const auto b = data("utf8_mixed.txt");
  auto r = invoke({"-lwmc", a, b});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 2 3 12 12 " + a + "\n 1 3 15 19 " + b + "\n 3 6 27 31 total\n");
}

TEST(CliIntegration, MissingFileIsReportedAndBatchContinues) {
  const auto missing = data("does_not_exist.txt");
  const auto good = data("three_lines.txt");
  auto r = invoke({"-l", missing, good});
  EXPECT_EQ(r.code, 1);
  EXPECT_NE(r.err.find(missing), std::string::npos);
  EXPECT_NE(r.err.find("No such file or directory"), std::string::npos);
  EXPECT_EQ(r.out, " 3 " + good + "\n 3 total\n");
}

TEST(CliIntegration, DirectoryIsReportedAsError) {
  auto r = invoke({"-c", CCWC_TEST_DATA_DIR});
  EXPECT_EQ(r.code, 1);
  EXPECT_NE(r.err.find("Is a directory"), std::string::npos);
  EXPECT_TRUE(r.out.empty());
}

// ---------------------------------------------------------------------------
// Buffer size and encoding
// ---------------------------------------------------------------------------

TEST(CliIntegration, BufferSizeDoesNotChangeCounts) {
  const auto path = data("utf8_mixed.txt");
  const std::string expected = " 1 3 15 19 " + path + "\n";
  for (const char* size : {"1", "2", "3", "5", "0", "65536"}) {
    auto r = invoke({"-lwmc", "--buffer-size", size, path});
    EXPECT_EQ(r.code, 0);
    EXPECT_EQ(r.out, expected) << "buffer size " << size;
  }
}

TEST(CliIntegration, MaximumBufferSizeStillCounts) {
  auto r = invoke({"--buffer-size", "18446744073709551615"}, "hello world\n");
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 1 2 12\n");
  auto lines = invoke({"-l", "--buffer-size", "99999999999999"}, "a\nb\n");
  EXPECT_EQ(lines.code, 0);
  EXPECT_EQ(lines.out, " 2\n");
}

TEST(CliIntegration, BufferSizeEqualsSyntax) {
  auto r = invoke({"--buffer-size=1", "-w"}, "hello world");
  EXPECT_EQ(r.out, " 2\n");
}

TEST(CliIntegration, EncodingChangesCharacterCount) {
  const auto path = data("utf8_mixed.txt");
  EXPECT_EQ(invoke({"-m", path}).out, " 15 " + path + "\n");
  EXPECT_EQ(invoke({"-m", "--encoding", "latin-1", path}).out, " 19 " + path + "\n");
}

TEST(CliIntegration, UnsupportedEncodingIsFatal) {
  const auto a = data("foo_bar.txt");
  const auto b = data("three_lines.txt");
  auto r = invoke({"-m", "--encoding", "klingon", a, b});
  EXPECT_EQ(r.code, 1);
  EXPECT_TRUE(r.out.empty());
  EXPECT_NE(r.err.find("klingon: unsupported encoding"), std::string::npos);
}

TEST(CliIntegration, UnicodeWhitespaceOption) {
  const std::string text = "a\xc2\xa0" "b\n";
  EXPECT_EQ(invoke({"-w"}, text).out, " 1\n");
  EXPECT_EQ(invoke({"-w", "--whitespace", "unicode"}, text).out, " 2\n");
}

// ---------------------------------------------------------------------------
// Config files
// ---------------------------------------------------------------------------

TEST(CliIntegration, ConfigFileSetsEncoding) {
  const auto path = data("utf8_mixed.txt");
  auto r = invoke({"--config", data("config_whole_input.yaml"), "-m", path});
  EXPECT_EQ(r.code, 0);
  EXPECT_EQ(r.out, " 19 " + path + "\n");
}

TEST(CliIntegration, CommandLineOverridesConfigFile) {
  const auto path = data("utf8_mixed.txt");
  auto r = invoke({"--config", data("config_whole_input.yaml"), "--encoding", "utf-8", "-m", path});
  EXPECT_EQ(r.out, " 15 " + path + "\n");
}

TEST(CliIntegration, ConfigFileWithBadEncodingFails) {
  auto r = invoke({"--config", data("config_bad_encoding.yaml")}, "x");
  EXPECT_EQ(r.code, 1);
  EXPECT_TRUE(r.out.empty());
  EXPECT_NE(r.err.find("unsupported encoding"), std::string::npos);
}

TEST(CliIntegration, ConfigFileWithNegativeBufferFails) {
  auto r = invoke({"--config", data("config_negative_buffer.yaml")}, "x");
  EXPECT_EQ(r.code, 1);
  EXPECT_NE(r.err.find("buffer_size"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Usage and informational flags
// ---------------------------------------------------------------------------

TEST(CliIntegration, HelpPrintsUsage) {
  auto r = invoke({"--help"});
  EXPECT_EQ(r.code, 0);
  EXPECT_NE(r.out.find("Usage:"), std::string::npos);
  EXPECT_EQ(invoke({"-h"}).code, 0);
}

TEST(CliIntegration, UnknownArgumentIsUsageError) {
  auto r = invoke({"--frobnicate"});
  EXPECT_EQ(r.code, 2);
  EXPECT_NE(r.err.find("Unknown argument: --frobnicate"), std::string::npos);
  EXPECT_EQ(invoke({"-x"}).code, 2);
}

TEST(CliIntegration, InvalidOptionValuesAreUsageErrors) {
  EXPECT_EQ(invoke({"--buffer-size", "-3"}).code, 2);
  EXPECT_EQ(invoke({"--buffer-size", "12k"}).code, 2);
  EXPECT_EQ(invoke({"--buffer-size"}).code, 2);
  EXPECT_EQ(invoke({"--whitespace", "tabs"}).code, 2);
  EXPECT_EQ(invoke({"--lines=yes"}).code, 2);
}

TEST(CliIntegration, DoubleDashEndsOptions) {
  auto r = invoke({"-c", "--", "-not-a-flag"});
  EXPECT_EQ(r.code, 1);
  EXPECT_NE(r.err.find("-not-a-flag"), std::string::npos);
}

TEST(CliIntegration, ListEncodings) {
  auto r = invoke({"--list-encodings"});
  EXPECT_EQ(r.code, 0);
  EXPECT_NE(r.out.find("utf-8\n"), std::string::npos);
  EXPECT_NE(r.out.find("utf-16le\n"), std::string::npos);
}

TEST(CliIntegration, VerboseTracesToStderr) {
  auto r = invoke({"--verbose", "-c"}, "abc");
  EXPECT_EQ(r.out, " 3\n");
  EXPECT_NE(r.err.find("[ccwc] -: strategy=single"), std::string::npos);
}
