#include "device-inspector/OutputSanitizer.hpp"

#include <gtest/gtest.h>

using namespace devinspect;

namespace {
const char *DPTECH_MORE = R"(--More\(CTRL\+C break\)--)";
}

TEST(OutputSanitizer, PaginationBanner_FollowingOutputPreserved) {
  OutputSanitizer sanitizer(DPTECH_MORE);

  std::string raw = "line1\r\n--More(CTRL+C break)--\r\nline2\r\nline3";
  EXPECT_EQ(sanitizer.sanitize(raw, "show x", "DPTech"),
            "line1\r\nline2\r\nline3");
}

TEST(OutputSanitizer, PaginationBanner_RemovedEverywhere) {
  OutputSanitizer sanitizer(DPTECH_MORE);

  std::string raw = "a\n--More(CTRL+C break)--\nb\n--More(CTRL+C break)--c";
  EXPECT_EQ(sanitizer.strip_pagination(raw), "a\nb\nc");
}

TEST(OutputSanitizer, NoMorePattern_BannerKept) {
  OutputSanitizer sanitizer;
  std::string raw = "a\n--More(CTRL+C break)--\nb";
  EXPECT_EQ(sanitizer.sanitize(raw, "cmd", "dev"), raw);
}

TEST(OutputSanitizer, Idempotent) {
  OutputSanitizer sanitizer(DPTECH_MORE);
  const std::vector<std::string> inputs = {
      "show version\nCisco IOS 15.1\nrouter1>",
      "show version\n\nshow version\nrouter1>\nrouter1>",
      "  \x1b[1;32mOK\x1b[0m  \n--More(CTRL+C break)--\r\n\b\bdone\n",
      "--More(CTRL+C br--More(CTRL+C break)--eak)--\nrest",
      "\xff\xfe raw bytes router1#",
      "",
      "router1>"};

  for (const auto &input : inputs) {
    std::string once = sanitizer.sanitize(input, "show version", "router1");
    EXPECT_EQ(sanitizer.sanitize(once, "show version", "router1"), once)
        << "input: " << input;
  }
}

TEST(OutputSanitizer, CommandEcho_Removed) {
  OutputSanitizer sanitizer;
  std::string raw = "display version\r\nVRP (R) software\r\n<HUAWEI>";
  EXPECT_EQ(sanitizer.sanitize(raw, "display version", "HUAWEI"),
            "VRP (R) software");
}

TEST(OutputSanitizer, CommandEcho_OnlyAtStartAndFollowedByLineBreak) {
  EXPECT_EQ(OutputSanitizer::strip_command_echo("show versions\nx", "show"),
            "show versions\nx");
  EXPECT_EQ(OutputSanitizer::strip_command_echo("x\nshow\ny", "show"),
            "x\nshow\ny");
  EXPECT_EQ(OutputSanitizer::strip_command_echo("show  \r\ny", "show"), "y");
  EXPECT_EQ(OutputSanitizer::strip_command_echo("show", "show"), "");
}

// Leading output lines equal to the command go with the echo
TEST(OutputSanitizer, OutputStartingWithCommandText_RemovedWithEcho) {
  OutputSanitizer sanitizer;

  std::string only_history = "show history\r\n  show history\r\nrouter1#";
  EXPECT_EQ(sanitizer.sanitize(only_history, "show history", "router1"), "");

  std::string more_history =
      "show history\r\n  show history\r\n  show version\r\nrouter1#";
  std::string once =
      sanitizer.sanitize(more_history, "show history", "router1");
  EXPECT_EQ(once, "show version");
  EXPECT_EQ(sanitizer.sanitize(once, "show history", "router1"), once);
}

TEST(OutputSanitizer, ControlSequences_Removed) {
  EXPECT_EQ(OutputSanitizer::strip_control_sequences(
                "\x1b[1;32mgreen\x1b[0m text\b\b"),
            "green text");
  EXPECT_EQ(OutputSanitizer::strip_control_sequences("\x1b[2K\x1b[Hclear"),
            "clear");
}

TEST(OutputSanitizer, TrailingPrompt_Variants) {
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\nrouter1>", "router1"),
            "out\n");
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\nrouter1# \r\n",
                                                   "router1"),
            "out\n");
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\n<HUAWEI>", "HUAWEI"),
            "out\n");
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\n[H3C]", "H3C"),
            "out\n");
}

TEST(OutputSanitizer, TrailingPrompt_MustBeOwnLine) {
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("value xrouter1>",
                                                   "router1"),
            "value xrouter1>");
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\nH3C]", "H3C"),
            "out\nH3C]");
  EXPECT_EQ(OutputSanitizer::strip_trailing_prompt("out\nrouter1>", ""),
            "out\nrouter1>");
}

TEST(OutputSanitizer, PromptInsideOutput_Kept) {
  OutputSanitizer sanitizer;
  std::string raw = "show log\nrouter1> login from 10.0.0.9\nok\nrouter1>";
  EXPECT_EQ(sanitizer.sanitize(raw, "show log", "router1"),
            "router1> login from 10.0.0.9\nok");
}

TEST(OutputSanitizer, LossyDecode) {
  EXPECT_EQ(OutputSanitizer::decode_lossy("ok\xff"), "ok\xEF\xBF\xBD");
  EXPECT_EQ(OutputSanitizer::decode_lossy("\xC3"), "\xEF\xBF\xBD");
  // Overlong encoding of '/'
  EXPECT_EQ(OutputSanitizer::decode_lossy("\xC0\xAF"),
            "\xEF\xBF\xBD\xEF\xBF\xBD");
  EXPECT_EQ(OutputSanitizer::decode_lossy("设备名称"), "设备名称");
}

TEST(OutputSanitizer, Trim) {
  EXPECT_EQ(OutputSanitizer::trim(" \r\n a b \t\n"), "a b");
  EXPECT_EQ(OutputSanitizer::trim(" \n "), "");
}
