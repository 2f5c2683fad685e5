#include "ControlFrame.hpp"
#include "TestHeaders.hpp"

using namespace ft;

TEST_CASE("Control frames are decoded by type", "[ControlFrame]") {
  SECTION("Input") {
    auto frame = parseControlFrame(R"({"type":"input","data":"ls -la\r"})");
    REQUIRE(frame.kind == ControlFrame::Kind::INPUT);
    REQUIRE(frame.data == "ls -la\r");
  }

  SECTION("Resize") {
    auto frame = parseControlFrame(R"({"type":"resize","rows":40,"cols":120})");
    REQUIRE(frame.kind == ControlFrame::Kind::RESIZE);
    REQUIRE(frame.sizeValid);
    REQUIRE(frame.size.row() == 40);
    REQUIRE(frame.size.column() == 120);
  }

  SECTION("Prompt watcher") {
    auto on =
        parseControlFrame(R"({"type":"prompt_watcher","data":"enable"})");
    REQUIRE(on.kind == ControlFrame::Kind::PROMPT_WATCHER);
    REQUIRE(on.enabled);
    auto off =
        parseControlFrame(R"({"type":"prompt_watcher","data":"disable"})");
    REQUIRE(off.kind == ControlFrame::Kind::PROMPT_WATCHER);
    REQUIRE_FALSE(off.enabled);
  }
}

TEST_CASE("Resize without usable dimensions is flagged", "[ControlFrame]") {
  auto zero = parseControlFrame(R"({"type":"resize","rows":0,"cols":80})");
  REQUIRE(zero.kind == ControlFrame::Kind::RESIZE);
  REQUIRE_FALSE(zero.sizeValid);

  auto missing = parseControlFrame(R"({"type":"resize","rows":24})");
  REQUIRE(missing.kind == ControlFrame::Kind::RESIZE);
  REQUIRE_FALSE(missing.sizeValid);
}

TEST_CASE("Anything that is not a control object is raw input",
          "[ControlFrame]") {
  for (const string text :
       {"ls -la\r", "{not json", "[1,2,3]", "\"input\"", R"({"data":"x"})",
        R"({"type":"launch","data":"x"})", R"({"type":5})",
        R"({"type":"input","data":12})",
        R"({"type":"resize","rows":-1,"cols":80})",
        R"({"type":"resize","rows":"40","cols":80})",
        R"({"type":"resize","rows":70000,"cols":80})"}) {
    INFO(text);
    auto frame = parseControlFrame(text);
    REQUIRE(frame.kind == ControlFrame::Kind::RAW);
    REQUIRE(frame.data == text);
  }
}

TEST_CASE("Encoded frames carry the expected fields", "[ControlFrame]") {
  json input = json::parse(encodeInputFrame("y\r"));
  REQUIRE(input["type"] == "input");
  REQUIRE(input["data"] == "y\r");

  TerminalInfo size;
  size.set_row(33);
  size.set_column(101);
  json resize = json::parse(encodeResizeFrame(size));
  REQUIRE(resize["type"] == "resize");
  REQUIRE(resize["rows"] == 33);
  REQUIRE(resize["cols"] == 101);

  json watcher = json::parse(encodePromptWatcherFrame(false));
  REQUIRE(watcher["type"] == "prompt_watcher");
  REQUIRE(watcher["data"] == "disable");
}

TEST_CASE("Invalid UTF-8 keystrokes still encode", "[ControlFrame]") {
  string encoded;
  REQUIRE_NOTHROW(encoded = encodeInputFrame(string("\xff\xfe", 2)));
  REQUIRE(parseControlFrame(encoded).kind == ControlFrame::Kind::INPUT);
}

TEST_CASE("Terminal sizes compare by value", "[ControlFrame]") {
  TerminalInfo a;
  a.set_row(24);
  a.set_column(80);
  TerminalInfo b = a;
  // Evaluated outside Catch's decomposer so the MessageLite operators in
  // Headers.hpp are found.
  bool same = (a == b);
  bool changed = (a != b);
  REQUIRE(same);
  REQUIRE_FALSE(changed);

  b.set_column(132);
  changed = (a != b);
  REQUIRE(changed);

  ControlFrame control =
      parseControlFrame(R"({"type":"resize","rows":24,"cols":80})");
  same = (control.size == a);
  REQUIRE(same);
}
