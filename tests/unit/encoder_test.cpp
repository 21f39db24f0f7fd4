#include <gtest/gtest.h>

#include "tcr/core/protocol/encoder.hpp"
#include "unit/test_support.hpp"

using namespace tcr;
using tcr::test_support::attr_value;
using tcr::test_support::kT0;
using tcr::test_support::kT0Text;
using tcr::test_support::message_names;
using tcr::test_support::node;

namespace {

const TestStep kPickle = PickleStep{"file:a.feature", 4, "I have 5 cukes", "com.example.Steps.iHave(int)"};

StepResult result(StepStatus status, DurationNs duration = ms_to_ns(15), std::optional<ErrorInfo> error = std::nullopt) {
  return StepResult{status, duration, std::move(error)};
}

class EncoderTest : public ::testing::Test {
 protected:
  ProtocolEncoder encoder_{ProtocolConfig{}};
};

}  // namespace

// =============================================================================
// Suites
// =============================================================================
TEST_F(EncoderTest, SuiteStartedCarriesLocationHint) {
  EXPECT_EQ(encoder_.suite_started(kT0, node("file:a.feature", 3, "Scenario", "eat")),
            std::string("##teamcity[testSuiteStarted timestamp='") + kT0Text +
                "' locationHint='file:a.feature:3' name='eat']");
}

TEST_F(EncoderTest, SuiteFinishedHasNoLocationHint) {
  EXPECT_EQ(encoder_.suite_finished(kT0, node("file:a.feature", 3, "Scenario", "eat")),
            std::string("##teamcity[testSuiteFinished timestamp='") + kT0Text + "' name='eat']");
}

TEST_F(EncoderTest, SuiteNameFallbacks) {
  EXPECT_EQ(ProtocolEncoder::suite_name(node("u", 1, "Examples", std::nullopt)), "Examples");
  EXPECT_EQ(ProtocolEncoder::suite_name(node("u", 1, std::nullopt, std::nullopt)), "Unknown");
  EXPECT_EQ(ProtocolEncoder::suite_name(node("u", 1, "Scenario", "")), "");
}

// =============================================================================
// Step names / location hints
// =============================================================================
TEST_F(EncoderTest, StepNames) {
  EXPECT_EQ(ProtocolEncoder::step_name(kPickle), "I have 5 cukes");
  EXPECT_EQ(ProtocolEncoder::step_name(HookStep{HookType::kBefore, ""}), "Before");
  EXPECT_EQ(ProtocolEncoder::step_name(HookStep{HookType::kAfter, ""}), "After");
  EXPECT_EQ(ProtocolEncoder::step_name(HookStep{HookType::kBeforeStep, ""}), "BeforeStep");
  EXPECT_EQ(ProtocolEncoder::step_name(HookStep{HookType::kAfterStep, ""}), "AfterStep");
  EXPECT_EQ(ProtocolEncoder::step_name(HookStep{HookType::kBeforeAll, ""}), "before_all");
  EXPECT_EQ(ProtocolEncoder::step_name(GenericStep{"x"}), "Unknown step");
}

TEST_F(EncoderTest, PickleStepStarted) {
  EXPECT_EQ(encoder_.step_started(kT0, kPickle),
            std::string("##teamcity[testStarted timestamp='") + kT0Text +
                "' locationHint='file:a.feature:4' captureStandardOutput='true' name='I have 5 cukes']");
}

TEST_F(EncoderTest, HookStepStartedResolvesCodeLocation) {
  const auto line = encoder_.step_started(kT0, HookStep{HookType::kBefore, "com.example.Hooks.setUp()"});
  EXPECT_EQ(attr_value(line, "locationHint"), "test://com.example.Hooks/setUp");
  EXPECT_EQ(attr_value(line, "name"), "Before");
}

TEST_F(EncoderTest, GenericStepKeepsUnrecognizedLocation) {
  EXPECT_EQ(encoder_.step_location_hint(GenericStep{"steps.js:12"}), "steps.js:12");
}

// =============================================================================
// Step finished status table
// =============================================================================
TEST_F(EncoderTest, PassedEmitsOnlyFinished) {
  const auto lines = encoder_.step_finished(kT0, kPickle, result(StepStatus::kPassed), "");
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], std::string("##teamcity[testFinished timestamp='") + kT0Text +
                          "' duration='15' name='I have 5 cukes']");
}

TEST_F(EncoderTest, SkippedWithoutError) {
  const auto lines = encoder_.step_finished(kT0, kPickle, result(StepStatus::kSkipped), "");
  EXPECT_EQ(message_names(lines), (std::vector<std::string>{"testIgnored", "testFinished"}));
  EXPECT_EQ(attr_value(lines[0], "message"), "Step skipped");
  EXPECT_EQ(attr_value(lines[0], "duration"), "15");
}

TEST_F(EncoderTest, SkippedWithErrorUsesItsMessage) {
  const auto lines = encoder_.step_finished(
      kT0, kPickle, result(StepStatus::kSkipped, 0, ErrorInfo{"AssumptionViolated", std::string("not on CI"), {}}), "");
  EXPECT_EQ(attr_value(lines[0], "message"), "not on CI");
}

TEST_F(EncoderTest, PendingWithAndWithoutError) {
  auto lines = encoder_.step_finished(kT0, kPickle, result(StepStatus::kPending), "");
  EXPECT_EQ(message_names(lines), (std::vector<std::string>{"testFailed", "testFinished"}));
  EXPECT_EQ(attr_value(lines[0], "message"), "Step pending");
  EXPECT_EQ(attr_value(lines[0], "details"), "");

  lines = encoder_.step_finished(
      kT0, kPickle, result(StepStatus::kPending, 0, ErrorInfo{"PendingException", std::string("TODO: implement me"), {}}),
      "");
  EXPECT_EQ(attr_value(lines[0], "details"), "TODO: implement me");
}

TEST_F(EncoderTest, UndefinedUsesSuppliedDetails) {
  const auto lines = encoder_.step_finished(kT0, kPickle, result(StepStatus::kUndefined), "snippet text\n");
  EXPECT_EQ(message_names(lines), (std::vector<std::string>{"testFailed", "testFinished"}));
  EXPECT_EQ(attr_value(lines[0], "message"), "Step undefined");
  EXPECT_EQ(attr_value(lines[0], "details"), "snippet text\n");
}

TEST_F(EncoderTest, FailedAndAmbiguousCarryFullDescription) {
  const ErrorInfo err{"AssertionError", std::string("expected 5 but was 4"),
                      {"com.example.Steps.iHave(Steps.java:12)", "java.base/Thread.run(Thread.java:833)"}};
  for (const auto status : {StepStatus::kFailed, StepStatus::kAmbiguous}) {
    const auto lines = encoder_.step_finished(kT0, kPickle, result(status, ms_to_ns(3), err), "");
    EXPECT_EQ(message_names(lines), (std::vector<std::string>{"testFailed", "testFinished"}));
    EXPECT_EQ(attr_value(lines[0], "message"), "Step failed");
    EXPECT_EQ(attr_value(lines[0], "details"),
              "AssertionError: expected 5 but was 4\n"
              "\tat com.example.Steps.iHave(Steps.java:12)\n"
              "\tat java.base/Thread.run(Thread.java:833)");
    EXPECT_EQ(attr_value(lines[1], "duration"), "3");
  }
}

TEST_F(EncoderTest, FailedWithoutErrorStillReported) {
  const auto lines = encoder_.step_finished(kT0, kPickle, result(StepStatus::kFailed), "");
  EXPECT_EQ(message_names(lines), (std::vector<std::string>{"testFailed", "testFinished"}));
  EXPECT_EQ(attr_value(lines[0], "details"), "");
}

// =============================================================================
// Attachments / configuration
// =============================================================================
TEST_F(EncoderTest, EmbedWithName) {
  const auto line = encoder_.embed(EmbedEvent{kT0, std::string("screenshot"), "image/png", 2048});
  EXPECT_EQ(line, "##teamcity[message text='Embed event: screenshot |[image/png 2048 bytes|]|n' status='NORMAL']");
}

TEST_F(EncoderTest, EmbedWithoutName) {
  const auto line = encoder_.embed(EmbedEvent{kT0, std::nullopt, "text/plain", 3});
  EXPECT_EQ(attr_value(line, "text"), "Embed event: [text/plain 3 bytes]\n");
}

TEST_F(EncoderTest, WriteWrapsText) {
  const auto line = encoder_.write(WriteEvent{kT0, "it's\nfine"});
  EXPECT_EQ(line, "##teamcity[message text='Write event:|nit|'s|nfine|n' status='NORMAL']");
}

TEST(EncoderConfig, CustomPrefixAndNames) {
  ProtocolConfig cfg;
  cfg.prefix = "myci";
  cfg.run_name = "Acceptance";
  cfg.progress_category = "Cases";
  const ProtocolEncoder encoder(cfg);

  EXPECT_EQ(encoder.run_started(kT0), std::string("##myci[testSuiteStarted timestamp='") + kT0Text + "' name='Acceptance']");
  EXPECT_EQ(encoder.counting_started(kT0),
            std::string("##myci[customProgressStatus testsCategory='Cases' count='0' timestamp='") + kT0Text + "']");
}
