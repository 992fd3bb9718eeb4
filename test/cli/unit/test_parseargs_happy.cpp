/***
 * Name: test_parseargs_happy
 * Purpose: Exercise happy-path CLI parsing for all supported flags.
 */
#include <gtest/gtest.h>
#include "cli/ParseArgs.h"

using namespace gsc::cli;

TEST(CLI_Happy, DefaultsAndInput) {
  const char* argv[] = {"gsc", "model.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.outputFile.empty());
  EXPECT_EQ(o.emit, EmitFormat::Text);
  EXPECT_EQ(o.domain, "this");
  EXPECT_FALSE(o.opset.has_value());
  EXPECT_EQ(o.logPath, ".");
  EXPECT_EQ(o.diagContext, 1);
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "model.py");
}

TEST(CLI_Happy, OutputFlag) {
  const char* argv[] = {"gsc", "-o", "out.txt", "model.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(4, const_cast<char**>(argv), o));
  EXPECT_EQ(o.outputFile, "out.txt");
  ASSERT_EQ(o.inputs.size(), 1u);
  EXPECT_EQ(o.inputs[0], "model.py");
}

TEST(CLI_Happy, EmitDomainOpset) {
  const char* argv[] = {"gsc", "--emit=json", "--domain=com.example", "--opset=17", "m.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(5, const_cast<char**>(argv), o));
  EXPECT_EQ(o.emit, EmitFormat::Json);
  EXPECT_EQ(o.domain, "com.example");
  ASSERT_TRUE(o.opset.has_value());
  EXPECT_EQ(*o.opset, 17);
}

TEST(CLI_Happy, MetricsFlags) {
  const char* argv1[] = {"gsc", "--metrics", "m.py"};
  Options o1; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv1), o1));
  EXPECT_TRUE(o1.metrics);

  const char* argv2[] = {"gsc", "--metrics-json", "m.py"};
  Options o2; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv2), o2));
  EXPECT_TRUE(o2.metricsJson);
}

TEST(CLI_Happy, ColorModes) {
  const char* argv1[] = {"gsc", "--color=always", "m.py"};
  Options o1; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv1), o1));
  EXPECT_EQ(o1.color, ColorMode::Always);

  const char* argv2[] = {"gsc", "--color=never", "m.py"};
  Options o2; ASSERT_TRUE(ParseArgs(3, const_cast<char**>(argv2), o2));
  EXPECT_EQ(o2.color, ColorMode::Never);
}

TEST(CLI_Happy, LoggingFlags) {
  const char* argv[] = {"gsc", "--ast-log", "--log-translate", "--log-path=logs", "--Werror", "m.py"};
  Options o;
  ASSERT_TRUE(ParseArgs(6, const_cast<char**>(argv), o));
  EXPECT_EQ(o.astLog, AstLogMode::Before);
  EXPECT_TRUE(o.logTranslate);
  EXPECT_EQ(o.logPath, "logs");
  EXPECT_TRUE(o.werror);
}

TEST(CLI_Happy, Help) {
  const char* argv[] = {"gsc", "--help"};
  Options o;
  ASSERT_TRUE(ParseArgs(2, const_cast<char**>(argv), o));
  EXPECT_TRUE(o.showHelp);
  EXPECT_TRUE(o.inputs.empty());
}
