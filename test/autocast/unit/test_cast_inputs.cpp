/***
 * Name: test_cast_inputs
 * Purpose: Type-variable binding and casting in compiled and interpreted modes.
 */
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "autocast/CastInputs.h"
#include "autocast/DynamicCast.h"
#include "autocast/StaticCast.h"
#include "gsc/exceptions/arity_error.h"
#include "schema/BuiltinSchemas.h"

using namespace gsc;
using constant::PyValue;
using values::ValueHandle;

namespace {
const schema::OpSchema* schemaOf(const char* name) {
  static const schema::BuiltinSchemas reg;
  return reg.lookup("", name, 18);
}

// Records CastLike requests and names the result after the operand.
struct CastLikeLog {
  std::vector<std::pair<std::string, std::string>> calls;
  autocast::EmitCastLike emitter() {
    return [this](const std::string& operand, const std::string& like) {
      calls.emplace_back(operand, like);
      return operand + "_cast";
    };
  }
};
} // namespace

TEST(StaticCast, ConstantFollowsLaterSibling) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(schemaOf("Add"), {ValueHandle("one", true), ValueHandle("X", false)},
                                                log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"one_cast", "X"}));
  ASSERT_EQ(log.calls.size(), 1u);
  EXPECT_EQ(log.calls[0].second, "X");
}

TEST(StaticCast, NoCastBetweenValues) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(schemaOf("Add"), {ValueHandle("X", false), ValueHandle("Y", false)},
                                                log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"X", "Y"}));
  EXPECT_TRUE(log.calls.empty());
}

TEST(StaticCast, ConcreteFormalTypesNeverBind) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(schemaOf("Reshape"),
                                                {ValueHandle("X", false), ValueHandle("shape", true)}, log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"X", "shape"}));
  EXPECT_TRUE(log.calls.empty());
}

TEST(StaticCast, DistinctTypeVariablesStayIndependent) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(schemaOf("Pow"), {ValueHandle("X", false), ValueHandle("two", true)},
                                                log.emitter(), {});
  EXPECT_EQ(names[1], "two");
  EXPECT_TRUE(log.calls.empty());
}

TEST(StaticCast, VariadicRepeatsLastFormal) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(
      schemaOf("Max"), {ValueHandle("X", false), ValueHandle("c1", true), ValueHandle("c2", true)}, log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"X", "c1_cast", "c2_cast"}));
}

TEST(StaticCast, HeterogeneousVariadicDoesNotBind) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(
      schemaOf("Loop"), {ValueHandle("M", false), ValueHandle("cond", false), ValueHandle("s", false),
                         ValueHandle("k", true)},
      log.emitter(), {});
  EXPECT_EQ(names.size(), 4u);
  EXPECT_EQ(names[3], "k");
  EXPECT_TRUE(log.calls.empty());
}

TEST(StaticCast, OmittedOptionalInputStaysEmpty) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(
      schemaOf("Clip"), {ValueHandle("X", false), ValueHandle("", false), ValueHandle("hi", true)}, log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"X", "", "hi_cast"}));
}

TEST(StaticCast, UnknownSchemaPassesThrough) {
  CastLikeLog log;
  const auto names = autocast::staticCastInputs(nullptr, {ValueHandle("c", true), ValueHandle("X", false)},
                                                log.emitter(), {});
  EXPECT_EQ(names, (std::vector<std::string>{"c", "X"}));
  EXPECT_TRUE(log.calls.empty());
}

TEST(StaticCast, TooManyArgumentsRaise) {
  CastLikeLog log;
  EXPECT_THROW(autocast::staticCastInputs(schemaOf("Relu"), {ValueHandle("X", false), ValueHandle("Y", false)},
                                          log.emitter(), {}),
               exceptions::ArityError);
}

TEST(CastInputs, FirstKnownTypeWins) {
  const auto getType = [](const std::string& x) -> std::optional<std::string> {
    if (x.empty() || x[0] == '#') { return std::nullopt; }
    return x;
  };
  const auto cast = [](const std::string& x, const std::optional<std::string>& t) {
    return x + ":" + t.value_or("-");
  };
  const std::vector<std::string> args{"#1", "A", "B"};
  const auto out = autocast::castInputs<std::string>(getType, cast, schemaOf("Sum"), args, {});
  EXPECT_EQ(out, (std::vector<std::string>{"#1:A", "A:A", "B:A"}));
}

TEST(DynamicCast, LiteralTakesTensorType) {
  ir::TensorConst xData;
  xData.elemType = ir::ElemType::Double;
  xData.dims = {2};
  xData.floats = {1.0, 2.0};
  const std::vector<autocast::RuntimeValue> args{runtime::Tensor(xData), PyValue::integer(1)};
  const auto out = autocast::dynamicCastInputs(schemaOf("Add"), args);
  ASSERT_EQ(out.size(), 2u);
  const auto* one = std::get_if<runtime::Tensor>(&out[1]);
  ASSERT_NE(one, nullptr);
  EXPECT_EQ(one->elemType(), ir::ElemType::Double);
  EXPECT_EQ(one->rank(), 0u);
}

TEST(DynamicCast, UnboundLiteralUsesOwnType) {
  const std::vector<autocast::RuntimeValue> args{PyValue::floating(1.0), PyValue::floating(2.0)};
  const auto out = autocast::dynamicCastInputs(schemaOf("Add"), args);
  const auto* a = std::get_if<runtime::Tensor>(&out[0]);
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->elemType(), ir::ElemType::Float);
}

TEST(DynamicCast, NonPromotableValuesPassThrough) {
  const std::vector<autocast::RuntimeValue> args{PyValue::string("s")};
  const auto out = autocast::dynamicCastInputs(schemaOf("Identity"), args);
  ASSERT_TRUE(std::holds_alternative<PyValue>(out[0]));
  EXPECT_EQ(std::get<PyValue>(out[0]).s, "s");
}
