/***
 * Name: gsc::schema::BuiltinSchemas
 * Purpose: Register and look up the builtin operator schemas.
 */
#include "schema/BuiltinSchemas.h"
#include <algorithm>
#include <initializer_list>
#include <string>
#include <utility>

namespace gsc::schema {

    namespace {

        using ir::AttrKind;

        constexpr const char *kInt64 = "tensor(int64)";
        constexpr const char *kBool = "tensor(bool)";

        FormalParameter in(std::string name, std::string type, const FormalOption opt = FormalOption::Single,
                           const bool homogeneous = true) {
            return FormalParameter{std::move(name), std::move(type), opt, homogeneous};
        }

        FormalParameter opt(std::string name, std::string type) {
            return in(std::move(name), std::move(type), FormalOption::Optional);
        }

        FormalParameter var(std::string name, std::string type, const bool homogeneous = true) {
            return in(std::move(name), std::move(type), FormalOption::Variadic, homogeneous);
        }

        AttributeSchema required(std::string name, const AttrKind kind) { return AttributeSchema{std::move(name), kind, true, false}; }

        AttributeSchema defaulted(std::string name, const AttrKind kind) { return AttributeSchema{std::move(name), kind, false, true}; }

        AttributeSchema optional(std::string name, const AttrKind kind) { return AttributeSchema{std::move(name), kind, false, false}; }

        OpSchema op(std::string name, const int since, std::vector<FormalParameter> inputs,
                    std::vector<FormalParameter> outputs, std::vector<AttributeSchema> attrs = {}) {
            OpSchema s;
            s.name = std::move(name);
            s.sinceVersion = since;
            s.inputs = std::move(inputs);
            s.outputs = std::move(outputs);
            s.attributes = std::move(attrs);
            return s;
        }

        void addUnary(BuiltinSchemas &reg, std::initializer_list<const char*> names) {
            for (const char *n : names) { reg.add(op(n, 1, {in("X", "T")}, {in("Y", "T")})); }
        }

        void addBinary(BuiltinSchemas &reg, std::initializer_list<const char*> names) {
            for (const char *n : names) { reg.add(op(n, 1, {in("A", "T"), in("B", "T")}, {in("C", "T")})); }
        }

        void addComparison(BuiltinSchemas &reg, std::initializer_list<const char*> names) {
            for (const char *n : names) { reg.add(op(n, 1, {in("A", "T"), in("B", "T")}, {in("C", "T1")})); }
        }

        void addVariadic(BuiltinSchemas &reg, std::initializer_list<const char*> names) {
            for (const char *n : names) { reg.add(op(n, 1, {var("data_0", "T")}, {in("result", "T")})); }
        }

        void addReductions(BuiltinSchemas &reg, std::initializer_list<const char*> names, const int inputAxesSince) {
            for (const char *n : names) {
                reg.add(op(n, 1, {in("data", "T")}, {in("reduced", "T")},
                           {optional("axes", AttrKind::Ints), defaulted("keepdims", AttrKind::Int)}));
                reg.add(op(n, inputAxesSince, {in("data", "T"), opt("axes", kInt64)}, {in("reduced", "T")},
                           {defaulted("keepdims", AttrKind::Int), defaulted("noop_with_empty_axes", AttrKind::Int)}));
            }
        }

    } // namespace

    BuiltinSchemas::BuiltinSchemas() {
        addUnary(*this, {"Abs", "Neg", "Exp", "Log", "Sqrt", "Relu", "Sigmoid", "Tanh", "Floor", "Ceil", "Reciprocal",
                               "Sign", "Sin", "Cos", "Tan", "Erf", "Softplus", "Round", "Identity", "Not", "BitwiseNot"});
        addBinary(*this, {"Add", "Sub", "Mul", "Div", "And", "Or", "Xor", "MatMul", "BitwiseAnd", "BitwiseOr",
                                "BitwiseXor"});
        addComparison(*this, {"Equal", "Less", "LessOrEqual", "Greater", "GreaterOrEqual"});
        addVariadic(*this, {"Max", "Min", "Sum", "Mean"});
        addReductions(*this, {"ReduceSum"}, 13);
        addReductions(*this, {"ReduceMean", "ReduceMax", "ReduceMin", "ReduceProd", "ReduceL2"}, 18);

        add(op("Pow", 1, {in("X", "T"), in("Y", "T1")}, {in("Z", "T")}));
        add(op("Mod", 10, {in("A", "T"), in("B", "T")}, {in("C", "T")}, {defaulted("fmod", AttrKind::Int)}));
        add(op("IsNaN", 9, {in("X", "T1")}, {in("Y", "T2")}));
        add(op("Where", 9, {in("condition", kBool), in("X", "T"), in("Y", "T")}, {in("output", "T")}));
        add(op("Cast", 1, {in("input", "T1")}, {in("output", "T2")}, {required("to", AttrKind::Int)}));
        add(op("CastLike", 15, {in("input", "T1"), in("target_type", "T2")}, {in("output", "T2")}));
        add(op("Constant", 1, {}, {in("output", "T")},
               {optional("value", AttrKind::Tensor), optional("value_float", AttrKind::Float),
                             optional("value_floats", AttrKind::Floats), optional("value_int", AttrKind::Int),
                             optional("value_ints", AttrKind::Ints), optional("value_string", AttrKind::String),
                             optional("value_strings", AttrKind::Strings)}));
        add(op("ConstantOfShape", 9, {in("input", kInt64)}, {in("output", "T2")}, {optional("value", AttrKind::Tensor)}));
        add(op("Shape", 1, {in("data", "T")}, {in("shape", kInt64)},
               {optional("end", AttrKind::Int), defaulted("start", AttrKind::Int)}));
        add(op("Size", 1, {in("data", "T")}, {in("size", kInt64)}));
        add(op("Reshape", 5, {in("data", "T"), in("shape", kInt64)}, {in("reshaped", "T")},
               {defaulted("allowzero", AttrKind::Int)}));
        add(op("Expand", 8, {in("input", "T"), in("shape", kInt64)}, {in("output", "T")}));
        add(op("Tile", 6, {in("input", "T"), in("repeats", kInt64)}, {in("output", "T")}));
        add(op("Transpose", 1, {in("data", "T")}, {in("transposed", "T")}, {optional("perm", AttrKind::Ints)}));
        add(op("Flatten", 1, {in("input", "T")}, {in("output", "T")}, {defaulted("axis", AttrKind::Int)}));
        add(op("Concat", 4, {var("inputs", "T")}, {in("concat_result", "T")}, {required("axis", AttrKind::Int)}));
        add(op("Split", 13, {in("input", "T"), opt("split", kInt64)}, {var("outputs", "T")},
               {defaulted("axis", AttrKind::Int), optional("num_outputs", AttrKind::Int)}));
        add(op("Slice", 1, {in("data", "T")}, {in("output", "T")},
               {optional("axes", AttrKind::Ints), required("ends", AttrKind::Ints), required("starts", AttrKind::Ints)}));
        add(op("Slice", 10,
               {in("data", "T"), in("starts", "Tind"), in("ends", "Tind"), opt("axes", "Tind"), opt("steps", "Tind")},
               {in("output", "T")}));
        add(op("Squeeze", 1, {in("data", "T")}, {in("squeezed", "T")}, {optional("axes", AttrKind::Ints)}));
        add(op("Squeeze", 13, {in("data", "T"), opt("axes", kInt64)}, {in("squeezed", "T")}));
        add(op("Unsqueeze", 1, {in("data", "T")}, {in("expanded", "T")}, {required("axes", AttrKind::Ints)}));
        add(op("Unsqueeze", 13, {in("data", "T"), in("axes", kInt64)}, {in("expanded", "T")}));
        add(op("Gather", 1, {in("data", "T"), in("indices", "Tind")}, {in("output", "T")},
               {defaulted("axis", AttrKind::Int)}));
        add(op("GatherElements", 11, {in("data", "T"), in("indices", "Tind")}, {in("output", "T")},
               {defaulted("axis", AttrKind::Int)}));
        add(op("Softmax", 1, {in("input", "T")}, {in("output", "T")}, {defaulted("axis", AttrKind::Int)}));
        add(op("LogSoftmax", 1, {in("input", "T")}, {in("output", "T")}, {defaulted("axis", AttrKind::Int)}));
        add(op("Gemm", 1, {in("A", "T"), in("B", "T"), opt("C", "T")}, {in("Y", "T")},
               {defaulted("alpha", AttrKind::Float), defaulted("beta", AttrKind::Float),
                             defaulted("transA", AttrKind::Int), defaulted("transB", AttrKind::Int)}));
        add(op("Clip", 11, {in("input", "T"), opt("min", "T"), opt("max", "T")}, {in("output", "T")}));
        add(op("Range", 11, {in("start", "T"), in("limit", "T"), in("delta", "T")}, {in("output", "T")}));
        add(op("Einsum", 12, {var("Inputs", "T")}, {in("Output", "T")}, {required("equation", AttrKind::String)}));
        add(op("ArgMax", 1, {in("data", "T")}, {in("reduced", kInt64)},
               {defaulted("axis", AttrKind::Int), defaulted("keepdims", AttrKind::Int),
                             defaulted("select_last_index", AttrKind::Int)}));
        add(op("TopK", 10, {in("X", "T"), in("K", kInt64)}, {in("Values", "T"), in("Indices", "I")},
               {defaulted("axis", AttrKind::Int), defaulted("largest", AttrKind::Int), defaulted("sorted", AttrKind::Int)}));
        add(op("If", 1, {in("cond", "B")}, {var("outputs", "V", false)},
               {required("then_branch", AttrKind::Graph), required("else_branch", AttrKind::Graph)}));
        add(op("Loop", 1, {opt("M", "I"), opt("cond", "B"), var("v_initial", "V", false)}, {var("v_final_and_scan_outputs", "V", false)},
               {required("body", AttrKind::Graph)}));
        add(op("Scan", 9, {var("initial_state_and_scan_inputs", "V", false)}, {var("final_state_and_scan_outputs", "V", false)},
               {required("body", AttrKind::Graph), required("num_scan_inputs", AttrKind::Int),
                             optional("scan_input_axes", AttrKind::Ints), optional("scan_input_directions", AttrKind::Ints),
                             optional("scan_output_axes", AttrKind::Ints), optional("scan_output_directions", AttrKind::Ints)}));
    }

    void BuiltinSchemas::add(OpSchema schema) {
        auto &versions = table_[{schema.domain, schema.name}];
        versions.push_back(std::move(schema));
        std::stable_sort(versions.begin(), versions.end(),
                         [](const OpSchema &a, const OpSchema &b) { return a.sinceVersion < b.sinceVersion; });
        ++count_;
    }

    const OpSchema *BuiltinSchemas::lookup(const std::string &domain, const std::string &name, const int version) const {
        const auto it = table_.find({domain, name});
        if (it == table_.end()) { return nullptr; }
        const OpSchema *best = nullptr;
        for (const auto &s : it->second) {
            if (s.sinceVersion <= version) { best = &s; }
        }
        return best;
    }

} // namespace gsc::schema
