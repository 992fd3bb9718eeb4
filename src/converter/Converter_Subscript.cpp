/***
 * Name: gsc::converter::Converter (subscripts)
 * Purpose: Lower indexing and slicing to Slice, Squeeze and Gather nodes.
 * Theory of Operation:
 *   Per-axis specifiers are partitioned into ranges (a:b:c), scalar literals
 *   and computed indices; a bare ':' is a no-op. Ranges and, when there is
 *   more than one, scalar literals are combined into a single Slice whose
 *   start/end/axes/steps are 1-D int64 vectors (Concat(axis=0) when several
 *   axes are sliced); literal-scalar axes are then removed by one Squeeze.
 *   Remaining indices become a chain of single-axis Gathers, the last of
 *   which writes the requested name.
 */
#include "converter/Converter.h"
#include "constant/ConstEvaluator.h"
#include "gsc/exceptions/unsupported_construct_error.h"
#include <cstdint>
#include <limits>
#include <map>
#include <utility>

namespace gsc::converter {

    using constant::PyValue;
    using exceptions::UnsupportedConstructError;
    using values::ValueHandle;

    namespace {

        constexpr std::int64_t kMaxInt = std::numeric_limits<std::int64_t>::max();
        constexpr std::int64_t kMinInt = std::numeric_limits<std::int64_t>::min();

        struct SliceBounds {
            std::string start;
            std::string end;
            std::string step;
        };

    } // namespace

    ValueHandle Converter::translateSubscript(const ast::Subscript &s, const std::string &target) {
        const std::string varName = translateExpr(*s.value).name();
        const std::string result = names_.unique(target.empty() ? varName + "_subscripted" : target);

        std::vector<const ast::Expr*> specifiers;
        if (s.slice->kind == ast::NodeKind::TupleLiteral) {
            for (const auto &e : static_cast<const ast::TupleLiteral&>(*s.slice).elements) { specifiers.push_back(e.get()); }
        } else {
            specifiers.push_back(s.slice.get());
        }

        std::map<std::int64_t, std::string> cachedInts;
        const auto const1d = [&](const std::int64_t v) -> const std::string& {
            auto it = cachedInts.find(v);
            if (it == cachedInts.end()) {
                it = cachedInts.emplace(v, emitConst(PyValue::list({PyValue::integer(v)}), "", *s.slice).name()).first;
            }
            return it->second;
        };

        // Name of a 1-D bound plus its literal value when known.
        const auto component = [&](const ast::Expr *e, const std::optional<std::int64_t> fallback)
            -> std::pair<std::string, std::optional<std::int64_t>> {
            if (e == nullptr) {
                if (!fallback) {
                    throw UnsupportedConstructError(
                        "slice start and stop must be given explicitly when the step is not a literal", where(*s.slice));
                }
                return {const1d(*fallback), fallback};
            }
            if (constant::ConstEvaluator::isConstantExpr(*e)) {
                const PyValue v = evalConstant(*e);
                if (v.kind != constant::ValueKind::Int) {
                    throw UnsupportedConstructError("slice component must be an int, not " +
                                                        std::string(constant::to_string(v.kind)),
                                                    where(*e));
                }
                return {const1d(v.i), v.i};
            }
            const std::string name = translateExpr(*e).name();
            const std::string reshaped = names_.unique(name + "_reshaped");
            emit({reshaped}, "Reshape", {name, const1d(1)}, {}, *e);
            return {reshaped, std::nullopt};
        };

        const auto bounds = [&](const ast::Slice &sl) {
            const auto [stepName, step] = component(sl.step.get(), 1);
            SliceBounds out;
            out.step = stepName;
            if (!step) {
                out.start = component(sl.lower.get(), std::nullopt).first;
                out.end = component(sl.upper.get(), std::nullopt).first;
            } else if (*step > 0) {
                out.start = component(sl.lower.get(), 0).first;
                out.end = component(sl.upper.get(), kMaxInt).first;
            } else {
                out.start = component(sl.lower.get(), kMaxInt).first;
                out.end = component(sl.upper.get(), kMinInt).first;
            }
            return out;
        };

        std::vector<std::pair<std::int64_t, const ast::Slice*>> sliced;
        std::vector<std::pair<std::int64_t, std::int64_t>> scalars;
        std::vector<std::pair<std::int64_t, const ast::Expr*>> computed;
        for (std::size_t i = 0; i < specifiers.size(); ++i) {
            const ast::Expr *e = specifiers[i];
            const auto axis = static_cast<std::int64_t>(i);
            if (e->kind == ast::NodeKind::Slice) {
                const auto *sl = static_cast<const ast::Slice*>(e);
                if (sl->lower || sl->upper || sl->step) { sliced.emplace_back(axis, sl); }
            } else if (constant::ConstEvaluator::isConstantExpr(*e) && evalConstant(*e).kind == constant::ValueKind::Int) {
                scalars.emplace_back(axis, evalConstant(*e).i);
            } else {
                computed.emplace_back(axis, e);
            }
        }

        if (sliced.empty() && scalars.empty() && computed.empty()) {
            emit({result}, "Identity", {varName}, {}, s);
            return ValueHandle(result, false);
        }

        std::string current = varName;
        // (axis, literal index) pairs still to be gathered.
        std::vector<std::pair<std::int64_t, std::int64_t>> gatherScalars;
        if (!sliced.empty() || scalars.size() > 1) {
            std::vector<std::string> starts;
            std::vector<std::string> ends;
            std::vector<std::string> axes;
            std::vector<std::string> steps;
            std::vector<PyValue> squeezedAxes;
            for (const auto& [axis, sl] : sliced) {
                const SliceBounds b = bounds(*sl);
                starts.push_back(b.start);
                ends.push_back(b.end);
                axes.push_back(const1d(axis));
                steps.push_back(b.step);
            }
            // A literal index i is the unit range i:i+1 on an axis that is squeezed afterwards.
            for (const auto& [axis, index] : scalars) {
                squeezedAxes.push_back(PyValue::integer(axis));
                starts.push_back(const1d(index));
                ends.push_back(const1d(index == -1 || index == kMaxInt ? kMaxInt : index + 1));
                axes.push_back(const1d(axis));
                steps.push_back(const1d(1));
            }

            std::string startName = starts.front();
            std::string endName = ends.front();
            std::string axesName = axes.front();
            std::string stepsName = steps.front();
            if (starts.size() > 1) {
                const ir::Attr axis0 = *builder_.makeAttr("axis", PyValue::integer(0));
                startName = names_.unique(varName + "_start");
                emit({startName}, "Concat", starts, {axis0}, s);
                endName = names_.unique(varName + "_end");
                emit({endName}, "Concat", ends, {axis0}, s);
                axesName = names_.unique(varName + "_axis");
                emit({axesName}, "Concat", axes, {axis0}, s);
                stepsName = names_.unique(varName + "_step");
                emit({stepsName}, "Concat", steps, {axis0}, s);
            }

            const std::vector<std::string> sliceInputs{varName, startName, endName, axesName, stepsName};
            if (!squeezedAxes.empty()) {
                const std::string slicedName = names_.unique(varName + "_sliced");
                emit({slicedName}, "Slice", sliceInputs, {}, s);
                const std::string squeezeAxes = emitConst(PyValue::list(std::move(squeezedAxes)), "squeezed_axes", s).name();
                current = computed.empty() ? result : names_.unique(varName + "_squeezed");
                emit({current}, "Squeeze", {slicedName, squeezeAxes}, {}, s);
            } else {
                current = computed.empty() ? result : names_.unique(varName + "_sliced");
                emit({current}, "Slice", sliceInputs, {}, s);
            }
        } else {
            gatherScalars = scalars;
        }

        struct GatherStep {
            std::int64_t axis;
            const ast::Expr *index;
            std::optional<std::int64_t> literal;
        };
        std::vector<GatherStep> gathers;
        for (const auto& [axis, e] : computed) { gathers.push_back(GatherStep{axis, e, std::nullopt}); }
        for (const auto& [axis, index] : gatherScalars) { gathers.push_back(GatherStep{axis, nullptr, index}); }
        if (gathers.empty()) { return ValueHandle(current, false); }

        const std::int64_t lastAxis = gathers.back().axis;
        for (const auto &g : gathers) {
            const std::string index =
                g.literal ? emitConst(PyValue::integer(*g.literal), "", s).name() : translateExpr(*g.index).name();
            const std::string gathered =
                g.axis == lastAxis ? result : names_.unique(varName + "_axis_" + std::to_string(g.axis));
            emit({gathered}, "Gather", {current, index}, {*builder_.makeAttr("axis", PyValue::integer(g.axis))}, s);
            current = gathered;
        }
        return ValueHandle(current, false);
    }

} // namespace gsc::converter
