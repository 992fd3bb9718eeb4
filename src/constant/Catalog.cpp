/***
 * Name: gsc::constant catalog
 * Purpose: Build the builtin module namespaces once and serve lookups.
 */
#include "constant/Catalog.h"
#include <array>
#include <map>

namespace gsc::constant {

    namespace {

        constexpr std::array<ir::ElemType, 14> kTensorTypes{
            ir::ElemType::Float,   ir::ElemType::Uint8,  ir::ElemType::Int8,    ir::ElemType::Uint16, ir::ElemType::Int16,
            ir::ElemType::Int32,   ir::ElemType::Int64,  ir::ElemType::String,  ir::ElemType::Bool,   ir::ElemType::Float16,
            ir::ElemType::Double,  ir::ElemType::Uint32, ir::ElemType::Uint64,  ir::ElemType::Bfloat16};

        Members opsetMembers() {
            Members m;
            for (int v = 1; v <= kMaxDefaultOpsetVersion; ++v) {
                m.emplace("opset" + std::to_string(v), PyValue::makeOpset(values::Opset{"", v}));
            }
            return m;
        }

        Members typeMembers() {
            Members m;
            for (const auto t : kTensorTypes) {
                m.emplace(ir::to_string(t), PyValue::typeObject(types::TypeInfo::tensor(t)));
            }
            return m;
        }

        Members typingMembers() {
            using types::GenericKind;
            Members m;
            m.emplace("List", PyValue::typeObject(types::TypeInfo::genericType(GenericKind::List)));
            m.emplace("Sequence", PyValue::typeObject(types::TypeInfo::genericType(GenericKind::Sequence)));
            m.emplace("Tuple", PyValue::typeObject(types::TypeInfo::genericType(GenericKind::Tuple)));
            m.emplace("Optional", PyValue::typeObject(types::TypeInfo::genericType(GenericKind::Optional)));
            return m;
        }

        const std::map<std::string, PyValue> &modules() {
            static const std::map<std::string, PyValue> table = [] {
                std::map<std::string, PyValue> t;
                PyValue opsets = PyValue::ns("gsc.opsets", opsetMembers());
                PyValue typesNs = PyValue::ns("gsc.types", typeMembers());
                Members root = opsetMembers();
                for (const auto& [name, value] : typeMembers()) { root.emplace(name, value); }
                root.emplace("opsets", opsets);
                root.emplace("types", typesNs);
                t.emplace("gsc", PyValue::ns("gsc", std::move(root)));
                t.emplace("gsc.opsets", std::move(opsets));
                t.emplace("gsc.types", std::move(typesNs));
                t.emplace("typing", PyValue::ns("typing", typingMembers()));
                return t;
            }();
            return table;
        }

    } // namespace

    std::optional<PyValue> lookupModule(const std::string &dottedPath) {
        const auto &table = modules();
        const auto it = table.find(dottedPath);
        if (it == table.end()) { return std::nullopt; }
        return it->second;
    }

    std::optional<PyValue> lookupBuiltin(const std::string &name) {
        using types::GenericKind;
        using types::ScalarKind;
        using types::TypeInfo;
        static const Members builtins = [] {
            Members m;
            m.emplace("int", PyValue::typeObject(TypeInfo::scalarType(ScalarKind::Int)));
            m.emplace("float", PyValue::typeObject(TypeInfo::scalarType(ScalarKind::Float)));
            m.emplace("str", PyValue::typeObject(TypeInfo::scalarType(ScalarKind::Str)));
            m.emplace("bool", PyValue::typeObject(TypeInfo::scalarType(ScalarKind::Bool)));
            m.emplace("list", PyValue::typeObject(TypeInfo::genericType(GenericKind::List)));
            m.emplace("tuple", PyValue::typeObject(TypeInfo::genericType(GenericKind::Tuple)));
            return m;
        }();
        const auto it = builtins.find(name);
        if (it == builtins.end()) { return std::nullopt; }
        return it->second;
    }

} // namespace gsc::constant
