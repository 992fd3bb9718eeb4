/***
 * Name: gsc::schema::BuiltinSchemas
 * Purpose: In-tree schemas for the commonly used default-domain operators.
 * Theory of Operation:
 *   Schemas are registered per (domain, name) in since-version order.
 *   Operators whose signature moved attributes to inputs (Squeeze,
 *   Unsqueeze, Slice, Reduce*) carry one entry per signature.
 */
#pragma once

#include "schema/ISchemaRegistry.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gsc::schema {

    class BuiltinSchemas final : public ISchemaRegistry {
    public:
        BuiltinSchemas();

        const OpSchema *lookup(const std::string &domain, const std::string &name, int version) const override;

        void add(OpSchema schema);
        std::size_t size() const { return count_; }

    private:
        std::map<std::pair<std::string, std::string>, std::vector<OpSchema>> table_;
        std::size_t count_{0};
    };

} // namespace gsc::schema
