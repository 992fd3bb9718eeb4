/***
 * Name: gsc::schema::ISchemaRegistry
 * Purpose: Operator schema lookup consumed by the converter.
 * Theory of Operation:
 *   lookup returns the newest schema of (domain, name) whose since-version
 *   does not exceed the requested opset version, or null when the operator
 *   is unknown in that opset.
 */
#pragma once

#include "schema/OpSchema.h"
#include <string>

namespace gsc::schema {

    class ISchemaRegistry {
    public:
        virtual ~ISchemaRegistry() = default;
        virtual const OpSchema *lookup(const std::string &domain, const std::string &name, int version) const = 0;
    };

} // namespace gsc::schema
