#pragma once

#include "ast/VisitorBase.h"

namespace gsc::ast {

// CRTP mixin that equips concrete nodes with template apply() for ad-hoc
// visitors. Polymorphic accept(VisitorBase&) is provided by Node.
template <typename Derived, NodeKind K>
struct Acceptable {
    static constexpr NodeKind nodeKind = K;
    template <typename Visitor>
    void apply(Visitor& v) { v.visit(static_cast<Derived&>(*this)); }
    template <typename Visitor>
    void apply(Visitor& v) const { v.visit(static_cast<const Derived&>(*this)); }
};

} // namespace gsc::ast
