//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Value.cpp
// Purpose: Implements the fluent constructors for places and operands.
// Key invariants: Projection helpers never mutate the receiver.
// Ownership/Lifetime: Returned values own their projection vectors.
//
//===----------------------------------------------------------------------===//

#include "ir/Value.hpp"

#include <utility>

namespace ember::ir
{

Place Place::fromLocal(Local l)
{
    Place p;
    p.local = l;
    return p;
}

Place Place::with(ProjectionElem::Kind kind, uint32_t index) const
{
    Place p = *this;
    p.projection.push_back(ProjectionElem{kind, index});
    return p;
}

Place Place::field(uint32_t index) const
{
    return with(ProjectionElem::Kind::Field, index);
}

Place Place::downcast(uint32_t variant) const
{
    return with(ProjectionElem::Kind::Downcast, variant);
}

Place Place::deref() const
{
    return with(ProjectionElem::Kind::Deref, 0);
}

Place Place::index(Local indexLocal) const
{
    return with(ProjectionElem::Kind::Index, indexLocal);
}

Place Place::constantIndex(uint32_t offset) const
{
    return with(ProjectionElem::Kind::ConstantIndex, offset);
}

Operand Operand::copy(Place p)
{
    Operand op;
    op.kind = Kind::Copy;
    op.place = std::move(p);
    return op;
}

Operand Operand::move(Place p)
{
    Operand op;
    op.kind = Kind::Move;
    op.place = std::move(p);
    return op;
}

Operand Operand::constantOf(TypeRef type, uint64_t bits)
{
    Operand op;
    op.kind = Kind::Constant;
    op.constant = Constant{type, bits};
    return op;
}

} // namespace ember::ir
