//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Instr.cpp
// Purpose: Implements the Rvalue factory helpers.
// Key invariants: Each factory sets exactly the fields its kind reads.
// Ownership/Lifetime: Returned rvalues own their operands.
//
//===----------------------------------------------------------------------===//

#include "ir/Instr.hpp"

#include <utility>

namespace ember::ir
{

Rvalue Rvalue::use(Operand op)
{
    Rvalue rv;
    rv.kind = Kind::Use;
    rv.operands.push_back(std::move(op));
    return rv;
}

Rvalue Rvalue::binary(BinOp op, Operand lhs, Operand rhs)
{
    Rvalue rv;
    rv.kind = Kind::BinaryOp;
    rv.binOp = op;
    rv.operands.push_back(std::move(lhs));
    rv.operands.push_back(std::move(rhs));
    return rv;
}

Rvalue Rvalue::checkedBinary(BinOp op, Operand lhs, Operand rhs)
{
    Rvalue rv = binary(op, std::move(lhs), std::move(rhs));
    rv.kind = Kind::CheckedBinaryOp;
    return rv;
}

Rvalue Rvalue::unary(UnOp op, Operand operand)
{
    Rvalue rv;
    rv.kind = Kind::UnaryOp;
    rv.unOp = op;
    rv.operands.push_back(std::move(operand));
    return rv;
}

Rvalue Rvalue::aggregateOf(AggregateKind kind, std::vector<Operand> fields)
{
    Rvalue rv;
    rv.kind = Kind::Aggregate;
    rv.aggregate = std::move(kind);
    rv.operands = std::move(fields);
    return rv;
}

Rvalue Rvalue::repeat(Operand op, uint64_t count)
{
    Rvalue rv;
    rv.kind = Kind::Repeat;
    rv.operands.push_back(std::move(op));
    rv.count = count;
    return rv;
}

Rvalue Rvalue::len(Place p)
{
    Rvalue rv;
    rv.kind = Kind::Len;
    rv.place = std::move(p);
    return rv;
}

Rvalue Rvalue::ref(Place p)
{
    Rvalue rv;
    rv.kind = Kind::Ref;
    rv.place = std::move(p);
    return rv;
}

Rvalue Rvalue::box(TypeRef type)
{
    Rvalue rv;
    rv.kind = Kind::NullaryOp;
    rv.nullOp = NullOp::Box;
    rv.type = type;
    return rv;
}

Rvalue Rvalue::sizeOf(TypeRef type)
{
    Rvalue rv;
    rv.kind = Kind::NullaryOp;
    rv.nullOp = NullOp::SizeOf;
    rv.type = type;
    return rv;
}

Rvalue Rvalue::cast(CastKind kind, Operand op, TypeRef target)
{
    Rvalue rv;
    rv.kind = Kind::Cast;
    rv.castKind = kind;
    rv.operands.push_back(std::move(op));
    rv.type = target;
    return rv;
}

Rvalue Rvalue::discriminant(Place p)
{
    Rvalue rv;
    rv.kind = Kind::Discriminant;
    rv.place = std::move(p);
    return rv;
}

} // namespace ember::ir
