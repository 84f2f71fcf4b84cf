//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Printer.cpp
// Purpose: Renders IR places, operands and instructions as text.
// Key invariants: Locals print as `_N`, constants as `const <bits>_<type>`.
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "ir/Printer.hpp"

#include <sstream>

namespace ember::ir
{

std::string_view toString(BinOp op)
{
    switch (op)
    {
        case BinOp::Add:
            return "Add";
        case BinOp::Sub:
            return "Sub";
        case BinOp::Mul:
            return "Mul";
        case BinOp::Div:
            return "Div";
        case BinOp::Rem:
            return "Rem";
        case BinOp::BitXor:
            return "BitXor";
        case BinOp::BitAnd:
            return "BitAnd";
        case BinOp::BitOr:
            return "BitOr";
        case BinOp::Shl:
            return "Shl";
        case BinOp::Shr:
            return "Shr";
        case BinOp::Eq:
            return "Eq";
        case BinOp::Lt:
            return "Lt";
        case BinOp::Le:
            return "Le";
        case BinOp::Ne:
            return "Ne";
        case BinOp::Ge:
            return "Ge";
        case BinOp::Gt:
            return "Gt";
        case BinOp::Offset:
            return "Offset";
    }
    return "?";
}

std::string_view toString(UnOp op)
{
    return op == UnOp::Not ? "Not" : "Neg";
}

std::string_view toString(CastKind kind)
{
    switch (kind)
    {
        case CastKind::Misc:
            return "Misc";
        case CastKind::Unsize:
            return "Unsize";
        case CastKind::ReifyFnPointer:
            return "ReifyFnPointer";
        case CastKind::ClosureFnPointer:
            return "ClosureFnPointer";
        case CastKind::UnsafeFnPointer:
            return "UnsafeFnPointer";
    }
    return "?";
}

std::string toString(const Place &place)
{
    std::string out = "_" + std::to_string(place.local);
    for (const auto &elem : place.projection)
    {
        switch (elem.kind)
        {
            case ProjectionElem::Kind::Field:
                out += "." + std::to_string(elem.index);
                break;
            case ProjectionElem::Kind::Downcast:
                out = "(" + out + " as " + std::to_string(elem.index) + ")";
                break;
            case ProjectionElem::Kind::Deref:
                out = "(*" + out + ")";
                break;
            case ProjectionElem::Kind::Index:
                out += "[_" + std::to_string(elem.index) + "]";
                break;
            case ProjectionElem::Kind::ConstantIndex:
                out += "[" + std::to_string(elem.index) + "]";
                break;
        }
    }
    return out;
}

std::string toString(const Operand &operand)
{
    switch (operand.kind)
    {
        case Operand::Kind::Copy:
            return toString(operand.place);
        case Operand::Kind::Move:
            return "move " + toString(operand.place);
        case Operand::Kind::Constant:
            return "const " + std::to_string(operand.constant.bits) + "_" +
                   (operand.constant.type ? operand.constant.type->toString() : "?");
    }
    return "?";
}

namespace
{
std::string joinOperands(const std::vector<Operand> &ops)
{
    std::string out;
    for (size_t i = 0; i < ops.size(); ++i)
    {
        if (i)
            out += ", ";
        out += toString(ops[i]);
    }
    return out;
}

std::string typeName(TypeRef t)
{
    return t ? t->toString() : "?";
}
} // namespace

std::string toString(const Rvalue &rv)
{
    switch (rv.kind)
    {
        case Rvalue::Kind::Use:
            return joinOperands(rv.operands);
        case Rvalue::Kind::Repeat:
            return "[" + joinOperands(rv.operands) + "; " + std::to_string(rv.count) + "]";
        case Rvalue::Kind::Ref:
            return "&" + toString(rv.place);
        case Rvalue::Kind::Len:
            return "Len(" + toString(rv.place) + ")";
        case Rvalue::Kind::Cast:
            return joinOperands(rv.operands) + " as " + typeName(rv.type) + " (" +
                   std::string(toString(rv.castKind)) + ")";
        case Rvalue::Kind::BinaryOp:
            return std::string(toString(rv.binOp)) + "(" + joinOperands(rv.operands) + ")";
        case Rvalue::Kind::CheckedBinaryOp:
            return "Checked" + std::string(toString(rv.binOp)) + "(" + joinOperands(rv.operands) +
                   ")";
        case Rvalue::Kind::NullaryOp:
            return (rv.nullOp == NullOp::Box ? "Box(" : "SizeOf(") + typeName(rv.type) + ")";
        case Rvalue::Kind::UnaryOp:
            return std::string(toString(rv.unOp)) + "(" + joinOperands(rv.operands) + ")";
        case Rvalue::Kind::Discriminant:
            return "discriminant(" + toString(rv.place) + ")";
        case Rvalue::Kind::Aggregate:
        {
            const auto &agg = rv.aggregate;
            switch (agg.kind)
            {
                case AggregateKind::Kind::Array:
                    return "[" + joinOperands(rv.operands) + "]";
                case AggregateKind::Kind::Tuple:
                    return "(" + joinOperands(rv.operands) + ")";
                case AggregateKind::Kind::Adt:
                {
                    std::string name = typeName(agg.type);
                    if (agg.type && agg.type->kind == Type::Kind::Enum &&
                        agg.variant < agg.type->variants.size())
                        name += "::" + agg.type->variants[agg.variant].name;
                    return name + "(" + joinOperands(rv.operands) + ")";
                }
            }
            break;
        }
    }
    return "?";
}

std::string toString(const Statement &stmt)
{
    switch (stmt.kind)
    {
        case Statement::Kind::Assign:
            return toString(stmt.place) + " = " + toString(stmt.rvalue);
        case Statement::Kind::SetDiscriminant:
            return "discriminant(" + toString(stmt.place) + ") = " + std::to_string(stmt.variant);
        case Statement::Kind::StorageLive:
            return "StorageLive(_" + std::to_string(stmt.local) + ")";
        case Statement::Kind::StorageDead:
            return "StorageDead(_" + std::to_string(stmt.local) + ")";
        case Statement::Kind::ReadForMatch:
            return "ReadForMatch(" + toString(stmt.place) + ")";
        case Statement::Kind::Validate:
        {
            std::string out = "Validate(";
            switch (stmt.validationOp)
            {
                case ValidationOp::Acquire:
                    out += "Acquire";
                    break;
                case ValidationOp::Release:
                    out += "Release";
                    break;
                case ValidationOp::Suspend:
                    out += "Suspend";
                    break;
            }
            out += ", [";
            for (size_t i = 0; i < stmt.validationOperands.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += toString(stmt.validationOperands[i].place);
            }
            return out + "])";
        }
        case Statement::Kind::EndRegion:
            return "EndRegion(" + (stmt.region ? std::to_string(*stmt.region) : std::string("'_")) +
                   ")";
        case Statement::Kind::UserAssertTy:
            return "UserAssertTy(" + toString(stmt.place) + ")";
        case Statement::Kind::Nop:
            return "nop";
        case Statement::Kind::InlineAsm:
            return "asm!(\"" + stmt.asmText + "\")";
    }
    return "?";
}

std::string toString(const Terminator &term)
{
    std::ostringstream os;
    auto block = [](std::optional<BlockId> b)
    { return b ? "bb" + std::to_string(*b) : std::string("!"); };
    switch (term.kind)
    {
        case Terminator::Kind::Goto:
            os << "goto -> " << block(term.target);
            break;
        case Terminator::Kind::SwitchInt:
            os << "switchInt(" << toString(term.operand) << ") -> [";
            for (size_t i = 0; i < term.targets.size(); ++i)
            {
                if (i)
                    os << ", ";
                if (i < term.values.size())
                    os << term.values[i] << ": ";
                else
                    os << "otherwise: ";
                os << "bb" << term.targets[i];
            }
            os << "]";
            break;
        case Terminator::Kind::Return:
            os << "return";
            break;
        case Terminator::Kind::Call:
            if (term.destination)
                os << toString(*term.destination) << " = ";
            os << term.callee << "(" << joinOperands(term.args) << ") -> " << block(term.target);
            break;
        case Terminator::Kind::Assert:
            os << "assert(" << (term.expected ? "" : "!") << toString(term.operand) << ") -> "
               << block(term.target);
            break;
        case Terminator::Kind::Drop:
            os << "drop(" << toString(term.place) << ") -> " << block(term.target);
            break;
        case Terminator::Kind::Unreachable:
            os << "unreachable";
            break;
        case Terminator::Kind::Abort:
            os << "abort";
            break;
    }
    return os.str();
}

} // namespace ember::ir
