//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Operators.cpp
// Purpose: Implements binary and unary operators on scalars, with the
//          overflow flag used by checked arithmetic.
// Key invariants: The value of a checked operation is always the wrapped
//                 result; the flag is set iff it differs from the exact one.
//                 Division and remainder by zero fail instead of wrapping.
// Ownership/Lifetime: Stateless helpers plus Engine members.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

#include "ir/Printer.hpp"

#include <limits>
#include <string>
#include <type_traits>

namespace ember::interp
{

namespace
{
/// @brief Apply @p op to @p lhs and @p rhs reinterpreted as @p T.
template <typename T, typename OverflowOp>
BinaryResult applyOverflowing(uint64_t lhs, uint64_t rhs, uint8_t size, OverflowOp op)
{
    T result{};
    const bool overflowed = op(static_cast<T>(lhs), static_cast<T>(rhs), &result);
    return BinaryResult{Scalar::fromUint(static_cast<uint64_t>(result), size), overflowed};
}

/// @brief Select the host integer type matching @p size and signedness.
template <typename OverflowOp>
BinaryResult dispatchOverflowing(
    bool isSigned, uint8_t size, uint64_t lhs, uint64_t rhs, OverflowOp op)
{
    switch (size)
    {
        case 1:
            return isSigned ? applyOverflowing<int8_t>(lhs, rhs, size, op)
                            : applyOverflowing<uint8_t>(lhs, rhs, size, op);
        case 2:
            return isSigned ? applyOverflowing<int16_t>(lhs, rhs, size, op)
                            : applyOverflowing<uint16_t>(lhs, rhs, size, op);
        case 4:
            return isSigned ? applyOverflowing<int32_t>(lhs, rhs, size, op)
                            : applyOverflowing<uint32_t>(lhs, rhs, size, op);
        case 8:
        default:
            return isSigned ? applyOverflowing<int64_t>(lhs, rhs, size, op)
                            : applyOverflowing<uint64_t>(lhs, rhs, size, op);
    }
}

/// @brief Divide or take the remainder; `MIN / -1` wraps and sets the flag.
template <typename T> BinaryResult applyDivision(uint64_t lhs, uint64_t rhs, uint8_t size, bool rem)
{
    const T a = static_cast<T>(lhs);
    const T b = static_cast<T>(rhs);
    if constexpr (std::is_signed_v<T>)
    {
        if (a == std::numeric_limits<T>::min() && b == static_cast<T>(-1))
            return BinaryResult{Scalar::fromUint(rem ? 0 : lhs, size), true};
    }
    const T result = static_cast<T>(rem ? a % b : a / b);
    return BinaryResult{Scalar::fromUint(static_cast<uint64_t>(result), size), false};
}

BinaryResult dispatchDivision(bool isSigned, uint8_t size, uint64_t lhs, uint64_t rhs, bool rem)
{
    switch (size)
    {
        case 1:
            return isSigned ? applyDivision<int8_t>(lhs, rhs, size, rem)
                            : applyDivision<uint8_t>(lhs, rhs, size, rem);
        case 2:
            return isSigned ? applyDivision<int16_t>(lhs, rhs, size, rem)
                            : applyDivision<uint16_t>(lhs, rhs, size, rem);
        case 4:
            return isSigned ? applyDivision<int32_t>(lhs, rhs, size, rem)
                            : applyDivision<uint32_t>(lhs, rhs, size, rem);
        case 8:
        default:
            return isSigned ? applyDivision<int64_t>(lhs, rhs, size, rem)
                            : applyDivision<uint64_t>(lhs, rhs, size, rem);
    }
}

bool isComparison(ir::BinOp op)
{
    switch (op)
    {
        case ir::BinOp::Eq:
        case ir::BinOp::Ne:
        case ir::BinOp::Lt:
        case ir::BinOp::Le:
        case ir::BinOp::Gt:
        case ir::BinOp::Ge:
            return true;
        default:
            return false;
    }
}

template <typename T> bool compare(ir::BinOp op, T l, T r)
{
    switch (op)
    {
        case ir::BinOp::Eq:
            return l == r;
        case ir::BinOp::Ne:
            return l != r;
        case ir::BinOp::Lt:
            return l < r;
        case ir::BinOp::Le:
            return l <= r;
        case ir::BinOp::Gt:
            return l > r;
        case ir::BinOp::Ge:
            return l >= r;
        default:
            return false;
    }
}

/// @brief Byte offset reached by moving @p offset by @p countBits elements of
///        @p elemSize bytes; a signed count may move backwards.
/// @return OutOfBounds when the result is negative or does not fit 64 bits.
EvalResult<uint64_t> offsetTarget(
    uint64_t offset, uint64_t countBits, bool isSigned, uint8_t countSize, uint64_t elemSize)
{
    const EvalError overflow = makeEvalError(EvalErrorKind::OutOfBounds,
                                             "pointer offset overflows the address space");
    if (!isSigned)
    {
        uint64_t delta = 0;
        uint64_t target = 0;
        if (__builtin_mul_overflow(countBits, elemSize, &delta) ||
            __builtin_add_overflow(offset, delta, &target))
            return overflow;
        return target;
    }

    const int64_t count = signExtend(countBits, countSize);
    int64_t delta = 0;
    int64_t target = 0;
    if (elemSize > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ||
        offset > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) ||
        __builtin_mul_overflow(count, static_cast<int64_t>(elemSize), &delta) ||
        __builtin_add_overflow(static_cast<int64_t>(offset), delta, &target))
        return overflow;
    if (target < 0)
        return makeEvalError(EvalErrorKind::OutOfBounds,
                             "pointer offset before the start of its allocation");
    return static_cast<uint64_t>(target);
}

EvalError unsupportedOperator(ir::BinOp op, ir::TypeRef type)
{
    return makeEvalError(EvalErrorKind::InternalInconsistency,
                         "operator " + std::string(ir::toString(op)) + " is not defined on " +
                             type->toString());
}
} // namespace

EvalResult<BinaryResult> Engine::binaryOp(ir::BinOp op, const ValTy &lhs, const ValTy &rhs)
{
    const ir::TypeRef type = lhs.layout->type;
    if (lhs.value.kind != Immediate::Kind::Scalar || rhs.value.kind != Immediate::Kind::Scalar)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "binary operator applied to a non-scalar value");

    // Pointers: offset and (in)equality.
    if (type->kind == ir::Type::Kind::Ref)
    {
        auto l = lhs.value.first.notUndef();
        if (!l)
            return l.error();
        auto r = rhs.value.first.notUndef();
        if (!r)
            return r.error();
        if (op == ir::BinOp::Offset)
        {
            auto base = l.value().toPointer();
            if (!base)
                return base.error();
            auto countBits = r.value().toBits(static_cast<uint8_t>(rhs.layout->size));
            if (!countBits)
                return countBits.error();
            auto pointee = layoutOf(type->element);
            if (!pointee)
                return pointee.error();
            auto target = offsetTarget(base.value().offset,
                                       countBits.value(),
                                       rhs.layout->type->isSigned(),
                                       static_cast<uint8_t>(rhs.layout->size),
                                       pointee.value()->size);
            if (!target)
                return target.error();
            auto moved = memory_.pointerOffset(Pointer{base.value().alloc, 0}, target.value());
            if (!moved)
                return moved.error();
            return BinaryResult{Scalar::fromPointer(moved.value(), pointerSize()), false};
        }
        if (op != ir::BinOp::Eq && op != ir::BinOp::Ne)
            return unsupportedOperator(op, type);
        if (l.value().kind != r.value().kind)
            return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                 "comparing a pointer with an integer");
        const bool equal = l.value() == r.value();
        return BinaryResult{Scalar::fromBool(op == ir::BinOp::Eq ? equal : !equal), false};
    }

    const bool isShift = op == ir::BinOp::Shl || op == ir::BinOp::Shr;
    if (!isShift && lhs.layout->type != rhs.layout->type)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "mismatched operand types " + type->toString() + " and " +
                                 rhs.layout->type->toString() + " for " +
                                 std::string(ir::toString(op)));

    if (type->kind == ir::Type::Kind::Bool)
    {
        auto l = lhs.value.first.toBool();
        if (!l)
            return l.error();
        auto r = rhs.value.first.toBool();
        if (!r)
            return r.error();
        if (isComparison(op))
            return BinaryResult{Scalar::fromBool(compare(op, l.value(), r.value())), false};
        switch (op)
        {
            case ir::BinOp::BitAnd:
                return BinaryResult{Scalar::fromBool(l.value() && r.value()), false};
            case ir::BinOp::BitOr:
                return BinaryResult{Scalar::fromBool(l.value() || r.value()), false};
            case ir::BinOp::BitXor:
                return BinaryResult{Scalar::fromBool(l.value() != r.value()), false};
            default:
                return unsupportedOperator(op, type);
        }
    }

    if (!type->isInteger())
        return unsupportedOperator(op, type);

    const uint8_t size = static_cast<uint8_t>(lhs.layout->size);
    const bool isSigned = type->isSigned();
    auto lBits = lhs.value.first.toBits(size);
    if (!lBits)
        return lBits.error();
    auto rBits = rhs.value.first.toBits(static_cast<uint8_t>(rhs.layout->size));
    if (!rBits)
        return rBits.error();
    const uint64_t l = lBits.value();
    const uint64_t r = rBits.value();

    if (isShift)
    {
        if (!rhs.layout->type->isInteger())
            return unsupportedOperator(op, rhs.layout->type);
        const uint64_t width = uint64_t{size} * 8;
        bool overflowed = false;
        uint64_t amount = 0;
        if (rhs.layout->type->isSigned())
        {
            const int64_t signedAmount = signExtend(r, rhs.layout->size);
            overflowed = signedAmount < 0 || static_cast<uint64_t>(signedAmount) >= width;
            amount = static_cast<uint64_t>(signedAmount) & (width - 1);
        }
        else
        {
            overflowed = r >= width;
            amount = r & (width - 1);
        }
        uint64_t result = 0;
        if (op == ir::BinOp::Shl)
            result = l << amount;
        else if (isSigned)
            result = static_cast<uint64_t>(signExtend(l, size) >> amount);
        else
            result = l >> amount;
        return BinaryResult{Scalar::fromUint(result, size), overflowed};
    }

    if (isComparison(op))
    {
        const bool holds = isSigned ? compare(op, signExtend(l, size), signExtend(r, size))
                                    : compare(op, l, r);
        return BinaryResult{Scalar::fromBool(holds), false};
    }

    switch (op)
    {
        case ir::BinOp::Add:
            return dispatchOverflowing(isSigned, size, l, r, [](auto a, auto b, auto *res)
                                       { return __builtin_add_overflow(a, b, res); });
        case ir::BinOp::Sub:
            return dispatchOverflowing(isSigned, size, l, r, [](auto a, auto b, auto *res)
                                       { return __builtin_sub_overflow(a, b, res); });
        case ir::BinOp::Mul:
            return dispatchOverflowing(isSigned, size, l, r, [](auto a, auto b, auto *res)
                                       { return __builtin_mul_overflow(a, b, res); });
        case ir::BinOp::Div:
            if (r == 0)
                return makeEvalError(EvalErrorKind::DivisionByZero, "attempt to divide by zero");
            return dispatchDivision(isSigned, size, l, r, false);
        case ir::BinOp::Rem:
            if (r == 0)
                return makeEvalError(EvalErrorKind::DivisionByZero,
                                     "attempt to calculate the remainder with a divisor of zero");
            return dispatchDivision(isSigned, size, l, r, true);
        case ir::BinOp::BitAnd:
            return BinaryResult{Scalar::fromUint(l & r, size), false};
        case ir::BinOp::BitOr:
            return BinaryResult{Scalar::fromUint(l | r, size), false};
        case ir::BinOp::BitXor:
            return BinaryResult{Scalar::fromUint(l ^ r, size), false};
        default:
            return unsupportedOperator(op, type);
    }
}

EvalResult<Scalar> Engine::unaryOp(ir::UnOp op, Scalar value, const Layout *layout)
{
    const ir::TypeRef type = layout->type;
    if (type->kind == ir::Type::Kind::Bool && op == ir::UnOp::Not)
    {
        auto b = value.toBool();
        if (!b)
            return b.error();
        return Scalar::fromBool(!b.value());
    }
    if (!type->isInteger())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "operator " + std::string(ir::toString(op)) + " is not defined on " +
                                 type->toString());

    const uint8_t size = static_cast<uint8_t>(layout->size);
    auto bits = value.toBits(size);
    if (!bits)
        return bits.error();
    if (op == ir::UnOp::Not)
        return Scalar::fromUint(~bits.value(), size);
    if (!type->isSigned())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "negation of unsigned type " + type->toString());
    return Scalar::fromUint(uint64_t{0} - bits.value(), size);
}

} // namespace ember::interp
