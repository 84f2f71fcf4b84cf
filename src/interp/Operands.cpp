//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Operands.cpp
// Purpose: Implements operand evaluation and value transfer between locals,
//          immediates and memory.
// Key invariants: Copies never change the size of a value; zero-sized values
//                 are never read or written.
// Ownership/Lifetime: Operands borrow the storage they refer to.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

namespace ember::interp
{

EvalResult<OpTy> Engine::evalOperand(const ir::Operand &op, const Layout *hint)
{
    switch (op.kind)
    {
        case ir::Operand::Kind::Copy:
        case ir::Operand::Kind::Move:
        {
            auto place = evalPlace(op.place);
            if (!place)
                return place.error();
            return placeToOp(place.value());
        }
        case ir::Operand::Kind::Constant:
            break;
    }

    auto type = monomorphize(op.constant.type);
    if (!type)
        return type.error();
    const Layout *layout = hint;
    if (!layout || layout->type != type.value())
    {
        auto computed = layoutOf(type.value());
        if (!computed)
            return computed.error();
        layout = computed.value();
    }
    if (layout->isZst())
        return OpTy::fromImmediate(Immediate{}, layout);
    if (layout->abi != Layout::Abi::Scalar)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "constant of non-scalar type " + type.value()->toString());
    return OpTy::fromImmediate(
        Immediate::fromScalar(Scalar::fromUint(op.constant.bits, static_cast<uint8_t>(layout->size))),
        layout);
}

EvalResult<OpTy> Engine::placeToOp(const PlaceTy &place)
{
    if (place.place.kind == Place::Kind::Memory)
        return OpTy::fromMem(place.place.mem, place.layout);

    const LocalValue &lv = localAt(place.place);
    switch (lv.state)
    {
        case LocalValue::State::Dead:
            return makeEvalError(EvalErrorKind::InvalidValue,
                                 "use of dead local _" + std::to_string(place.place.local));
        case LocalValue::State::Immediate:
            return OpTy::fromImmediate(lv.imm, place.layout);
        case LocalValue::State::Indirect:
            break;
    }
    return OpTy::fromMem(MemPlace{lv.ptr, std::nullopt, place.layout->align}, place.layout);
}

EvalResult<Immediate> Engine::readImmediateFromMem(const MemPlace &mem, const Layout *layout)
{
    switch (layout->abi)
    {
        case Layout::Abi::Scalar:
        {
            auto s = memory_.readScalar(mem.ptr, layout->size);
            if (!s)
                return s.error();
            return Immediate::fromScalar(s.value());
        }
        case Layout::Abi::ScalarPair:
        {
            auto a = memory_.readScalar(mem.ptr, layout->fields[0]->size);
            if (!a)
                return a.error();
            auto second = memory_.pointerOffset(mem.ptr, layout->fieldOffsets[1]);
            if (!second)
                return second.error();
            auto b = memory_.readScalar(second.value(), layout->fields[1]->size);
            if (!b)
                return b.error();
            return Immediate::fromPair(a.value(), b.value());
        }
        case Layout::Abi::Aggregate:
        case Layout::Abi::Uninhabited:
            break;
    }
    return makeEvalError(EvalErrorKind::InternalInconsistency,
                         "value of type " + layout->type->toString() +
                             " cannot be read as an immediate");
}

EvalResult<void> Engine::writeImmediateToMem(Immediate value,
                                             const MemPlace &mem,
                                             const Layout *layout)
{
    if (layout->abi == Layout::Abi::Scalar && value.kind == Immediate::Kind::Scalar)
        return memory_.writeScalar(mem.ptr, value.first, layout->size);
    if (layout->abi == Layout::Abi::ScalarPair && value.kind == Immediate::Kind::ScalarPair)
    {
        auto r = memory_.writeScalar(mem.ptr, value.first, layout->fields[0]->size);
        if (!r)
            return r;
        auto second = memory_.pointerOffset(mem.ptr, layout->fieldOffsets[1]);
        if (!second)
            return second.error();
        return memory_.writeScalar(second.value(), value.second, layout->fields[1]->size);
    }
    return makeEvalError(EvalErrorKind::InternalInconsistency,
                         "immediate does not match the layout of " + layout->type->toString());
}

EvalResult<ValTy> Engine::readValue(const OpTy &op)
{
    if (op.kind == OpTy::Kind::Immediate)
        return ValTy{op.imm, op.layout};
    auto imm = readImmediateFromMem(op.mem, op.layout);
    if (!imm)
        return imm.error();
    return ValTy{imm.value(), op.layout};
}

EvalResult<Scalar> Engine::readScalar(const OpTy &op)
{
    auto value = readValue(op);
    if (!value)
        return value.error();
    if (value.value().value.kind != Immediate::Kind::Scalar)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "expected a scalar of type " + op.layout->type->toString() +
                                 ", found a pair");
    return value.value().value.first;
}

EvalResult<void> Engine::writeImmediate(Immediate value, const PlaceTy &dest)
{
    if (dest.place.kind == Place::Kind::Memory)
        return writeImmediateToMem(value, dest.place.mem, dest.layout);

    LocalValue &lv = localAt(dest.place);
    switch (lv.state)
    {
        case LocalValue::State::Dead:
            return makeEvalError(EvalErrorKind::InvalidValue,
                                 "write to dead local _" + std::to_string(dest.place.local));
        case LocalValue::State::Immediate:
            if (lv.imm.kind != value.kind)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "immediate does not match the layout of " +
                                         dest.layout->type->toString());
            lv.imm = value;
            return {};
        case LocalValue::State::Indirect:
            break;
    }
    return writeImmediateToMem(value, MemPlace{lv.ptr, std::nullopt, dest.layout->align}, dest.layout);
}

EvalResult<void> Engine::writeScalar(Scalar value, const PlaceTy &dest)
{
    return writeImmediate(Immediate::fromScalar(value), dest);
}

EvalResult<void> Engine::copyOp(const OpTy &src, const PlaceTy &dest)
{
    if (src.layout->unsized || dest.layout->unsized || src.layout->size != dest.layout->size)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "copying a value of type " + src.layout->type->toString() +
                                 " into a place of type " + dest.layout->type->toString());
    if (src.layout->isZst())
        return {};
    if (src.kind == OpTy::Kind::Immediate)
        return writeImmediate(src.imm, dest);

    if (dest.place.kind == Place::Kind::Local &&
        localAt(dest.place).state == LocalValue::State::Immediate)
    {
        auto imm = readImmediateFromMem(src.mem, src.layout);
        if (!imm)
            return imm.error();
        return writeImmediate(imm.value(), dest);
    }

    auto target = forceAllocation(dest);
    if (!target)
        return target.error();
    return memory_.copy(src.mem.ptr, target.value().mplace.ptr, src.layout->size, false);
}

} // namespace ember::interp
