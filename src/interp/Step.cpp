//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Step.cpp
// Purpose: Implements the step driver, the statement executor, the rvalue
//          evaluator and the terminator dispatcher.
// Key invariants: One call to step() executes exactly one statement or one
//                 terminator. A failing statement leaves its frame's statement
//                 index unchanged. Zero-sized aggregate fields are never
//                 evaluated or written.
// Ownership/Lifetime: Places and operands built here do not outlive the
//                     instruction that created them.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

#include "interp/Machine.hpp"

#include <cassert>

namespace ember::interp
{

EvalResult<bool> Engine::step()
{
    if (stack_.empty())
        return false;

    const Frame &fr = frame();
    if (fr.block >= fr.body->blocks.size())
        return withLocation(makeEvalError(EvalErrorKind::InternalInconsistency,
                                          "block bb" + std::to_string(fr.block) +
                                              " does not exist in `" + fr.body->name + "`"));
    const ir::BasicBlock &block = fr.body->blocks[fr.block];

    if (fr.stmt < block.statements.size())
    {
        const ir::Statement &stmt = block.statements[fr.stmt];
        [[maybe_unused]] const size_t depth = stack_.size();
        auto r = executeStatement(stmt);
        if (!r)
            return withLocation(r.error());
        assert((stack_.size() == depth || statementMayPushFrame(stmt)) &&
               "statement changed the frame stack depth");
        ++steps_;
        return true;
    }

    auto detected = incStepCounterAndDetectLoops();
    if (!detected)
        return withLocation(detected.error());
    auto r = executeTerminator(block.terminator);
    if (!r)
        return withLocation(r.error());
    ++steps_;
    return true;
}

EvalResult<void> Engine::incStepCounterAndDetectLoops()
{
    if (!stepCounter_.tick())
        return {};
    return loopDetector_.observeAndAnalyze(machine_, stack_, memory_, diags_, loc_);
}

EvalResult<void> Engine::executeStatement(const ir::Statement &stmt)
{
    using Kind = ir::Statement::Kind;

    // Hooks may push frames; the statement belongs to the frame current now.
    const size_t frameIdx = curFrame();
    loc_ = stmt.loc;
    stack_[frameIdx].loc = stmt.loc;
    trace_.onStatement(stmt, stack_[frameIdx]);

    switch (stmt.kind)
    {
        case Kind::Assign:
        {
            auto r = evalRvalueIntoPlace(stmt.rvalue, stmt.place);
            if (!r)
                return r;
            break;
        }
        case Kind::SetDiscriminant:
        {
            auto dest = evalPlace(stmt.place);
            if (!dest)
                return dest.error();
            auto r = writeDiscriminantValue(dest.value(), stmt.variant);
            if (!r)
                return r;
            break;
        }
        case Kind::StorageLive:
        {
            auto r = storageLive(stmt.local);
            if (!r)
                return r;
            break;
        }
        case Kind::StorageDead:
        {
            auto r = storageDead(stmt.local);
            if (!r)
                return r;
            break;
        }
        case Kind::Validate:
        {
            auto r = machine_.validationOp(*this, stmt.validationOp, stmt.validationOperands);
            if (!r)
                return r;
            break;
        }
        case Kind::EndRegion:
        {
            auto r = machine_.endRegion(*this, stmt.region);
            if (!r)
                return r;
            break;
        }
        case Kind::ReadForMatch:
        case Kind::UserAssertTy:
        case Kind::Nop:
            break;
        case Kind::InlineAsm:
            return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                 "inline assembly is not supported",
                                 stmt.loc);
    }

    ++stack_[frameIdx].stmt;
    return {};
}

EvalResult<void> Engine::evalRvalueIntoPlace(const ir::Rvalue &rvalue, const ir::Place &place)
{
    using Kind = ir::Rvalue::Kind;

    auto destResult = evalPlace(place);
    if (!destResult)
        return destResult.error();
    const PlaceTy dest = destResult.value();

    switch (rvalue.kind)
    {
        case Kind::Use:
        {
            auto op = evalOperand(rvalue.operands.at(0), dest.layout);
            if (!op)
                return op.error();
            auto r = copyOp(op.value(), dest);
            if (!r)
                return r;
            break;
        }
        case Kind::BinaryOp:
        case Kind::CheckedBinaryOp:
        {
            auto lhsOp = evalOperand(rvalue.operands.at(0));
            if (!lhsOp)
                return lhsOp.error();
            auto lhs = readValue(lhsOp.value());
            if (!lhs)
                return lhs.error();
            auto rhsOp = evalOperand(rvalue.operands.at(1));
            if (!rhsOp)
                return rhsOp.error();
            auto rhs = readValue(rhsOp.value());
            if (!rhs)
                return rhs.error();
            auto res = binaryOp(rvalue.binOp, lhs.value(), rhs.value());
            if (!res)
                return res.error();
            auto r = rvalue.kind == Kind::BinaryOp
                         ? writeScalar(res.value().value, dest)
                         : writeImmediate(Immediate::fromPair(res.value().value,
                                                              Scalar::fromBool(res.value().overflowed)),
                                          dest);
            if (!r)
                return r;
            break;
        }
        case Kind::UnaryOp:
        {
            auto op = evalOperand(rvalue.operands.at(0), dest.layout);
            if (!op)
                return op.error();
            auto scalar = readScalar(op.value());
            if (!scalar)
                return scalar.error();
            auto defined = scalar.value().notUndef();
            if (!defined)
                return defined.error();
            auto res = unaryOp(rvalue.unOp, defined.value(), dest.layout);
            if (!res)
                return res.error();
            auto r = writeScalar(res.value(), dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Aggregate:
        {
            auto r = evalAggregate(rvalue, dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Repeat:
        {
            auto r = evalRepeat(rvalue, dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Len:
        {
            auto src = evalPlace(rvalue.place);
            if (!src)
                return src.error();
            auto mplace = forceAllocation(src.value());
            if (!mplace)
                return mplace.error();
            auto len = mplace.value().len();
            if (!len)
                return len.error();
            auto r = writeScalar(Scalar::fromUint(len.value(), pointerSize()), dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Ref:
        {
            auto src = evalPlace(rvalue.place);
            if (!src)
                return src.error();
            auto mplace = forceAllocation(src.value());
            if (!mplace)
                return mplace.error();
            const MemPlaceTy &m = mplace.value();
            const Scalar ptr = Scalar::fromPointer(m.mplace.ptr, pointerSize());
            Immediate value = Immediate::fromScalar(ptr);
            if (m.layout->unsized)
            {
                if (!m.mplace.meta)
                    return makeEvalError(EvalErrorKind::InternalInconsistency,
                                         "reference to an unsized place without metadata");
                value = Immediate::fromPair(ptr, *m.mplace.meta);
            }
            auto r = writeImmediate(value, dest);
            if (!r)
                return r;
            break;
        }
        case Kind::NullaryOp:
        {
            if (rvalue.nullOp == ir::NullOp::Box)
            {
                auto r = machine_.boxAlloc(*this, dest);
                if (!r)
                    return r;
                break;
            }
            auto type = monomorphize(rvalue.type);
            if (!type)
                return type.error();
            auto layout = layoutOf(type.value());
            if (!layout)
                return layout.error();
            if (layout.value()->unsized)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "SizeOf applied to unsized type " +
                                         type.value()->toString());
            auto r = writeScalar(Scalar::fromUint(layout.value()->size, pointerSize()), dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Cast:
        {
            auto op = evalOperand(rvalue.operands.at(0));
            if (!op)
                return op.error();
            auto target = monomorphize(rvalue.type);
            if (!target)
                return target.error();
            if (target.value() != dest.layout->type)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "cast to " + target.value()->toString() +
                                         " written into a place of type " +
                                         dest.layout->type->toString());
            auto r = cast(op.value(), rvalue.castKind, dest);
            if (!r)
                return r;
            break;
        }
        case Kind::Discriminant:
        {
            auto src = evalPlace(rvalue.place);
            if (!src)
                return src.error();
            auto discr = readDiscriminantValue(src.value());
            if (!discr)
                return discr.error();
            auto r = writeScalar(
                Scalar::fromInt(discr.value(), static_cast<uint8_t>(dest.layout->size)), dest);
            if (!r)
                return r;
            break;
        }
    }

    dumpPlace(dest);
    return {};
}

/// @brief Build an array, tuple or ADT value field by field in @p dest.
/// @details Enum aggregates first store the variant tag and then fill the
///          variant view of the destination.
EvalResult<void> Engine::evalAggregate(const ir::Rvalue &rvalue, const PlaceTy &dest)
{
    const ir::AggregateKind &agg = rvalue.aggregate;
    PlaceTy target = dest;

    if (agg.kind == ir::AggregateKind::Kind::Array)
    {
        if (!dest.layout->elem || dest.layout->unsized || dest.layout->count != rvalue.operands.size())
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "array aggregate of " + std::to_string(rvalue.operands.size()) +
                                     " elements written into " + dest.layout->type->toString());
        const Layout *elem = dest.layout->elem;
        for (uint64_t i = 0; i < rvalue.operands.size(); ++i)
        {
            if (elem->isZst())
                continue;
            auto op = evalOperand(rvalue.operands[i], elem);
            if (!op)
                return op.error();
            auto slot = placeIndex(dest, i);
            if (!slot)
                return slot.error();
            auto r = copyOp(op.value(), slot.value());
            if (!r)
                return r;
        }
        return {};
    }

    if (agg.kind == ir::AggregateKind::Kind::Adt && dest.layout->type->kind == ir::Type::Kind::Enum)
    {
        auto tagged = writeDiscriminantValue(dest, agg.variant);
        if (!tagged)
            return tagged;
        auto view = placeDowncast(dest, agg.variant);
        if (!view)
            return view.error();
        target = view.value();
    }

    for (uint32_t i = 0; i < rvalue.operands.size(); ++i)
    {
        const uint32_t fieldIndex = agg.activeField.value_or(i);
        if (fieldIndex >= target.layout->fields.size())
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "aggregate field " + std::to_string(fieldIndex) +
                                     " does not exist in " + target.layout->type->toString());
        const Layout *fieldLayout = target.layout->fields[fieldIndex];
        if (fieldLayout->isZst())
            continue;
        auto op = evalOperand(rvalue.operands[i], fieldLayout);
        if (!op)
            return op.error();
        auto field = placeField(target, fieldIndex);
        if (!field)
            return field.error();
        auto r = copyOp(op.value(), field.value());
        if (!r)
            return r;
    }
    return {};
}

/// @brief Fill array @p dest with copies of one evaluated operand.
/// @details The first element is written from the operand; the remaining
///          elements are replicated from the first one in memory.
EvalResult<void> Engine::evalRepeat(const ir::Rvalue &rvalue, const PlaceTy &dest)
{
    auto op = evalOperand(rvalue.operands.at(0), dest.layout->elem);
    if (!op)
        return op.error();
    auto mplace = forceAllocation(dest);
    if (!mplace)
        return mplace.error();
    auto length = mplace.value().len();
    if (!length)
        return length.error();
    if (length.value() != rvalue.count)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "repeat of " + std::to_string(rvalue.count) + " elements written into " +
                                 dest.layout->type->toString());
    if (length.value() == 0)
        return {};

    auto first = placeIndex(mplace.value().toPlace(), 0);
    if (!first)
        return first.error();
    auto r = copyOp(op.value(), first.value());
    if (!r)
        return r;
    if (length.value() == 1)
        return {};

    const uint64_t elemSize = dest.layout->elem->size;
    const Pointer src = first.value().place.mem.ptr;
    auto rest = memory_.pointerOffset(src, elemSize);
    if (!rest)
        return rest.error();
    return memory_.copyRepeatedly(src, rest.value(), elemSize, length.value() - 1, true);
}

EvalResult<void> Engine::executeTerminator(const ir::Terminator &term)
{
    loc_ = term.loc;
    frame().loc = term.loc;
    trace_.onTerminator(term, frame());
    return evalTerminator(term);
}

} // namespace ember::interp
