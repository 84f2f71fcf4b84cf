//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/ControlFlow.cpp
// Purpose: Implements terminator semantics: jumps, switches, calls, returns,
//          assertions and the diverging terminators.
// Key invariants: A return copies local 0 into the caller's place before the
//                 callee's storage is released. Call arguments are evaluated
//                 in the caller before the callee frame exists.
// Ownership/Lifetime: Frames are created and destroyed only through
//                     pushFrame() and popFrame().
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

#include <string>
#include <utility>

namespace ember::interp
{

namespace
{
std::string overflowVerb(ir::BinOp op)
{
    switch (op)
    {
        case ir::BinOp::Add:
            return "add";
        case ir::BinOp::Sub:
            return "subtract";
        case ir::BinOp::Mul:
            return "multiply";
        case ir::BinOp::Div:
            return "divide";
        case ir::BinOp::Rem:
            return "calculate the remainder";
        case ir::BinOp::Shl:
            return "shift left";
        case ir::BinOp::Shr:
            return "shift right";
        default:
            return "compute";
    }
}
} // namespace

EvalResult<void> Engine::evalTerminator(const ir::Terminator &term)
{
    using Kind = ir::Terminator::Kind;
    switch (term.kind)
    {
        case Kind::Goto:
        case Kind::Drop:
            if (!term.target)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "jump without a target block");
            return gotoBlock(*term.target);
        case Kind::SwitchInt:
            return evalSwitchInt(term);
        case Kind::Return:
            return evalReturn();
        case Kind::Call:
            return evalCall(term);
        case Kind::Assert:
            return evalAssert(term);
        case Kind::Unreachable:
            return makeEvalError(EvalErrorKind::Unreachable, "entered unreachable code");
        case Kind::Abort:
            return makeEvalError(EvalErrorKind::Unreachable, "the program aborted execution");
    }
    return makeEvalError(EvalErrorKind::InternalInconsistency, "unknown terminator");
}

EvalResult<void> Engine::gotoBlock(ir::BlockId target)
{
    Frame &fr = frame();
    if (target >= fr.body->blocks.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "jump to missing block bb" + std::to_string(target) + " in `" +
                                 fr.body->name + "`");
    fr.block = target;
    fr.stmt = 0;
    return {};
}

EvalResult<void> Engine::evalSwitchInt(const ir::Terminator &term)
{
    if (term.targets.size() != term.values.size() + 1)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "switch with " + std::to_string(term.values.size()) + " values and " +
                                 std::to_string(term.targets.size()) + " targets");
    auto op = evalOperand(term.operand);
    if (!op)
        return op.error();
    auto scalar = readScalar(op.value());
    if (!scalar)
        return scalar.error();
    const uint64_t size = op.value().layout->size;
    auto bits = scalar.value().toBits(static_cast<uint8_t>(size));
    if (!bits)
        return bits.error();
    for (size_t i = 0; i < term.values.size(); ++i)
    {
        if (truncate(term.values[i], size) == bits.value())
            return gotoBlock(term.targets[i]);
    }
    return gotoBlock(term.targets.back());
}

EvalResult<void> Engine::evalCall(const ir::Terminator &term)
{
    const ir::Body *callee = module_.findBody(term.callee);
    if (!callee)
        return makeEvalError(EvalErrorKind::UnsupportedFeature,
                             "call to unknown function `" + term.callee + "`");
    if (term.args.size() != callee->argCount)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "`" + callee->name + "` takes " + std::to_string(callee->argCount) +
                                 " arguments but " + std::to_string(term.args.size()) +
                                 " were supplied");

    std::vector<ir::TypeRef> substs;
    substs.reserve(term.substs.size());
    for (ir::TypeRef t : term.substs)
    {
        auto mono = monomorphize(t);
        if (!mono)
            return mono.error();
        substs.push_back(mono.value());
    }

    std::vector<OpTy> args;
    args.reserve(term.args.size());
    for (const ir::Operand &a : term.args)
    {
        auto op = evalOperand(a);
        if (!op)
            return op.error();
        args.push_back(op.value());
    }

    std::optional<PlaceTy> dest;
    if (term.destination)
    {
        auto place = evalPlace(*term.destination);
        if (!place)
            return place.error();
        dest = place.value();
    }

    auto pushed = pushFrame(*callee, std::move(substs), dest, term.target);
    if (!pushed)
        return pushed;

    const size_t calleeIdx = curFrame();
    for (ir::Local i = 0; i < args.size(); ++i)
    {
        const ir::Local local = i + 1;
        auto layout = localLayout(frame(), local);
        if (!layout)
            return layout.error();
        auto r = copyOp(args[i], PlaceTy{Place::fromLocal(calleeIdx, local), layout.value()});
        if (!r)
            return r;
    }
    return {};
}

EvalResult<void> Engine::evalReturn()
{
    Frame &fr = frame();
    if (fr.returnPlace)
    {
        auto layout = localLayout(fr, 0);
        if (!layout)
            return layout.error();
        auto value = placeToOp(PlaceTy{Place::fromLocal(curFrame(), 0), layout.value()});
        if (!value)
            return value.error();
        auto r = copyOp(value.value(), *fr.returnPlace);
        if (!r)
            return r;
    }

    const std::optional<ir::BlockId> returnTo = fr.returnTo;
    const bool resumeCaller = fr.resumeCaller;
    auto popped = popFrame();
    if (!popped)
        return popped;
    if (stack_.empty() || resumeCaller)
        return {};
    if (!returnTo)
        return makeEvalError(EvalErrorKind::Unreachable,
                             "returned from a call that was declared diverging");
    return gotoBlock(*returnTo);
}

EvalResult<void> Engine::evalAssert(const ir::Terminator &term)
{
    auto op = evalOperand(term.operand);
    if (!op)
        return op.error();
    auto scalar = readScalar(op.value());
    if (!scalar)
        return scalar.error();
    auto cond = scalar.value().toBool();
    if (!cond)
        return cond.error();
    if (cond.value() == term.expected)
    {
        if (!term.target)
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "assert without a target block");
        return gotoBlock(*term.target);
    }

    using MsgKind = ir::AssertMessage::Kind;
    switch (term.msg.kind)
    {
        case MsgKind::Overflow:
            return makeEvalError(EvalErrorKind::Overflow,
                                 "attempt to " + overflowVerb(term.msg.op) + " with overflow");
        case MsgKind::OverflowNeg:
            return makeEvalError(EvalErrorKind::Overflow, "attempt to negate with overflow");
        case MsgKind::DivisionByZero:
            return makeEvalError(EvalErrorKind::DivisionByZero, "attempt to divide by zero");
        case MsgKind::RemainderByZero:
            return makeEvalError(EvalErrorKind::DivisionByZero,
                                 "attempt to calculate the remainder with a divisor of zero");
        case MsgKind::BoundsCheck:
            break;
    }

    if (term.msg.operands.size() != 2)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "bounds check message needs a length and an index");
    uint64_t values[2] = {0, 0};
    for (size_t i = 0; i < 2; ++i)
    {
        auto v = evalOperand(term.msg.operands[i]);
        if (!v)
            return v.error();
        auto s = readScalar(v.value());
        if (!s)
            return s.error();
        auto bits = s.value().toBits(pointerSize());
        if (!bits)
            return bits.error();
        values[i] = bits.value();
    }
    return makeEvalError(EvalErrorKind::OutOfBounds,
                         "index out of bounds: the len is " + std::to_string(values[0]) +
                             " but the index is " + std::to_string(values[1]));
}

} // namespace ember::interp
