//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Engine.cpp
// Purpose: Implements engine construction, the frame stack and local storage
//          management.
// Key invariants: A frame's locals are released exactly once, either by
//                 StorageDead/StorageLive or when the frame is popped.
// Ownership/Lifetime: Stack allocations backing locals belong to their frame.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

#include "interp/Machine.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace ember::interp
{

namespace
{
/// @brief Render @p size bytes of @p alloc from @p offset as hex, printing
///        undefined bytes as `__`.
std::string formatBytes(const Allocation &alloc, uint64_t offset, uint64_t size)
{
    std::ostringstream os;
    for (uint64_t i = 0; i < size && offset + i < alloc.bytes.size(); ++i)
    {
        if (i)
            os << ' ';
        if (!alloc.defined[offset + i])
        {
            os << "__";
            continue;
        }
        os << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<unsigned>(alloc.bytes[offset + i]);
    }
    return os.str();
}

std::string formatImmediate(const Immediate &imm)
{
    if (imm.kind == Immediate::Kind::Scalar)
        return imm.first.toString();
    return "(" + imm.first.toString() + ", " + imm.second.toString() + ")";
}
} // namespace

bool statementMayPushFrame(const ir::Statement &stmt)
{
    return stmt.kind == ir::Statement::Kind::Assign &&
           stmt.rvalue.kind == ir::Rvalue::Kind::NullaryOp &&
           stmt.rvalue.nullOp == ir::NullOp::Box;
}

Engine::Engine(ir::Module &module,
               Machine &machine,
               support::DiagnosticEngine &diags,
               EngineConfig config)
    : module_(module),
      machine_(machine),
      diags_(diags),
      config_(config),
      trace_(config.trace),
      layouts_(config.pointerSize),
      memory_(config.pointerSize),
      stepCounter_(config.detectorWarmupSteps, config.detectorPeriod),
      loopDetector_(config.maxSnapshots)
{
}

EvalError Engine::withLocation(EvalError error) const
{
    if (!error.loc.isValid())
        error.loc = loc_;
    return error;
}

EvalResult<const Layout *> Engine::localLayout(const Frame &fr, ir::Local local)
{
    ir::TypeRef type = fr.body->locals[local].type;
    if (type->hasParams())
    {
        type = module_.types.substitute(type, fr.substs);
        if (!type)
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "local _" + std::to_string(local) + " of `" + fr.body->name +
                                     "` mentions a generic parameter without substitution");
    }
    return layouts_.layoutOf(type);
}

EvalResult<ir::TypeRef> Engine::monomorphize(ir::TypeRef type)
{
    if (!type->hasParams())
        return type;
    if (stack_.empty())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "generic type " + type->toString() + " outside of any frame");
    ir::TypeRef mono = module_.types.substitute(type, frame().substs);
    if (!mono)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "missing generic argument for " + type->toString());
    return mono;
}

/// @brief Give @p local of @p fr fresh, undefined storage.
/// @details Scalar and scalar-pair locals are held by value; everything else
///          gets a stack allocation.
EvalResult<void> Engine::allocateLocal(Frame &fr, ir::Local local)
{
    auto layout = localLayout(fr, local);
    if (!layout)
        return layout.error();
    const Layout *l = layout.value();
    if (l->unsized)
        return makeEvalError(EvalErrorKind::UnsupportedFeature,
                             "unsized local _" + std::to_string(local) + " of type " +
                                 l->type->toString());
    LocalValue &value = fr.locals[local];
    switch (l->abi)
    {
        case Layout::Abi::Scalar:
            value.state = LocalValue::State::Immediate;
            value.imm = Immediate::fromScalar(Scalar::undef());
            break;
        case Layout::Abi::ScalarPair:
            value.state = LocalValue::State::Immediate;
            value.imm = Immediate::fromPair(Scalar::undef(), Scalar::undef());
            break;
        case Layout::Abi::Aggregate:
        case Layout::Abi::Uninhabited:
            value.state = LocalValue::State::Indirect;
            value.ptr = memory_.allocate(l->size, l->align, MemoryKind::Stack);
            break;
    }
    return {};
}

EvalResult<void> Engine::deallocateLocal(LocalValue &value)
{
    const bool owned = value.state == LocalValue::State::Indirect;
    const Pointer ptr = value.ptr;
    value = LocalValue{};
    if (owned)
        return memory_.deallocate(ptr, MemoryKind::Stack);
    return {};
}

LocalValue &Engine::localAt(const Place &place)
{
    return stack_[place.frame].locals[place.local];
}

EvalResult<void> Engine::pushFrame(const ir::Body &body,
                                   std::vector<ir::TypeRef> substs,
                                   std::optional<PlaceTy> returnPlace,
                                   std::optional<ir::BlockId> returnTo,
                                   bool resumeCaller)
{
    if (stack_.size() >= config_.maxFrames)
        return makeEvalError(EvalErrorKind::StackOverflow,
                             "reached the limit of " + std::to_string(config_.maxFrames) +
                                 " frames while calling `" + body.name + "`");
    if (body.blocks.empty())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "body `" + body.name + "` has no basic blocks");
    if (body.locals.empty() || body.argCount >= body.locals.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "body `" + body.name + "` lacks a return place or argument locals");
    if (substs.size() != body.typeParamCount)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "`" + body.name + "` expects " +
                                 std::to_string(body.typeParamCount) + " generic arguments, got " +
                                 std::to_string(substs.size()));

    Frame fr;
    fr.body = &body;
    fr.substs = std::move(substs);
    fr.locals.resize(body.locals.size());
    fr.loc = body.loc;
    fr.returnPlace = std::move(returnPlace);
    fr.returnTo = returnTo;
    fr.resumeCaller = resumeCaller;

    // Locals with storage markers start dead; the rest live for the whole call.
    std::vector<bool> annotated(body.locals.size(), false);
    for (const ir::BasicBlock &bb : body.blocks)
    {
        for (const ir::Statement &stmt : bb.statements)
        {
            if (stmt.kind != ir::Statement::Kind::StorageLive &&
                stmt.kind != ir::Statement::Kind::StorageDead)
                continue;
            if (stmt.local >= body.locals.size())
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "storage marker for unknown local _" +
                                         std::to_string(stmt.local) + " in `" + body.name + "`");
            annotated[stmt.local] = true;
        }
    }

    for (ir::Local l = 0; l < body.locals.size(); ++l)
    {
        if (l != 0 && l > body.argCount && annotated[l])
            continue;
        auto r = allocateLocal(fr, l);
        if (!r)
        {
            for (LocalValue &v : fr.locals)
            {
                auto freed = deallocateLocal(v);
                if (!freed)
                    return freed.error();
            }
            return r.error();
        }
    }

    stack_.push_back(std::move(fr));
    trace_.onFramePushed(stack_.back(), stack_.size());
    return {};
}

EvalResult<void> Engine::popFrame()
{
    if (stack_.empty())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "tried to pop a frame, but the stack is empty");
    trace_.onFramePopped(stack_.back(), stack_.size());
    Frame fr = std::move(stack_.back());
    stack_.pop_back();
    for (LocalValue &v : fr.locals)
    {
        auto r = deallocateLocal(v);
        if (!r)
            return r;
    }
    return {};
}

EvalResult<void> Engine::storageLive(ir::Local local)
{
    Frame &fr = frame();
    if (local >= fr.locals.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "StorageLive of unknown local _" + std::to_string(local));
    auto freed = deallocateLocal(fr.locals[local]);
    if (!freed)
        return freed;
    return allocateLocal(fr, local);
}

EvalResult<void> Engine::storageDead(ir::Local local)
{
    Frame &fr = frame();
    if (local >= fr.locals.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "StorageDead of unknown local _" + std::to_string(local));
    return deallocateLocal(fr.locals[local]);
}

void Engine::dumpPlace(const PlaceTy &place)
{
    if (trace_.config().mode != TraceConfig::IR)
        return;

    std::string name;
    std::string contents;
    MemPlace mem;
    bool inMemory = false;
    if (place.place.kind == Place::Kind::Local)
    {
        name = "_" + std::to_string(place.place.local);
        if (place.place.frame != curFrame())
            name += " (frame " + std::to_string(place.place.frame) + ")";
        const LocalValue &lv = localAt(place.place);
        switch (lv.state)
        {
            case LocalValue::State::Dead:
                contents = "dead";
                break;
            case LocalValue::State::Immediate:
                contents = formatImmediate(lv.imm);
                break;
            case LocalValue::State::Indirect:
                mem.ptr = lv.ptr;
                inMemory = true;
                break;
        }
    }
    else
    {
        mem = place.place.mem;
        name = "alloc" + std::to_string(mem.ptr.alloc) + "+" + std::to_string(mem.ptr.offset);
        inMemory = true;
    }

    if (inMemory)
    {
        auto alloc = memory_.get(mem.ptr.alloc);
        contents = alloc ? "[" + formatBytes(*alloc.value(), mem.ptr.offset, place.layout->size) + "]"
                         : std::string("dangling");
    }
    trace_.onPlaceWritten(name, contents);
}

} // namespace ember::interp
