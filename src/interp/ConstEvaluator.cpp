//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/ConstEvaluator.cpp
// Purpose: Implements the constant-evaluation facade: set up the entry frame,
//          step to completion and extract the result bytes.
// Key invariants: The result slot is a static allocation that outlives every
//                 frame of the evaluation.
// Ownership/Lifetime: Impl owns the default machine and the engine of the
//                     current evaluation.
//
//===----------------------------------------------------------------------===//

#include "ember/interp/ConstEvaluator.hpp"

#include "interp/Engine.hpp"
#include "interp/Machine.hpp"
#include "ir/Module.hpp"
#include "support/diagnostics.hpp"

#include <string>

namespace ember::interp
{

std::optional<uint64_t> ConstValue::asUint() const
{
    if (bytes.size() > 8)
        return std::nullopt;
    uint64_t value = 0;
    for (size_t i = 0; i < bytes.size(); ++i)
    {
        if (!defined[i])
            return std::nullopt;
        value |= uint64_t{bytes[i]} << (8 * i);
    }
    return value;
}

std::optional<int64_t> ConstValue::asInt() const
{
    auto value = asUint();
    if (!value)
        return std::nullopt;
    return signExtend(*value, bytes.size());
}

struct ConstEvaluator::Impl
{
    Impl(ir::Module &module, support::DiagnosticEngine &diags, EngineConfig config, Machine *machine)
        : module(module), diags(diags), config(config), machine(machine ? machine : &ownMachine)
    {
    }

    /// @brief Report @p error and hand it back.
    EvalError fail(EvalError error)
    {
        diags.report(toDiagnostic(error));
        return error;
    }

    ir::Module &module;
    support::DiagnosticEngine &diags;
    EngineConfig config;
    CompileTimeMachine ownMachine;
    Machine *machine;
    uint64_t steps = 0;
};

ConstEvaluator::ConstEvaluator(ir::Module &module,
                               support::DiagnosticEngine &diags,
                               EngineConfig config,
                               Machine *machine)
    : impl(std::make_unique<Impl>(module, diags, config, machine))
{
}

ConstEvaluator::~ConstEvaluator() = default;

uint64_t ConstEvaluator::stepCount() const
{
    return impl->steps;
}

EvalResult<ConstValue> ConstEvaluator::evaluate(std::string_view bodyName)
{
    impl->steps = 0;
    if (auto valid = impl->config.validate(); !valid)
        return impl->fail(
            makeEvalError(EvalErrorKind::InternalInconsistency, valid.error().message));
    if (impl->module.types.pointerBits() != impl->config.pointerSize * 8u)
        return impl->fail(makeEvalError(EvalErrorKind::InternalInconsistency,
                                        "module pointer width " +
                                            std::to_string(impl->module.types.pointerBits()) +
                                            " bits does not match the configured " +
                                            std::to_string(impl->config.pointerSize) + " bytes"));

    const ir::Body *body = impl->module.findBody(bodyName);
    if (!body)
        return impl->fail(makeEvalError(EvalErrorKind::InternalInconsistency,
                                        "no body named `" + std::string(bodyName) + "`"));
    if (body->argCount != 0 || body->typeParamCount != 0)
        return impl->fail(makeEvalError(EvalErrorKind::UnsupportedFeature,
                                        "`" + body->name +
                                            "` takes arguments or generic parameters and cannot "
                                            "be evaluated as a constant",
                                        body->loc));

    Engine engine(impl->module, *impl->machine, impl->diags, impl->config);
    auto layout = engine.layoutOf(body->returnType());
    if (!layout)
        return impl->fail(layout.error());
    if (layout.value()->unsized)
        return impl->fail(makeEvalError(EvalErrorKind::UnsupportedFeature,
                                        "constant of unsized type " +
                                            body->returnType()->toString(),
                                        body->loc));

    const Pointer slot =
        engine.memory().allocate(layout.value()->size, layout.value()->align, MemoryKind::Static);
    const PlaceTy result{Place::fromMem(MemPlace{slot, std::nullopt, layout.value()->align}),
                         layout.value()};
    auto pushed = engine.pushFrame(*body, {}, result, std::nullopt);
    if (!pushed)
        return impl->fail(pushed.error());

    while (true)
    {
        auto more = engine.step();
        impl->steps = engine.stepsExecuted();
        if (!more)
            return impl->fail(more.error());
        if (!more.value())
            break;
    }

    auto alloc = engine.memory().get(slot.alloc);
    if (!alloc)
        return impl->fail(alloc.error());
    ConstValue value;
    value.type = body->returnType();
    value.bytes = alloc.value()->bytes;
    value.defined = alloc.value()->defined;
    return value;
}

} // namespace ember::interp
