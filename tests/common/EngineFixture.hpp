//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/EngineFixture.hpp
// Purpose: Shared fixture for engine tests: a module with a builder, a
//          compile-time machine and helpers to run and inspect bodies.
// Key invariants: The engine is created lazily by start() and borrows the
//                 fixture's module, machine and diagnostics.
// Ownership/Lifetime: Everything lives for one test.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <gtest/gtest.h>

#include "build/IRBuilder.hpp"
#include "interp/Engine.hpp"
#include "interp/Machine.hpp"
#include "ir/Module.hpp"
#include "support/diagnostics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ember::tests
{

class EngineFixture : public ::testing::Test
{
  protected:
    EngineFixture() : builder(module) {}

    ir::TypeContext &types()
    {
        return module.types;
    }

    /// @brief Configuration used by start(); the loop detector samples
    ///        immediately instead of after a long warmup.
    static interp::EngineConfig testConfig()
    {
        interp::EngineConfig cfg;
        cfg.detectorWarmupSteps = 0;
        return cfg;
    }

    /// @brief Create an engine and push body @p name without a return place.
    interp::Engine &start(const std::string &name, interp::EngineConfig cfg = testConfig())
    {
        engine = std::make_unique<interp::Engine>(module, machine(), diags, cfg);
        const ir::Body *body = module.findBody(name);
        EXPECT_NE(body, nullptr);
        auto pushed = engine->pushFrame(*body, {}, std::nullopt, std::nullopt);
        EXPECT_TRUE(pushed.hasValue());
        return *engine;
    }

    /// @brief Step @p count times, expecting each step to make progress.
    void stepN(size_t count)
    {
        for (size_t i = 0; i < count; ++i)
        {
            auto r = engine->step();
            ASSERT_TRUE(r.hasValue()) << r.error().message;
            ASSERT_TRUE(r.value());
        }
    }

    /// @brief Step until the stack is empty or a step fails.
    /// @return The failure, if any.
    std::optional<interp::EvalError> runToCompletion(uint64_t limit = 100000)
    {
        for (uint64_t i = 0; i < limit; ++i)
        {
            auto r = engine->step();
            if (!r)
                return r.error();
            if (!r.value())
                return std::nullopt;
        }
        ADD_FAILURE() << "evaluation did not finish within " << limit << " steps";
        return std::nullopt;
    }

    /// @brief Typed place of local @p local in the current frame.
    interp::PlaceTy localPlace(ir::Local local)
    {
        const interp::Frame &fr = engine->frame();
        auto type = engine->monomorphize(fr.body->locals[local].type);
        EXPECT_TRUE(type.hasValue());
        auto layout = engine->layoutOf(type.value());
        EXPECT_TRUE(layout.hasValue());
        return interp::PlaceTy{interp::Place::fromLocal(engine->curFrame(), local),
                               layout.value()};
    }

    /// @brief Scalar held by local @p local of the current frame.
    interp::EvalResult<interp::Scalar> localScalar(ir::Local local)
    {
        auto op = engine->placeToOp(localPlace(local));
        if (!op)
            return op.error();
        return engine->readScalar(op.value());
    }

    /// @brief Bytes backing local @p local, with undefined bytes as nullopt.
    std::vector<std::optional<uint8_t>> localBytes(ir::Local local)
    {
        std::vector<std::optional<uint8_t>> out;
        auto mplace = engine->forceAllocation(localPlace(local));
        EXPECT_TRUE(mplace.hasValue());
        if (!mplace)
            return out;
        const interp::Pointer ptr = mplace.value().mplace.ptr;
        auto alloc = engine->memory().get(ptr.alloc);
        EXPECT_TRUE(alloc.hasValue());
        if (!alloc)
            return out;
        for (uint64_t i = 0; i < mplace.value().layout->size; ++i)
        {
            const uint64_t at = ptr.offset + i;
            if (alloc.value()->defined[at])
                out.emplace_back(alloc.value()->bytes[at]);
            else
                out.emplace_back(std::nullopt);
        }
        return out;
    }

    /// @brief Machine handed to engines created by start().
    virtual interp::Machine &machine()
    {
        return compileTime;
    }

    ir::Module module;
    support::DiagnosticEngine diags;
    interp::CompileTimeMachine compileTime;
    build::IRBuilder builder;
    std::unique_ptr<interp::Engine> engine;
};

} // namespace ember::tests
