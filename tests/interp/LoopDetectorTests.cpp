//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/interp/LoopDetectorTests.cpp
// Purpose: Verify the step counter schedule and the repeated-state detector.
// Key invariants: A sample identical to an earlier one ends evaluation with
//                 NonTerminating; the slow-evaluation warning fires once.
// Ownership/Lifetime: Each test builds its own module through the fixture.
//
//===----------------------------------------------------------------------===//

#include "tests/common/EngineFixture.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

using namespace ember;
using ember::build::IRBuilder;
using ember::ir::BinOp;
using ember::ir::Operand;
using ember::ir::Place;
using ember::ir::Rvalue;

namespace
{
using LoopDetectorTest = ember::tests::EngineFixture;

std::vector<bool> ticks(interp::StepCounter &counter, size_t n)
{
    std::vector<bool> out;
    for (size_t i = 0; i < n; ++i)
        out.push_back(counter.tick());
    return out;
}

interp::EngineConfig sampleEvery(uint64_t period)
{
    interp::EngineConfig cfg;
    cfg.detectorWarmupSteps = 0;
    cfg.detectorPeriod = period;
    return cfg;
}

/// @brief Machine whose extra state changes on every sample.
class DriftingMachine : public interp::Machine
{
  public:
    interp::EvalResult<void> validationOp(interp::Engine &,
                                          ir::ValidationOp,
                                          std::span<const ir::ValidationOperand>) override
    {
        return {};
    }

    interp::EvalResult<void> endRegion(interp::Engine &, std::optional<uint32_t>) override
    {
        return {};
    }

    interp::EvalResult<void> boxAlloc(interp::Engine &, const interp::PlaceTy &) override
    {
        return interp::makeEvalError(interp::EvalErrorKind::UnsupportedFeature, "no heap");
    }

    std::string snapshotState() const override
    {
        return std::to_string(++samples);
    }

    mutable int samples = 0;
};

class DriftingLoopTest : public ember::tests::EngineFixture
{
  protected:
    interp::Machine &machine() override
    {
        return drifting;
    }

    DriftingMachine drifting;
};

void buildSelfLoop(build::IRBuilder &b, ir::TypeContext &types)
{
    b.startBody("spin", types.unit(), {});
    const ir::BlockId bb = b.addBlock();
    b.setInsertPoint(bb);
    b.setLoc({1, 3, 5});
    b.gotoBlock(bb);
}
} // namespace

TEST(StepCounterTest, WarmupThenPeriodicSamples)
{
    interp::StepCounter counter(3, 4);
    EXPECT_EQ(counter.state(), interp::StepCounter::State::WarmingUp);
    EXPECT_EQ(ticks(counter, 7),
              (std::vector<bool>{false, false, true, false, false, false, true}));
    EXPECT_EQ(counter.state(), interp::StepCounter::State::Active);
}

TEST(StepCounterTest, NoWarmupStartsActive)
{
    interp::StepCounter counter(0, 2);
    EXPECT_EQ(counter.state(), interp::StepCounter::State::Active);
    EXPECT_EQ(ticks(counter, 4), (std::vector<bool>{false, true, false, true}));
}

TEST(StepCounterTest, DisabledNeverSamples)
{
    interp::StepCounter zeroPeriod(0, 0);
    EXPECT_EQ(zeroPeriod.state(), interp::StepCounter::State::Disabled);
    EXPECT_EQ(ticks(zeroPeriod, 3), (std::vector<bool>{false, false, false}));

    interp::StepCounter counter(1, 1);
    counter.disable();
    EXPECT_EQ(ticks(counter, 3), (std::vector<bool>{false, false, false}));
}

TEST_F(LoopDetectorTest, SelfLoopIsNonTerminating)
{
    buildSelfLoop(builder, types());
    start("spin", sampleEvery(4));
    auto err = runToCompletion(1000);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::NonTerminating);
    EXPECT_EQ(err->loc, (support::SourceLoc{1, 3, 5}));
    // Two samples: the first one and the repeat.
    EXPECT_EQ(engine->stepsExecuted(), 7u);
    EXPECT_EQ(engine->loopDetector().snapshotCount(), 1u);

    EXPECT_EQ(diags.warningCount(), 1u);
    ASSERT_EQ(diags.diagnostics().size(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].message,
              "Constant evaluating a complex constant, this might take some time");
}

TEST_F(LoopDetectorTest, CountingLoopTerminates)
{
    const ir::TypeRef u32 = types().uintTy(32);
    builder.startBody("count", types().unit(), {});
    const ir::Local i = builder.addLocal(u32);
    const ir::Local more = builder.addLocal(types().boolean());
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId head = builder.addBlock();
    const ir::BlockId body = builder.addBlock();
    const ir::BlockId exit = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.assign(Place::fromLocal(i), Rvalue::use(IRBuilder::constInt(u32, 0)));
    builder.gotoBlock(head);
    builder.setInsertPoint(head);
    builder.assign(Place::fromLocal(more),
                   Rvalue::binary(BinOp::Lt, Operand::copy(Place::fromLocal(i)),
                                  IRBuilder::constInt(u32, 10)));
    builder.switchInt(Operand::copy(Place::fromLocal(more)), types().boolean(), {0}, {exit}, body);
    builder.setInsertPoint(body);
    builder.assign(Place::fromLocal(i),
                   Rvalue::binary(BinOp::Add, Operand::copy(Place::fromLocal(i)),
                                  IRBuilder::constInt(u32, 1)));
    builder.gotoBlock(head);
    builder.setInsertPoint(exit);
    builder.ret();

    start("count", sampleEvery(1));
    auto err = runToCompletion();
    EXPECT_FALSE(err.has_value()) << err->message;
    EXPECT_TRUE(engine->stack().empty());
    EXPECT_EQ(diags.warningCount(), 1u);
    EXPECT_GT(engine->loopDetector().snapshotCount(), 10u);
}

TEST_F(LoopDetectorTest, RetentionBoundCanHideLongCycles)
{
    builder.startBody("pingpong", types().unit(), {});
    const ir::BlockId a = builder.addBlock();
    const ir::BlockId b = builder.addBlock();
    builder.setInsertPoint(a);
    builder.gotoBlock(b);
    builder.setInsertPoint(b);
    builder.gotoBlock(a);

    interp::EngineConfig cfg = sampleEvery(1);
    cfg.maxSnapshots = 1;
    auto &eng = start("pingpong", cfg);
    for (int i = 0; i < 50; ++i)
    {
        auto r = eng.step();
        ASSERT_TRUE(r.hasValue()) << r.error().message;
    }
    EXPECT_EQ(eng.loopDetector().snapshotCount(), 1u);
}

TEST_F(LoopDetectorTest, RetentionBoundCoveringTheCycleDetects)
{
    builder.startBody("pingpong", types().unit(), {});
    const ir::BlockId a = builder.addBlock();
    const ir::BlockId b = builder.addBlock();
    builder.setInsertPoint(a);
    builder.gotoBlock(b);
    builder.setInsertPoint(b);
    builder.gotoBlock(a);

    interp::EngineConfig cfg = sampleEvery(1);
    cfg.maxSnapshots = 2;
    start("pingpong", cfg);
    auto err = runToCompletion(50);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::NonTerminating);
    EXPECT_EQ(engine->stepsExecuted(), 2u);
}

TEST_F(LoopDetectorTest, DisabledDetectorLetsLoopsRun)
{
    buildSelfLoop(builder, types());
    auto &eng = start("spin", sampleEvery(1));
    eng.disableLoopDetector();
    for (int i = 0; i < 100; ++i)
    {
        auto r = eng.step();
        ASSERT_TRUE(r.hasValue()) << r.error().message;
    }
    EXPECT_EQ(eng.stepCounter().state(), interp::StepCounter::State::Disabled);
    EXPECT_EQ(eng.loopDetector().snapshotCount(), 0u);
    EXPECT_TRUE(diags.diagnostics().empty());
}

TEST_F(LoopDetectorTest, WarmupDelaysTheFirstSample)
{
    buildSelfLoop(builder, types());
    interp::EngineConfig cfg = sampleEvery(1);
    cfg.detectorWarmupSteps = 10;
    auto &eng = start("spin", cfg);
    for (int i = 0; i < 9; ++i)
        ASSERT_TRUE(eng.step().hasValue());
    EXPECT_EQ(eng.loopDetector().snapshotCount(), 0u);
    ASSERT_TRUE(eng.step().hasValue());
    EXPECT_EQ(eng.loopDetector().snapshotCount(), 1u);
    auto r = eng.step();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, interp::EvalErrorKind::NonTerminating);
}

TEST_F(DriftingLoopTest, MachineStateTakesPartInComparison)
{
    buildSelfLoop(builder, types());
    auto &eng = start("spin", sampleEvery(1));
    for (int i = 0; i < 20; ++i)
    {
        auto r = eng.step();
        ASSERT_TRUE(r.hasValue()) << r.error().message;
    }
    EXPECT_EQ(drifting.samples, 20);
    EXPECT_EQ(eng.loopDetector().snapshotCount(), 20u);
}
