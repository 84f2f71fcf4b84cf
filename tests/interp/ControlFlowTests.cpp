//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/interp/ControlFlowTests.cpp
// Purpose: Verify terminator dispatch: jumps, switches, calls and returns,
//          assertions, diverging terminators and frame limits.
// Key invariants: Every terminator either transfers control or fails without
//                 changing the current block.
// Ownership/Lifetime: Each test builds its own module through the fixture.
//
//===----------------------------------------------------------------------===//

#include "tests/common/EngineFixture.hpp"

#include <string>
#include <vector>

using namespace ember;
using ember::build::IRBuilder;
using ember::ir::AssertMessage;
using ember::ir::BinOp;
using ember::ir::Operand;
using ember::ir::Place;
using ember::ir::Rvalue;

namespace
{
using ControlFlowTest = ember::tests::EngineFixture;

class AssertTest : public ember::tests::EngineFixture
{
  protected:
    /// @brief Run a failing assert carrying @p msg.
    interp::EvalError failWith(AssertMessage msg)
    {
        builder.startBody("check", types().unit(), {});
        const ir::BlockId entry = builder.addBlock();
        const ir::BlockId ok = builder.addBlock();
        builder.setInsertPoint(entry);
        builder.assertCond(IRBuilder::constInt(types().boolean(), 0), true, std::move(msg), ok);
        builder.setInsertPoint(ok);
        builder.ret();

        start("check");
        auto r = engine->step();
        EXPECT_FALSE(r.hasValue());
        EXPECT_EQ(engine->frame().block, entry);
        return r ? interp::EvalError{} : r.error();
    }
};

/// @brief `main` switching on a u8 constant @p scrutinee into four arms that
///        record their index in local 1.
void buildSwitch(build::IRBuilder &b, ir::TypeContext &types, int64_t scrutinee,
                 std::vector<uint64_t> values)
{
    const ir::TypeRef u8 = types.uintTy(8);
    b.startBody("main", types.unit(), {});
    const ir::Local arm = b.addLocal(u8);
    const ir::BlockId entry = b.addBlock();
    std::vector<ir::BlockId> arms;
    for (int i = 0; i < 3; ++i)
        arms.push_back(b.addBlock());
    b.setInsertPoint(entry);
    b.switchInt(IRBuilder::constInt(u8, scrutinee), u8, std::move(values), {arms[0], arms[1]},
                arms[2]);
    for (int i = 0; i < 3; ++i)
    {
        b.setInsertPoint(arms[i]);
        b.assign(Place::fromLocal(arm), Rvalue::use(IRBuilder::constInt(u8, i)));
        b.ret();
    }
}
} // namespace

TEST_F(ControlFlowTest, GotoMovesToTargetBlock)
{
    builder.startBody("main", types().unit(), {});
    const ir::BlockId a = builder.addBlock();
    const ir::BlockId b = builder.addBlock();
    builder.setInsertPoint(a);
    builder.gotoBlock(b);
    builder.setInsertPoint(b);
    builder.ret();

    auto &eng = start("main");
    stepN(1);
    EXPECT_EQ(eng.frame().block, b);
    EXPECT_EQ(eng.frame().stmt, 0u);
    stepN(1);
    EXPECT_TRUE(eng.stack().empty());
}

TEST_F(ControlFlowTest, SwitchTakesMatchingArm)
{
    buildSwitch(builder, types(), 2, {1, 2});
    auto &eng = start("main");
    stepN(1);
    EXPECT_EQ(eng.frame().block, 2u);
}

TEST_F(ControlFlowTest, SwitchFallsBackToOtherwise)
{
    buildSwitch(builder, types(), 7, {1, 2});
    auto &eng = start("main");
    stepN(1);
    EXPECT_EQ(eng.frame().block, 3u);
}

TEST_F(ControlFlowTest, SwitchValuesAreTruncatedToTheScrutineeWidth)
{
    buildSwitch(builder, types(), 2, {0x101, 0x102});
    auto &eng = start("main");
    stepN(1);
    EXPECT_EQ(eng.frame().block, 2u);
}

TEST_F(ControlFlowTest, CallPassesArgumentsAndReturnsValue)
{
    const ir::TypeRef i32 = types().intTy(32);
    builder.startBody("add", i32, {i32, i32});
    builder.setInsertPoint(builder.addBlock());
    builder.assign(Place::fromLocal(0),
                   Rvalue::binary(BinOp::Add, Operand::move(Place::fromLocal(1)),
                                  Operand::move(Place::fromLocal(2))));
    builder.ret();

    builder.startBody("main", types().unit(), {});
    const ir::Local sum = builder.addLocal(i32);
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId done = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.call("add", {IRBuilder::constInt(i32, 2), IRBuilder::constInt(i32, 3)},
                 Place::fromLocal(sum), done);
    builder.setInsertPoint(done);
    builder.ret();

    auto &eng = start("main");
    stepN(1);
    ASSERT_EQ(eng.stack().size(), 2u);
    EXPECT_EQ(eng.frame().body->name, "add");
    EXPECT_EQ(localScalar(1).value(), interp::Scalar::fromUint(2, 4));
    EXPECT_EQ(localScalar(2).value(), interp::Scalar::fromUint(3, 4));

    stepN(2);
    ASSERT_EQ(eng.stack().size(), 1u);
    EXPECT_EQ(eng.frame().block, done);
    EXPECT_EQ(localScalar(sum).value(), interp::Scalar::fromUint(5, 4));
}

TEST_F(ControlFlowTest, GenericCallSubstitutesLocals)
{
    builder.startBody("identity", types().param(0), {types().param(0)}, 1);
    builder.setInsertPoint(builder.addBlock());
    builder.assign(Place::fromLocal(0), Rvalue::use(Operand::move(Place::fromLocal(1))));
    builder.ret();

    const ir::TypeRef u16 = types().uintTy(16);
    builder.startBody("main", types().unit(), {});
    const ir::Local out = builder.addLocal(u16);
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId done = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.call("identity", {IRBuilder::constInt(u16, 0xBEEF)}, Place::fromLocal(out), done,
                 {u16});
    builder.setInsertPoint(done);
    builder.ret();

    auto &eng = start("main");
    stepN(1);
    ASSERT_EQ(eng.frame().substs.size(), 1u);
    EXPECT_EQ(eng.frame().substs[0], u16);
    stepN(2);
    EXPECT_EQ(localScalar(out).value(), interp::Scalar::fromUint(0xBEEF, 2));
}

TEST_F(ControlFlowTest, ArgumentCountMismatchIsACompilerBug)
{
    const ir::TypeRef i32 = types().intTy(32);
    builder.startBody("one", types().unit(), {i32});
    builder.setInsertPoint(builder.addBlock());
    builder.ret();

    builder.startBody("main", types().unit(), {});
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId done = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.call("one", {}, std::nullopt, done);
    builder.setInsertPoint(done);
    builder.ret();

    auto &eng = start("main");
    auto r = eng.step();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, interp::EvalErrorKind::InternalInconsistency);
    EXPECT_EQ(eng.stack().size(), 1u);
}

TEST_F(ControlFlowTest, UnknownCalleeIsUnsupported)
{
    builder.startBody("main", types().unit(), {});
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId done = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.call("missing", {}, std::nullopt, done);
    builder.setInsertPoint(done);
    builder.ret();

    start("main");
    auto err = runToCompletion();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::UnsupportedFeature);
    EXPECT_EQ(err->message, "call to unknown function `missing`");
}

TEST_F(ControlFlowTest, ReturningFromDivergingCallIsUnreachable)
{
    builder.startBody("noop", types().unit(), {});
    builder.setInsertPoint(builder.addBlock());
    builder.ret();

    builder.startBody("main", types().unit(), {});
    builder.setInsertPoint(builder.addBlock());
    builder.call("noop", {}, std::nullopt, std::nullopt);

    start("main");
    auto err = runToCompletion();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::Unreachable);
}

TEST_F(ControlFlowTest, DeepRecursionOverflowsTheStack)
{
    builder.startBody("recurse", types().unit(), {});
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId done = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.call("recurse", {}, std::nullopt, done);
    builder.setInsertPoint(done);
    builder.ret();

    interp::EngineConfig cfg = testConfig();
    cfg.maxFrames = 8;
    start("recurse", cfg);
    auto err = runToCompletion();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::StackOverflow);
    EXPECT_EQ(engine->stack().size(), 8u);
}

TEST_F(ControlFlowTest, UnreachableAndAbortFail)
{
    builder.startBody("dead", types().unit(), {});
    builder.setInsertPoint(builder.addBlock());
    builder.unreachable();
    builder.startBody("stop", types().unit(), {});
    builder.setInsertPoint(builder.addBlock());
    builder.abort();

    start("dead");
    auto err = runToCompletion();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::Unreachable);
    EXPECT_EQ(err->message, "entered unreachable code");

    start("stop");
    err = runToCompletion();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->kind, interp::EvalErrorKind::Unreachable);
    EXPECT_EQ(err->message, "the program aborted execution");
}

TEST_F(ControlFlowTest, DropOnlyTransfersControl)
{
    const ir::TypeRef arr = types().array(types().uintTy(32), 2);
    builder.startBody("main", types().unit(), {});
    const ir::Local value = builder.addLocal(arr);
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId after = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.drop(Place::fromLocal(value), after);
    builder.setInsertPoint(after);
    builder.ret();

    auto &eng = start("main");
    const interp::Memory before = eng.memory();
    stepN(1);
    EXPECT_EQ(eng.frame().block, after);
    EXPECT_TRUE(eng.memory() == before);
}

TEST_F(ControlFlowTest, IndexOutOfBounds)
{
    const ir::TypeRef u8 = types().uintTy(8);
    builder.startBody("main", types().unit(), {});
    const ir::Local arr = builder.addLocal(types().array(u8, 3));
    const ir::Local idx = builder.addLocal(types().usize());
    const ir::Local out = builder.addLocal(u8);
    builder.setInsertPoint(builder.addBlock());
    builder.assign(Place::fromLocal(idx), Rvalue::use(IRBuilder::constInt(types().usize(), 5)));
    builder.assign(Place::fromLocal(out),
                   Rvalue::use(Operand::copy(Place::fromLocal(arr).index(idx))));
    builder.ret();

    start("main");
    stepN(1);
    auto r = engine->step();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, interp::EvalErrorKind::OutOfBounds);
    EXPECT_EQ(r.error().message, "index out of bounds: the len is 3 but the index is 5");
}

TEST_F(AssertTest, PassingAssertJumps)
{
    builder.startBody("check", types().unit(), {});
    const ir::BlockId entry = builder.addBlock();
    const ir::BlockId ok = builder.addBlock();
    builder.setInsertPoint(entry);
    builder.assertCond(IRBuilder::constInt(types().boolean(), 0), false, AssertMessage{}, ok);
    builder.setInsertPoint(ok);
    builder.ret();

    auto &eng = start("check");
    stepN(1);
    EXPECT_EQ(eng.frame().block, ok);
}

TEST_F(AssertTest, OverflowMessagesNameTheOperator)
{
    AssertMessage msg;
    msg.kind = AssertMessage::Kind::Overflow;
    msg.op = BinOp::Shl;
    const interp::EvalError err = failWith(msg);
    EXPECT_EQ(err.kind, interp::EvalErrorKind::Overflow);
    EXPECT_EQ(err.message, "attempt to shift left with overflow");
}

TEST_F(AssertTest, NegationOverflow)
{
    AssertMessage msg;
    msg.kind = AssertMessage::Kind::OverflowNeg;
    const interp::EvalError err = failWith(msg);
    EXPECT_EQ(err.kind, interp::EvalErrorKind::Overflow);
    EXPECT_EQ(err.message, "attempt to negate with overflow");
}

TEST_F(AssertTest, DivisionAndRemainderByZero)
{
    AssertMessage msg;
    msg.kind = AssertMessage::Kind::RemainderByZero;
    const interp::EvalError err = failWith(msg);
    EXPECT_EQ(err.kind, interp::EvalErrorKind::DivisionByZero);
    EXPECT_EQ(err.message, "attempt to calculate the remainder with a divisor of zero");
}

TEST_F(AssertTest, BoundsCheckReportsLengthAndIndex)
{
    AssertMessage msg;
    msg.kind = AssertMessage::Kind::BoundsCheck;
    msg.operands = {IRBuilder::constInt(types().usize(), 4), IRBuilder::constInt(types().usize(), 9)};
    const interp::EvalError err = failWith(msg);
    EXPECT_EQ(err.kind, interp::EvalErrorKind::OutOfBounds);
    EXPECT_EQ(err.message, "index out of bounds: the len is 4 but the index is 9");
}
