//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the instruction structs of the Ember IR: value-producing
// expressions (Rvalue), non-branching instructions (Statement) and the
// control-flow instruction that ends every basic block (Terminator).
//
// The structs use the same flexible layout as the rest of the IR: a kind
// discriminator plus the union of fields any kind needs.  Fields that a kind
// does not use are left default-initialised and ignored by the interpreter.
//
// - Rvalue: Use, BinaryOp, CheckedBinaryOp, UnaryOp, Aggregate, Repeat, Len,
//   Ref, NullaryOp (Box, SizeOf), Cast, Discriminant.
// - Statement: Assign, SetDiscriminant, StorageLive, StorageDead,
//   ReadForMatch, Validate, EndRegion, UserAssertTy, Nop, InlineAsm.
// - Terminator: Goto, SwitchInt, Return, Call, Assert, Drop, Unreachable,
//   Abort.
//
// Every statement and terminator carries a source location which the
// interpreter installs as the current diagnostic location before executing it.
//
// Ownership Model:
// - BasicBlock owns its statements and terminator by value.
// - Statements own their places, rvalues and operands.
// - Types are referenced through TypeRef handles owned by the TypeContext.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Type.hpp"
#include "ir/Value.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ember::ir
{

/// @brief Binary operators; comparison operators produce bool.
enum class BinOp
{
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    BitXor,
    BitAnd,
    BitOr,
    Shl,
    Shr,
    Eq,
    Lt,
    Le,
    Ne,
    Ge,
    Gt,
    Offset
};

/// @brief Unary operators.
enum class UnOp
{
    Not,
    Neg
};

/// @brief Conversion families understood by Cast rvalues.
enum class CastKind
{
    Misc,
    Unsize,
    ReifyFnPointer,
    ClosureFnPointer,
    UnsafeFnPointer
};

/// @brief Operators without operands.
enum class NullOp
{
    Box,
    SizeOf
};

/// @brief Describes what an Aggregate rvalue constructs.
struct AggregateKind
{
    enum class Kind
    {
        Array,
        Tuple,
        Adt
    };

    Kind kind = Kind::Tuple;

    /// Element type for Array; the ADT type for Adt.
    TypeRef type = nullptr;

    /// Selected variant for Adt; 0 for structs and unions.
    uint32_t variant = 0;

    /// Explicit field for union-like ADTs whose fields overlap.
    std::optional<uint32_t> activeField;
};

/// @brief Value-producing expression written into a place by Assign.
struct Rvalue
{
    enum class Kind
    {
        Use,
        Repeat,
        Ref,
        Len,
        Cast,
        BinaryOp,
        CheckedBinaryOp,
        NullaryOp,
        UnaryOp,
        Discriminant,
        Aggregate
    };

    Kind kind = Kind::Use;
    BinOp binOp = BinOp::Add;
    UnOp unOp = UnOp::Not;
    NullOp nullOp = NullOp::SizeOf;
    CastKind castKind = CastKind::Misc;

    /// Use/Cast/UnaryOp/Repeat: one operand; BinaryOp: two; Aggregate: fields.
    std::vector<Operand> operands;

    /// Source place for Ref, Len and Discriminant.
    Place place;

    /// Target type for Cast; operand type for NullaryOp.
    TypeRef type = nullptr;

    /// Element count for Repeat.
    uint64_t count = 0;

    /// Constructed shape for Aggregate.
    AggregateKind aggregate;

    static Rvalue use(Operand op);
    static Rvalue binary(BinOp op, Operand lhs, Operand rhs);
    static Rvalue checkedBinary(BinOp op, Operand lhs, Operand rhs);
    static Rvalue unary(UnOp op, Operand operand);
    static Rvalue aggregateOf(AggregateKind kind, std::vector<Operand> fields);
    static Rvalue repeat(Operand op, uint64_t count);
    static Rvalue len(Place p);
    static Rvalue ref(Place p);
    static Rvalue box(TypeRef type);
    static Rvalue sizeOf(TypeRef type);
    static Rvalue cast(CastKind kind, Operand op, TypeRef target);
    static Rvalue discriminant(Place p);
};

/// @brief Validation operation forwarded to the machine hooks.
enum class ValidationOp
{
    Acquire,
    Release,
    Suspend
};

/// @brief One place named by a Validate statement.
struct ValidationOperand
{
    Place place;
    TypeRef type = nullptr;
};

/// @brief Non-branching instruction.
struct Statement
{
    enum class Kind
    {
        Assign,
        SetDiscriminant,
        StorageLive,
        StorageDead,
        ReadForMatch,
        Validate,
        EndRegion,
        UserAssertTy,
        Nop,
        InlineAsm
    };

    Kind kind = Kind::Nop;

    /// Destination for Assign/SetDiscriminant; inspected place otherwise.
    Place place;

    /// Expression for Assign.
    Rvalue rvalue;

    /// Variant written by SetDiscriminant.
    uint32_t variant = 0;

    /// Local affected by StorageLive/StorageDead.
    Local local = 0;

    ValidationOp validationOp = ValidationOp::Acquire;
    std::vector<ValidationOperand> validationOperands;

    /// Region token for EndRegion; empty for the anonymous region.
    std::optional<uint32_t> region;

    /// Assembly text for InlineAsm, kept for diagnostics only.
    std::string asmText;

    support::SourceLoc loc;
};

/// @brief Reason an Assert terminator checks its condition.
struct AssertMessage
{
    enum class Kind
    {
        Overflow,
        OverflowNeg,
        DivisionByZero,
        RemainderByZero,
        BoundsCheck
    };

    Kind kind = Kind::Overflow;

    /// Operator whose overflow is checked for Kind::Overflow.
    BinOp op = BinOp::Add;

    /// Length and index operands for Kind::BoundsCheck.
    std::vector<Operand> operands;
};

/// @brief Control-flow instruction ending a basic block.
struct Terminator
{
    enum class Kind
    {
        Goto,
        SwitchInt,
        Return,
        Call,
        Assert,
        Drop,
        Unreachable,
        Abort
    };

    Kind kind = Kind::Unreachable;

    /// Successor for Goto, Assert, Drop and returning Call.
    std::optional<BlockId> target;

    /// Scrutinee for SwitchInt; condition for Assert; callee args live in @ref args.
    Operand operand;

    /// Type of the SwitchInt scrutinee.
    TypeRef switchType = nullptr;

    /// SwitchInt case values; @ref targets has one more entry (the otherwise arm).
    std::vector<uint64_t> values;
    std::vector<BlockId> targets;

    /// Called body name and generic arguments for Call.
    std::string callee;
    std::vector<TypeRef> substs;
    std::vector<Operand> args;

    /// Where a Call writes its result; empty for diverging calls.
    std::optional<Place> destination;

    /// Expected condition value for Assert.
    bool expected = true;
    AssertMessage msg;

    /// Dropped place for Drop.
    Place place;

    support::SourceLoc loc;
};

} // namespace ember::ir
