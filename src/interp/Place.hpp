//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Place.hpp
// Purpose: Declares resolved destinations (places) and typed operands that
//          flow between the rvalue evaluator and memory.
// Key invariants: A Local place names a frame by stack index, never by
//                 pointer, so pushing frames cannot invalidate it. The layout
//                 of a typed place is always monomorphic.
// Ownership/Lifetime: Value types; layouts are borrowed from LayoutContext.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"
#include "interp/Layout.hpp"
#include "interp/Value.hpp"
#include "ir/Value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace ember::interp
{

/// @brief Place backed by concrete memory.
struct MemPlace
{
    Pointer ptr{};
    std::optional<Scalar> meta; ///< Element count for unsized places.
    uint64_t align = 1;

    bool operator==(const MemPlace &) const = default;
};

/// @brief Storage location: a local of some frame or a memory range.
struct Place
{
    enum class Kind
    {
        Local,
        Memory
    };

    Kind kind = Kind::Local;
    size_t frame = 0;
    ir::Local local = 0;
    MemPlace mem{};

    static Place fromLocal(size_t frame, ir::Local local)
    {
        Place p;
        p.kind = Kind::Local;
        p.frame = frame;
        p.local = local;
        return p;
    }

    static Place fromMem(MemPlace mem)
    {
        Place p;
        p.kind = Kind::Memory;
        p.mem = mem;
        return p;
    }

    bool operator==(const Place &) const = default;
};

/// @brief Place plus the layout of the value stored there.
struct PlaceTy
{
    Place place;
    const Layout *layout = nullptr;

    bool operator==(const PlaceTy &) const = default;
};

/// @brief Memory place plus its layout.
struct MemPlaceTy
{
    MemPlace mplace;
    const Layout *layout = nullptr;

    /// @brief Element count of an array or slice place.
    EvalResult<uint64_t> len() const
    {
        if (layout->unsized)
        {
            if (!mplace.meta)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "unsized place without length metadata");
            return mplace.meta->toBits(mplace.meta->size);
        }
        if (!layout->elem)
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "length of non-array type " + layout->type->toString());
        return layout->count;
    }

    PlaceTy toPlace() const
    {
        return PlaceTy{Place::fromMem(mplace), layout};
    }
};

/// @brief Evaluated operand: an immediate value or a reference to memory.
struct OpTy
{
    enum class Kind
    {
        Immediate,
        Indirect
    };

    Kind kind = Kind::Immediate;
    Immediate imm{};
    MemPlace mem{};
    const Layout *layout = nullptr;

    static OpTy fromImmediate(Immediate imm, const Layout *layout)
    {
        OpTy op;
        op.kind = Kind::Immediate;
        op.imm = imm;
        op.layout = layout;
        return op;
    }

    static OpTy fromMem(MemPlace mem, const Layout *layout)
    {
        OpTy op;
        op.kind = Kind::Indirect;
        op.mem = mem;
        op.layout = layout;
        return op;
    }
};

/// @brief Immediate value together with its layout.
struct ValTy
{
    Immediate value{};
    const Layout *layout = nullptr;
};

} // namespace ember::interp
