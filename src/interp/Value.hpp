//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Value.hpp
// Purpose: Declares the primitive runtime values of the interpreter: pointers,
//          scalars and immediates.
// Key invariants: A Bits scalar's value is truncated to its byte width; a Ptr
//                 scalar's width is the target pointer size.
// Ownership/Lifetime: Plain value types.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"

#include <cstdint>
#include <string>

namespace ember::interp
{

/// @brief Identifier of an allocation in Memory; 0 is never handed out.
using AllocId = uint64_t;

/// @brief Pointer into an allocation (provenance plus byte offset).
struct Pointer
{
    AllocId alloc = 0;
    uint64_t offset = 0;

    bool operator==(const Pointer &) const = default;
};

/// @brief Fixed-width primitive value.
/// @invariant Only the member matching @ref kind is meaningful.
struct Scalar
{
    enum class Kind
    {
        Undef, ///< Uninitialised bytes.
        Bits,  ///< Plain integer bits.
        Ptr    ///< Pointer with provenance.
    };

    Kind kind = Kind::Undef;
    uint64_t bits = 0;
    uint8_t size = 0;
    Pointer ptr{};

    static Scalar undef();

    /// @brief Bits scalar; @p bits is truncated to @p size bytes.
    static Scalar fromUint(uint64_t bits, uint8_t size);
    static Scalar fromInt(int64_t value, uint8_t size);
    static Scalar fromBool(bool b);
    static Scalar fromPointer(Pointer p, uint8_t pointerSize);

    [[nodiscard]] bool isUndef() const
    {
        return kind == Kind::Undef;
    }

    [[nodiscard]] bool isBits() const
    {
        return kind == Kind::Bits;
    }

    [[nodiscard]] bool isPtr() const
    {
        return kind == Kind::Ptr;
    }

    /// @brief Fail with InvalidValue when undefined, else return *this.
    EvalResult<Scalar> notUndef() const;

    /// @brief Raw bits of a defined, non-pointer scalar of width @p expectedSize.
    EvalResult<uint64_t> toBits(uint8_t expectedSize) const;

    EvalResult<bool> toBool() const;
    EvalResult<Pointer> toPointer() const;

    std::string toString() const;

    bool operator==(const Scalar &) const = default;
};

/// @brief Mask selecting the low @p size bytes.
uint64_t truncationMask(uint64_t size);

/// @brief Truncate @p value to @p size bytes.
uint64_t truncate(uint64_t value, uint64_t size);

/// @brief Sign-extend the low @p size bytes of @p value.
int64_t signExtend(uint64_t value, uint64_t size);

/// @brief Value that fits in registers: one scalar or a pair (fat pointers,
///        checked-arithmetic results).
struct Immediate
{
    enum class Kind
    {
        Scalar,
        ScalarPair
    };

    Kind kind = Kind::Scalar;
    Scalar first{};
    Scalar second{};

    static Immediate fromScalar(Scalar s);
    static Immediate fromPair(Scalar a, Scalar b);

    bool operator==(const Immediate &) const = default;
};

} // namespace ember::interp
