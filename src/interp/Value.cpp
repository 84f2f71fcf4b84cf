//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Value.cpp
// Purpose: Implements scalar construction, width arithmetic and checked
//          conversions from scalars to host values.
// Key invariants: Constructors always truncate to the declared width so two
//                 scalars with equal meaning compare equal.
// Ownership/Lifetime: Stateless helpers.
//
//===----------------------------------------------------------------------===//

#include "interp/Value.hpp"

namespace ember::interp
{

uint64_t truncationMask(uint64_t size)
{
    if (size >= 8)
        return ~uint64_t{0};
    return (uint64_t{1} << (size * 8)) - 1;
}

uint64_t truncate(uint64_t value, uint64_t size)
{
    return value & truncationMask(size);
}

int64_t signExtend(uint64_t value, uint64_t size)
{
    if (size == 0)
        return 0;
    if (size >= 8)
        return static_cast<int64_t>(value);
    const unsigned shift = static_cast<unsigned>(64 - size * 8);
    return static_cast<int64_t>(value << shift) >> shift;
}

Scalar Scalar::undef()
{
    return Scalar{};
}

Scalar Scalar::fromUint(uint64_t bits, uint8_t size)
{
    Scalar s;
    s.kind = Kind::Bits;
    s.size = size;
    s.bits = truncate(bits, size);
    return s;
}

Scalar Scalar::fromInt(int64_t value, uint8_t size)
{
    return fromUint(static_cast<uint64_t>(value), size);
}

Scalar Scalar::fromBool(bool b)
{
    return fromUint(b ? 1 : 0, 1);
}

Scalar Scalar::fromPointer(Pointer p, uint8_t pointerSize)
{
    Scalar s;
    s.kind = Kind::Ptr;
    s.size = pointerSize;
    s.ptr = p;
    return s;
}

EvalResult<Scalar> Scalar::notUndef() const
{
    if (isUndef())
        return makeEvalError(EvalErrorKind::InvalidValue,
                             "attempted to read undefined bytes");
    return *this;
}

EvalResult<uint64_t> Scalar::toBits(uint8_t expectedSize) const
{
    switch (kind)
    {
        case Kind::Undef:
            return makeEvalError(EvalErrorKind::InvalidValue,
                                 "attempted to read undefined bytes");
        case Kind::Ptr:
            return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                 "a pointer cannot be read as raw bytes");
        case Kind::Bits:
            break;
    }
    if (size != expectedSize)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "scalar of " + std::to_string(size) + " bytes read as " +
                                 std::to_string(expectedSize) + " bytes");
    return bits;
}

EvalResult<bool> Scalar::toBool() const
{
    auto b = toBits(1);
    if (!b)
        return b.error();
    if (b.value() > 1)
        return makeEvalError(EvalErrorKind::InvalidValue,
                             "invalid boolean value " + std::to_string(b.value()));
    return b.value() == 1;
}

EvalResult<Pointer> Scalar::toPointer() const
{
    switch (kind)
    {
        case Kind::Undef:
            return makeEvalError(EvalErrorKind::InvalidValue,
                                 "attempted to read undefined bytes");
        case Kind::Bits:
            return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                 "integer " + std::to_string(bits) + " used as a pointer");
        case Kind::Ptr:
            break;
    }
    return ptr;
}

std::string Scalar::toString() const
{
    switch (kind)
    {
        case Kind::Undef:
            return "undef";
        case Kind::Bits:
            return std::to_string(bits) + "_u" + std::to_string(size * 8);
        case Kind::Ptr:
            return "alloc" + std::to_string(ptr.alloc) + "+" + std::to_string(ptr.offset);
    }
    return "?";
}

Immediate Immediate::fromScalar(Scalar s)
{
    Immediate imm;
    imm.kind = Kind::Scalar;
    imm.first = s;
    return imm;
}

Immediate Immediate::fromPair(Scalar a, Scalar b)
{
    Immediate imm;
    imm.kind = Kind::ScalarPair;
    imm.first = a;
    imm.second = b;
    return imm;
}

} // namespace ember::interp
