//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Casts.cpp
// Purpose: Implements type-directed conversions between scalars, C-like
//          enums and references.
// Key invariants: Integer casts truncate to the target width and extend by
//                 the source's signedness. Pointers keep their provenance.
// Ownership/Lifetime: Engine members; no state of their own.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

#include "ir/Printer.hpp"

#include <algorithm>
#include <string>

namespace ember::interp
{

namespace
{
bool isCLikeEnum(ir::TypeRef type)
{
    return type->kind == ir::Type::Kind::Enum &&
           std::all_of(type->variants.begin(),
                       type->variants.end(),
                       [](const ir::VariantDef &v) { return v.fields.empty(); });
}

bool isThinRef(ir::TypeRef type)
{
    return type->kind == ir::Type::Kind::Ref && type->element->isSized();
}

EvalError invalidCast(ir::CastKind kind, ir::TypeRef from, ir::TypeRef to)
{
    return makeEvalError(EvalErrorKind::InvalidCast,
                         "cannot apply " + std::string(ir::toString(kind)) + " cast from " +
                             from->toString() + " to " + to->toString());
}
} // namespace

EvalResult<void> Engine::cast(const OpTy &src, ir::CastKind kind, const PlaceTy &dest)
{
    const ir::TypeRef from = src.layout->type;
    const ir::TypeRef to = dest.layout->type;

    switch (kind)
    {
        case ir::CastKind::Misc:
            break;
        case ir::CastKind::Unsize:
        {
            if (from->kind != ir::Type::Kind::Ref || from->element->kind != ir::Type::Kind::Array ||
                to->kind != ir::Type::Kind::Ref || to->element->kind != ir::Type::Kind::Slice ||
                from->element->element != to->element->element)
                return invalidCast(kind, from, to);
            auto ptr = readScalar(src);
            if (!ptr)
                return ptr.error();
            const Scalar len = Scalar::fromUint(from->element->length, pointerSize());
            return writeImmediate(Immediate::fromPair(ptr.value(), len), dest);
        }
        case ir::CastKind::ReifyFnPointer:
        case ir::CastKind::ClosureFnPointer:
        case ir::CastKind::UnsafeFnPointer:
            return invalidCast(kind, from, to);
    }

    if (to->isInteger())
    {
        const uint8_t size = static_cast<uint8_t>(dest.layout->size);
        if (from->isInteger() || from->kind == ir::Type::Kind::Bool)
        {
            auto value = readScalar(src);
            if (!value)
                return value.error();
            auto bits = value.value().toBits(static_cast<uint8_t>(src.layout->size));
            if (!bits)
                return bits.error();
            const Scalar converted =
                from->isSigned() ? Scalar::fromInt(signExtend(bits.value(), src.layout->size), size)
                                 : Scalar::fromUint(bits.value(), size);
            return writeScalar(converted, dest);
        }
        if (isCLikeEnum(from))
        {
            if (src.kind != OpTy::Kind::Indirect)
                return makeEvalError(EvalErrorKind::InternalInconsistency,
                                     "enum value held outside memory");
            auto discr = readDiscriminantAt(src.mem, src.layout);
            if (!discr)
                return discr.error();
            return writeScalar(Scalar::fromInt(discr.value(), size), dest);
        }
        if (isThinRef(from) && to->kind == ir::Type::Kind::UInt && size == pointerSize())
        {
            auto ptr = readScalar(src);
            if (!ptr)
                return ptr.error();
            return writeScalar(ptr.value(), dest);
        }
        return invalidCast(kind, from, to);
    }

    if (isThinRef(from) && isThinRef(to))
    {
        auto ptr = readScalar(src);
        if (!ptr)
            return ptr.error();
        return writeScalar(ptr.value(), dest);
    }

    return invalidCast(kind, from, to);
}

} // namespace ember::interp
