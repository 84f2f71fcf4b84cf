//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Places.cpp
// Purpose: Implements place resolution: projections, forcing locals into
//          memory and enum discriminant access.
// Key invariants: Projections other than Downcast always yield memory places;
//                 a downcast only narrows the layout of the same storage.
// Ownership/Lifetime: Spilled locals own their new stack allocation.
//
//===----------------------------------------------------------------------===//

#include "interp/Engine.hpp"

namespace ember::interp
{

EvalResult<PlaceTy> Engine::evalPlace(const ir::Place &place)
{
    if (stack_.empty())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "place evaluated without an active frame");
    const Frame &fr = frame();
    if (place.local >= fr.locals.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "local _" + std::to_string(place.local) + " does not exist in `" +
                                 fr.body->name + "`");
    auto layout = localLayout(fr, place.local);
    if (!layout)
        return layout.error();

    PlaceTy cur{Place::fromLocal(curFrame(), place.local), layout.value()};
    for (const ir::ProjectionElem &elem : place.projection)
    {
        EvalResult<PlaceTy> next = cur;
        switch (elem.kind)
        {
            case ir::ProjectionElem::Kind::Field:
                next = placeField(cur, elem.index);
                break;
            case ir::ProjectionElem::Kind::Downcast:
                next = placeDowncast(cur, elem.index);
                break;
            case ir::ProjectionElem::Kind::Deref:
                next = derefPlace(cur);
                break;
            case ir::ProjectionElem::Kind::Index:
            {
                auto idx = evalOperand(ir::Operand::copy(ir::Place::fromLocal(elem.index)));
                if (!idx)
                    return idx.error();
                auto scalar = readScalar(idx.value());
                if (!scalar)
                    return scalar.error();
                auto n = scalar.value().toBits(pointerSize());
                if (!n)
                    return n.error();
                next = placeIndex(cur, n.value());
                break;
            }
            case ir::ProjectionElem::Kind::ConstantIndex:
                next = placeIndex(cur, elem.index);
                break;
        }
        if (!next)
            return next.error();
        cur = next.value();
    }
    return cur;
}

EvalResult<MemPlaceTy> Engine::forceAllocation(const PlaceTy &place)
{
    if (place.place.kind == Place::Kind::Memory)
        return MemPlaceTy{place.place.mem, place.layout};

    LocalValue &lv = localAt(place.place);
    switch (lv.state)
    {
        case LocalValue::State::Dead:
            return makeEvalError(EvalErrorKind::InvalidValue,
                                 "use of dead local _" + std::to_string(place.place.local));
        case LocalValue::State::Indirect:
            break;
        case LocalValue::State::Immediate:
        {
            const Immediate imm = lv.imm;
            const Pointer ptr =
                memory_.allocate(place.layout->size, place.layout->align, MemoryKind::Stack);
            auto r = writeImmediateToMem(imm, MemPlace{ptr, std::nullopt, place.layout->align},
                                         place.layout);
            if (!r)
                return r.error();
            LocalValue &spilled = localAt(place.place);
            spilled.state = LocalValue::State::Indirect;
            spilled.ptr = ptr;
            break;
        }
    }
    return MemPlaceTy{MemPlace{localAt(place.place).ptr, std::nullopt, place.layout->align},
                      place.layout};
}

EvalResult<MemPlaceTy> Engine::mplaceField(const MemPlaceTy &base, uint32_t index)
{
    if (index >= base.layout->fields.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "field " + std::to_string(index) + " does not exist in " +
                                 base.layout->type->toString());
    const Layout *field = base.layout->fields[index];
    auto ptr = memory_.pointerOffset(base.mplace.ptr, base.layout->fieldOffsets[index]);
    if (!ptr)
        return ptr.error();
    return MemPlaceTy{MemPlace{ptr.value(), std::nullopt, field->align}, field};
}

EvalResult<PlaceTy> Engine::placeField(const PlaceTy &base, uint32_t index)
{
    if (index >= base.layout->fields.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "field " + std::to_string(index) + " does not exist in " +
                                 base.layout->type->toString());
    auto mplace = forceAllocation(base);
    if (!mplace)
        return mplace.error();
    auto field = mplaceField(mplace.value(), index);
    if (!field)
        return field.error();
    return field.value().toPlace();
}

EvalResult<PlaceTy> Engine::placeDowncast(const PlaceTy &base, uint32_t variant)
{
    const Layout *layout = base.layout;
    if (layout->type->kind != ir::Type::Kind::Enum)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "downcast of non-enum type " + layout->type->toString());
    if (layout->variantIndex)
    {
        if (*layout->variantIndex == variant)
            return base;
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "downcast of variant " + std::to_string(*layout->variantIndex) +
                                 " to variant " + std::to_string(variant));
    }
    if (variant >= layout->variants.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "variant " + std::to_string(variant) + " does not exist in " +
                                 layout->type->toString());
    return PlaceTy{base.place, layout->variants[variant]};
}

EvalResult<PlaceTy> Engine::placeIndex(const PlaceTy &base, uint64_t index)
{
    auto mplace = forceAllocation(base);
    if (!mplace)
        return mplace.error();
    auto len = mplace.value().len();
    if (!len)
        return len.error();
    if (index >= len.value())
        return makeEvalError(EvalErrorKind::OutOfBounds,
                             "index out of bounds: the len is " + std::to_string(len.value()) +
                                 " but the index is " + std::to_string(index));
    const Layout *elem = base.layout->elem;
    auto ptr = memory_.pointerOffset(mplace.value().mplace.ptr, index * elem->size);
    if (!ptr)
        return ptr.error();
    return PlaceTy{Place::fromMem(MemPlace{ptr.value(), std::nullopt, elem->align}), elem};
}

EvalResult<PlaceTy> Engine::derefPlace(const PlaceTy &base)
{
    const ir::TypeRef type = base.layout->type;
    if (type->kind != ir::Type::Kind::Ref)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "dereference of non-reference type " + type->toString());
    auto op = placeToOp(base);
    if (!op)
        return op.error();
    auto value = readValue(op.value());
    if (!value)
        return value.error();
    auto pointee = layoutOf(type->element);
    if (!pointee)
        return pointee.error();
    auto ptr = value.value().value.first.toPointer();
    if (!ptr)
        return ptr.error();

    MemPlace mem{ptr.value(), std::nullopt, pointee.value()->align};
    if (pointee.value()->unsized)
        mem.meta = value.value().value.second;
    return PlaceTy{Place::fromMem(mem), pointee.value()};
}

EvalResult<void> Engine::writeDiscriminantValue(const PlaceTy &dest, uint32_t variant)
{
    const Layout *layout = dest.layout;
    const ir::TypeRef type = layout->type;
    if (type->kind != ir::Type::Kind::Enum || layout->variantIndex)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "setting the discriminant of non-enum type " + type->toString());
    if (variant >= type->variants.size())
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "variant " + std::to_string(variant) + " does not exist in " +
                                 type->toString());
    auto mplace = forceAllocation(dest);
    if (!mplace)
        return mplace.error();
    const uint8_t tagSize = static_cast<uint8_t>(layout->tagSize);
    return memory_.writeScalar(mplace.value().mplace.ptr,
                               Scalar::fromInt(type->variants[variant].discriminant, tagSize),
                               tagSize);
}

EvalResult<int64_t> Engine::readDiscriminantValue(const PlaceTy &place)
{
    if (place.layout->type->kind != ir::Type::Kind::Enum)
        return int64_t{0};
    auto op = placeToOp(place);
    if (!op)
        return op.error();
    if (op.value().kind != OpTy::Kind::Indirect)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "enum value of " + place.layout->type->toString() +
                                 " held outside memory");
    return readDiscriminantAt(op.value().mem, place.layout);
}

/// @brief Decode the tag stored at @p mem into the variant's discriminant.
EvalResult<int64_t> Engine::readDiscriminantAt(const MemPlace &mem, const Layout *layout)
{
    const ir::TypeRef type = layout->type;
    const uint8_t tagSize = static_cast<uint8_t>(layout->tagSize);
    auto raw = memory_.readScalar(mem.ptr, tagSize);
    if (!raw)
        return raw.error();
    auto bits = raw.value().toBits(tagSize);
    if (!bits)
        return bits.error();
    for (const ir::VariantDef &v : type->variants)
    {
        if (truncate(static_cast<uint64_t>(v.discriminant), tagSize) == bits.value())
            return v.discriminant;
    }
    return makeEvalError(EvalErrorKind::InvalidDiscriminant,
                         "invalid discriminant " + std::to_string(bits.value()) + " for " +
                             type->toString());
}

} // namespace ember::interp
