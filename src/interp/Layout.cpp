//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Layout.cpp
// Purpose: Implements C-like layout computation for IR types.
// Key invariants: Fields are placed in declaration order at their natural
//                 alignment; a type's size is a multiple of its alignment.
// Ownership/Lifetime: Layout objects live in LayoutContext::storage_.
//
//===----------------------------------------------------------------------===//

#include "interp/Layout.hpp"

#include <algorithm>
#include <string>

namespace ember::interp
{

uint64_t alignTo(uint64_t value, uint64_t align)
{
    return (value + align - 1) & ~(align - 1);
}

LayoutContext::LayoutContext(uint8_t pointerSize) : pointerSize_(pointerSize) {}

Layout *LayoutContext::make(ir::TypeRef type)
{
    storage_.push_back(std::make_unique<Layout>());
    Layout *l = storage_.back().get();
    l->type = type;
    return l;
}

EvalResult<const Layout *> LayoutContext::layoutOf(ir::TypeRef type)
{
    if (!type)
        return makeEvalError(EvalErrorKind::InternalInconsistency, "layout of a null type");
    if (auto it = cache_.find(type); it != cache_.end())
        return it->second;
    auto computed = compute(type);
    if (!computed)
        return computed.error();
    cache_.emplace(type, computed.value());
    return computed.value();
}

/// @brief Lay out @p fields sequentially starting at byte @p start.
/// @details Updates size, alignment, offsets and field layouts of @p out. The
///          final size is rounded up to the resulting alignment.
EvalResult<void> LayoutContext::placeFields(Layout &out,
                                            const std::vector<ir::TypeRef> &fields,
                                            uint64_t start)
{
    uint64_t offset = start;
    for (ir::TypeRef f : fields)
    {
        auto fl = layoutOf(f);
        if (!fl)
            return fl.error();
        const Layout *field = fl.value();
        if (field->unsized)
            return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                 "unsized field of type " + f->toString() + " in " +
                                     out.type->toString());
        offset = alignTo(offset, field->align);
        out.fieldOffsets.push_back(offset);
        out.fields.push_back(field);
        offset += field->size;
        out.align = std::max(out.align, field->align);
    }
    out.size = alignTo(offset, out.align);
    return {};
}

EvalResult<const Layout *> LayoutContext::compute(ir::TypeRef type)
{
    using Kind = ir::Type::Kind;
    switch (type->kind)
    {
        case Kind::Unit:
        {
            Layout *l = make(type);
            return static_cast<const Layout *>(l);
        }
        case Kind::Bool:
        {
            Layout *l = make(type);
            l->size = 1;
            l->abi = Layout::Abi::Scalar;
            return static_cast<const Layout *>(l);
        }
        case Kind::Int:
        case Kind::UInt:
        {
            const unsigned bits = type->bits;
            if (bits != 8 && bits != 16 && bits != 32 && bits != 64)
                return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                     "integer width " + std::to_string(bits) +
                                         " is not supported");
            Layout *l = make(type);
            l->size = bits / 8;
            l->align = l->size;
            l->abi = Layout::Abi::Scalar;
            return static_cast<const Layout *>(l);
        }
        case Kind::Ref:
        {
            Layout *l = make(type);
            l->align = pointerSize_;
            if (type->element->isSized())
            {
                l->size = pointerSize_;
                l->abi = Layout::Abi::Scalar;
                return static_cast<const Layout *>(l);
            }
            // Fat reference: data pointer followed by the element count. Both
            // halves are pointer-sized words viewed through the reference type.
            Layout *word = make(type);
            word->size = pointerSize_;
            word->align = pointerSize_;
            word->abi = Layout::Abi::Scalar;
            l->size = 2 * uint64_t{pointerSize_};
            l->abi = Layout::Abi::ScalarPair;
            l->fieldOffsets = {0, pointerSize_};
            l->fields = {word, word};
            return static_cast<const Layout *>(l);
        }
        case Kind::Array:
        case Kind::Slice:
        {
            auto el = layoutOf(type->element);
            if (!el)
                return el.error();
            if (el.value()->unsized)
                return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                     "array of unsized elements " + type->toString());
            Layout *l = make(type);
            l->elem = el.value();
            l->align = el.value()->align;
            if (type->kind == Kind::Slice)
            {
                l->unsized = true;
                return static_cast<const Layout *>(l);
            }
            l->count = type->length;
            l->size = el.value()->size * type->length;
            return static_cast<const Layout *>(l);
        }
        case Kind::Tuple:
        case Kind::Struct:
        {
            Layout *l = make(type);
            auto placed = placeFields(*l, type->fields, 0);
            if (!placed)
                return placed.error();
            if (type->kind == Kind::Tuple && l->fields.size() == 2 &&
                l->fields[0]->abi == Layout::Abi::Scalar &&
                l->fields[1]->abi == Layout::Abi::Scalar)
                l->abi = Layout::Abi::ScalarPair;
            return static_cast<const Layout *>(l);
        }
        case Kind::Union:
        {
            Layout *l = make(type);
            uint64_t size = 0;
            for (ir::TypeRef f : type->fields)
            {
                auto fl = layoutOf(f);
                if (!fl)
                    return fl.error();
                if (fl.value()->unsized)
                    return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                         "unsized union field in " + type->toString());
                l->fieldOffsets.push_back(0);
                l->fields.push_back(fl.value());
                size = std::max(size, fl.value()->size);
                l->align = std::max(l->align, fl.value()->align);
            }
            l->size = alignTo(size, l->align);
            return static_cast<const Layout *>(l);
        }
        case Kind::Enum:
        {
            const unsigned bits = type->bits;
            if (bits != 8 && bits != 16 && bits != 32 && bits != 64)
                return makeEvalError(EvalErrorKind::UnsupportedFeature,
                                     "enum tag width " + std::to_string(bits) +
                                         " is not supported");
            Layout *l = make(type);
            l->tagSize = bits / 8;
            l->align = l->tagSize;
            if (type->variants.empty())
            {
                l->abi = Layout::Abi::Uninhabited;
                return static_cast<const Layout *>(l);
            }
            uint64_t size = l->tagSize;
            std::vector<Layout *> views;
            for (uint32_t v = 0; v < type->variants.size(); ++v)
            {
                Layout *view = make(type);
                view->variantIndex = v;
                view->tagSize = l->tagSize;
                view->align = l->tagSize;
                auto placed = placeFields(*view, type->variants[v].fields, l->tagSize);
                if (!placed)
                    return placed.error();
                size = std::max(size, view->size);
                l->align = std::max(l->align, view->align);
                views.push_back(view);
            }
            l->size = alignTo(size, l->align);
            for (Layout *view : views)
            {
                view->size = l->size;
                view->align = l->align;
                l->variants.push_back(view);
            }
            return static_cast<const Layout *>(l);
        }
        case Kind::Param:
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "layout requested for unsubstituted generic parameter " +
                                     type->toString());
    }
    return makeEvalError(EvalErrorKind::InternalInconsistency,
                         "unknown type kind in " + type->toString());
}

} // namespace ember::interp
