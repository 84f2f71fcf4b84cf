//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Type.cpp
// Purpose: Implements type spelling, interning and generic substitution.
// Key invariants: intern() never stores two structurally equal types.
// Ownership/Lifetime: TypeContext owns all interned types.
//
//===----------------------------------------------------------------------===//

#include "ir/Type.hpp"

#include <algorithm>

namespace ember::ir
{

bool Type::hasParams() const
{
    switch (kind)
    {
        case Kind::Param:
            return true;
        case Kind::Ref:
        case Kind::Array:
        case Kind::Slice:
            return element->hasParams();
        case Kind::Tuple:
        case Kind::Struct:
        case Kind::Union:
            return std::any_of(
                fields.begin(), fields.end(), [](TypeRef f) { return f->hasParams(); });
        case Kind::Enum:
            for (const auto &v : variants)
                for (TypeRef f : v.fields)
                    if (f->hasParams())
                        return true;
            return false;
        default:
            return false;
    }
}

std::string Type::toString() const
{
    switch (kind)
    {
        case Kind::Unit:
            return "()";
        case Kind::Bool:
            return "bool";
        case Kind::Int:
            return "i" + std::to_string(bits);
        case Kind::UInt:
            return "u" + std::to_string(bits);
        case Kind::Ref:
            return "&" + element->toString();
        case Kind::Array:
            return "[" + element->toString() + "; " + std::to_string(length) + "]";
        case Kind::Slice:
            return "[" + element->toString() + "]";
        case Kind::Tuple:
        {
            std::string out = "(";
            for (size_t i = 0; i < fields.size(); ++i)
            {
                if (i)
                    out += ", ";
                out += fields[i]->toString();
            }
            if (fields.size() == 1)
                out += ",";
            return out + ")";
        }
        case Kind::Struct:
        case Kind::Union:
        case Kind::Enum:
            return name;
        case Kind::Param:
            return "T" + std::to_string(paramIndex);
    }
    return "?";
}

TypeContext::TypeContext(unsigned pointerBits) : pointerBits_(pointerBits) {}

TypeRef TypeContext::intern(Type type)
{
    for (const auto &existing : types_)
    {
        if (*existing == type)
            return existing.get();
    }
    types_.push_back(std::make_unique<Type>(std::move(type)));
    return types_.back().get();
}

TypeRef TypeContext::unit()
{
    return intern(Type{});
}

TypeRef TypeContext::boolean()
{
    Type t;
    t.kind = Type::Kind::Bool;
    return intern(std::move(t));
}

TypeRef TypeContext::intTy(unsigned bits)
{
    Type t;
    t.kind = Type::Kind::Int;
    t.bits = bits;
    return intern(std::move(t));
}

TypeRef TypeContext::uintTy(unsigned bits)
{
    Type t;
    t.kind = Type::Kind::UInt;
    t.bits = bits;
    return intern(std::move(t));
}

TypeRef TypeContext::usize()
{
    return uintTy(pointerBits_);
}

TypeRef TypeContext::isize()
{
    return intTy(pointerBits_);
}

TypeRef TypeContext::ref(TypeRef pointee)
{
    Type t;
    t.kind = Type::Kind::Ref;
    t.element = pointee;
    return intern(std::move(t));
}

TypeRef TypeContext::array(TypeRef element, uint64_t length)
{
    Type t;
    t.kind = Type::Kind::Array;
    t.element = element;
    t.length = length;
    return intern(std::move(t));
}

TypeRef TypeContext::slice(TypeRef element)
{
    Type t;
    t.kind = Type::Kind::Slice;
    t.element = element;
    return intern(std::move(t));
}

TypeRef TypeContext::tuple(std::vector<TypeRef> fields)
{
    Type t;
    t.kind = Type::Kind::Tuple;
    t.fields = std::move(fields);
    return intern(std::move(t));
}

TypeRef TypeContext::structTy(std::string name, std::vector<TypeRef> fields)
{
    Type t;
    t.kind = Type::Kind::Struct;
    t.name = std::move(name);
    t.fields = std::move(fields);
    return intern(std::move(t));
}

TypeRef TypeContext::unionTy(std::string name, std::vector<TypeRef> fields)
{
    Type t;
    t.kind = Type::Kind::Union;
    t.name = std::move(name);
    t.fields = std::move(fields);
    return intern(std::move(t));
}

TypeRef TypeContext::enumTy(std::string name, std::vector<VariantDef> variants, unsigned tagBits)
{
    Type t;
    t.kind = Type::Kind::Enum;
    t.name = std::move(name);
    t.variants = std::move(variants);
    t.bits = tagBits;
    return intern(std::move(t));
}

TypeRef TypeContext::param(unsigned index)
{
    Type t;
    t.kind = Type::Kind::Param;
    t.paramIndex = index;
    return intern(std::move(t));
}

TypeRef TypeContext::substitute(TypeRef type, std::span<const TypeRef> substs)
{
    if (!type->hasParams())
        return type;

    auto substFields = [&](const std::vector<TypeRef> &in, std::vector<TypeRef> &out) -> bool
    {
        out.reserve(in.size());
        for (TypeRef f : in)
        {
            TypeRef s = substitute(f, substs);
            if (!s)
                return false;
            out.push_back(s);
        }
        return true;
    };

    Type t = *type;
    switch (type->kind)
    {
        case Type::Kind::Param:
            if (type->paramIndex >= substs.size())
                return nullptr;
            return substs[type->paramIndex];
        case Type::Kind::Ref:
        case Type::Kind::Array:
        case Type::Kind::Slice:
            t.element = substitute(type->element, substs);
            if (!t.element)
                return nullptr;
            break;
        case Type::Kind::Tuple:
        case Type::Kind::Struct:
        case Type::Kind::Union:
            t.fields.clear();
            if (!substFields(type->fields, t.fields))
                return nullptr;
            break;
        case Type::Kind::Enum:
            for (size_t i = 0; i < type->variants.size(); ++i)
            {
                t.variants[i].fields.clear();
                if (!substFields(type->variants[i].fields, t.variants[i].fields))
                    return nullptr;
            }
            break;
        default:
            break;
    }
    return intern(std::move(t));
}

} // namespace ember::ir
