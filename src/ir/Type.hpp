//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Type.hpp
// Purpose: Declares the IR type representation and the interning context.
// Key invariants: Types are interned; two TypeRefs are equal iff the types are
//                 structurally identical, so pointer comparison is type equality.
// Ownership/Lifetime: TypeContext owns every Type it hands out; TypeRefs stay
//                     valid for the context's lifetime.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace ember::ir
{

struct Type;

/// @brief Non-owning handle to an interned type.
using TypeRef = const Type *;

/// @brief One variant of an enum type.
struct VariantDef
{
    std::string name;            ///< Variant name used in traces.
    std::vector<TypeRef> fields; ///< Field types in declaration order.
    int64_t discriminant = 0;    ///< Value stored in the tag for this variant.

    bool operator==(const VariantDef &) const = default;
};

/// @brief IR type; the kind field determines which payload members are meaningful.
struct Type
{
    /// @brief Enumerates IR type constructors.
    enum class Kind
    {
        Unit,
        Bool,
        Int,
        UInt,
        Ref,
        Array,
        Slice,
        Tuple,
        Struct,
        Union,
        Enum,
        Param
    };

    Kind kind = Kind::Unit;

    /// Integer width for Int/UInt; tag width for Enum.
    unsigned bits = 0;

    /// Pointee for Ref; element for Array and Slice.
    TypeRef element = nullptr;

    /// Element count for Array.
    uint64_t length = 0;

    /// Field types for Tuple, Struct and Union.
    std::vector<TypeRef> fields;

    /// Variants for Enum.
    std::vector<VariantDef> variants;

    /// Generic parameter position for Param.
    unsigned paramIndex = 0;

    /// Nominal name for Struct, Union and Enum.
    std::string name;

    bool operator==(const Type &) const = default;

    [[nodiscard]] bool isInteger() const
    {
        return kind == Kind::Int || kind == Kind::UInt;
    }

    [[nodiscard]] bool isSigned() const
    {
        return kind == Kind::Int;
    }

    /// @brief Whether the type has a statically known size.
    [[nodiscard]] bool isSized() const
    {
        return kind != Kind::Slice;
    }

    /// @brief Whether values of this type are ADTs that may carry a discriminant.
    [[nodiscard]] bool isAdt() const
    {
        return kind == Kind::Struct || kind == Kind::Union || kind == Kind::Enum;
    }

    /// @brief Whether the type mentions a generic parameter anywhere.
    [[nodiscard]] bool hasParams() const;

    /// @brief Human-readable spelling, e.g. `&[u8]` or `Option`.
    std::string toString() const;
};

/// @brief Interns types so that structural equality is pointer equality.
class TypeContext
{
  public:
    /// @param pointerBits Width of `usize`/`isize` in bits.
    explicit TypeContext(unsigned pointerBits = 64);

    TypeContext(const TypeContext &) = delete;
    TypeContext &operator=(const TypeContext &) = delete;

    TypeRef unit();
    TypeRef boolean();
    TypeRef intTy(unsigned bits);
    TypeRef uintTy(unsigned bits);
    TypeRef usize();
    TypeRef isize();
    TypeRef ref(TypeRef pointee);
    TypeRef array(TypeRef element, uint64_t length);
    TypeRef slice(TypeRef element);
    TypeRef tuple(std::vector<TypeRef> fields);
    TypeRef structTy(std::string name, std::vector<TypeRef> fields);
    TypeRef unionTy(std::string name, std::vector<TypeRef> fields);

    /// @brief Enum with the given variants; @p tagBits sizes the stored tag.
    TypeRef enumTy(std::string name, std::vector<VariantDef> variants, unsigned tagBits = 8);

    /// @brief Generic parameter number @p index of the enclosing body.
    TypeRef param(unsigned index);

    /// @brief Replace every Param in @p type by the matching entry of @p substs.
    /// @return Substituted type, or nullptr when a parameter has no substitution.
    TypeRef substitute(TypeRef type, std::span<const TypeRef> substs);

    [[nodiscard]] unsigned pointerBits() const
    {
        return pointerBits_;
    }

  private:
    TypeRef intern(Type type);

    unsigned pointerBits_;
    std::vector<std::unique_ptr<Type>> types_;
};

} // namespace ember::ir
