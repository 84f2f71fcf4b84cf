//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ir/Value.hpp
// Purpose: Declares IR places (addressable locations) and operands.
// Key invariants: A Place is a base local followed by projections applied left
//                 to right; an Operand is either a place read or a constant.
// Ownership/Lifetime: Places and operands are values owned by their statement.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Type.hpp"

#include <cstdint>
#include <vector>

namespace ember::ir
{

/// @brief Index of a local variable within a body; local 0 is the return place.
using Local = uint32_t;

/// @brief Index of a basic block within a body.
using BlockId = uint32_t;

/// @brief One step of a place projection.
struct ProjectionElem
{
    enum class Kind
    {
        Field,        ///< index = field number
        Downcast,     ///< index = enum variant
        Deref,        ///< follow a reference
        Index,        ///< index = local holding the element index
        ConstantIndex ///< index = element number
    };

    Kind kind = Kind::Field;
    uint32_t index = 0;

    bool operator==(const ProjectionElem &) const = default;
};

/// @brief Addressable location named by the IR.
struct Place
{
    Local local = 0;
    std::vector<ProjectionElem> projection;

    /// @brief Place naming local @p l itself.
    static Place fromLocal(Local l);

    Place field(uint32_t index) const;
    Place downcast(uint32_t variant) const;
    Place deref() const;
    Place index(Local indexLocal) const;
    Place constantIndex(uint32_t offset) const;

    /// @brief True when the place is a bare local without projections.
    [[nodiscard]] bool isLocal() const
    {
        return projection.empty();
    }

    bool operator==(const Place &) const = default;

  private:
    Place with(ProjectionElem::Kind kind, uint32_t index) const;
};

/// @brief Immediate scalar constant; wider values are built by aggregates.
struct Constant
{
    TypeRef type = nullptr;
    uint64_t bits = 0;

    bool operator==(const Constant &) const = default;
};

/// @brief Input to an rvalue or terminator.
struct Operand
{
    enum class Kind
    {
        Copy,
        Move,
        Constant
    };

    Kind kind = Kind::Constant;
    Place place;
    Constant constant;

    static Operand copy(Place p);
    static Operand move(Place p);
    static Operand constantOf(TypeRef type, uint64_t bits);

    bool operator==(const Operand &) const = default;
};

} // namespace ember::ir
