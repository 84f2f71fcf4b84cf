//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Layout.hpp
// Purpose: Declares type layouts (size, alignment, field offsets, ABI class)
//          and the per-engine cache that computes them.
// Key invariants: Layouts are interned per type; pointers returned by
//                 LayoutContext stay valid for the context's lifetime. Enum
//                 variant layouts span the whole enum so their field offsets
//                 are relative to the enum's first byte.
// Ownership/Lifetime: LayoutContext owns every Layout it hands out.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"
#include "ir/Type.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace ember::interp
{

/// @brief Size, alignment and field placement of one (monomorphic) type.
struct Layout
{
    /// @brief How a value of the type travels outside memory.
    enum class Abi
    {
        Scalar,     ///< One scalar (integers, bools, thin references).
        ScalarPair, ///< Two scalars (fat references, two-field scalar tuples).
        Aggregate,  ///< Lives in memory.
        Uninhabited ///< No values (enums without variants).
    };

    ir::TypeRef type = nullptr;
    uint64_t size = 0;
    uint64_t align = 1;
    bool unsized = false;
    Abi abi = Abi::Aggregate;

    /// Byte offsets and layouts of tuple, struct, union or variant fields.
    std::vector<uint64_t> fieldOffsets;
    std::vector<const Layout *> fields;

    /// Tag width in bytes for enums; the tag lives at offset 0.
    uint64_t tagSize = 0;

    /// Per-variant views of an enum; each has the enum's size.
    std::vector<const Layout *> variants;

    /// Set on variant views.
    std::optional<uint32_t> variantIndex;

    /// Element layout for arrays and slices; element count for arrays.
    const Layout *elem = nullptr;
    uint64_t count = 0;

    /// @brief Whether the type occupies no storage.
    [[nodiscard]] bool isZst() const
    {
        return !unsized && size == 0;
    }
};

/// @brief Computes and caches layouts for a fixed pointer width.
class LayoutContext
{
  public:
    /// @param pointerSize Width of references and `usize` in bytes.
    explicit LayoutContext(uint8_t pointerSize);

    LayoutContext(const LayoutContext &) = delete;
    LayoutContext &operator=(const LayoutContext &) = delete;

    /// @brief Layout of monomorphic type @p type.
    /// @return InternalInconsistency for unsubstituted generic parameters and
    ///         UnsupportedFeature for integer widths other than 8/16/32/64.
    EvalResult<const Layout *> layoutOf(ir::TypeRef type);

    [[nodiscard]] uint8_t pointerSize() const
    {
        return pointerSize_;
    }

  private:
    Layout *make(ir::TypeRef type);
    EvalResult<const Layout *> compute(ir::TypeRef type);
    EvalResult<void> placeFields(Layout &out, const std::vector<ir::TypeRef> &fields, uint64_t start);

    uint8_t pointerSize_;
    std::vector<std::unique_ptr<Layout>> storage_;
    std::unordered_map<ir::TypeRef, const Layout *> cache_;
};

/// @brief Round @p value up to a multiple of @p align (a power of two).
uint64_t alignTo(uint64_t value, uint64_t align);

} // namespace ember::interp
