//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Memory.hpp
// Purpose: Declares the interpreter's byte-addressed memory: allocations with
//          per-byte definedness and pointer relocations.
// Key invariants: A relocation at offset o covers exactly pointerSize() bytes
//                 starting at o; bytes covered by a relocation are defined.
//                 Allocation ids are never reused.
// Ownership/Lifetime: Memory owns all allocations; Pointers are plain handles
//                     that may dangle after deallocate().
//
//===----------------------------------------------------------------------===//

#pragma once

#include "interp/EvalError.hpp"
#include "interp/Value.hpp"

#include <cstdint>
#include <map>
#include <vector>

namespace ember::interp
{

/// @brief Origin of an allocation; deallocation must name the same kind.
enum class MemoryKind
{
    Stack,  ///< Backing store of a local.
    Heap,   ///< Created by a machine hook.
    Static  ///< Result slots owned by the host.
};

/// @brief One contiguous block of interpreter memory.
struct Allocation
{
    std::vector<uint8_t> bytes;
    std::vector<bool> defined;
    std::map<uint64_t, Pointer> relocations; ///< Offset -> pointer stored there.
    uint64_t align = 1;
    MemoryKind kind = MemoryKind::Stack;

    bool operator==(const Allocation &) const = default;
};

class Memory
{
  public:
    explicit Memory(uint8_t pointerSize);

    /// @brief Create an allocation of @p size undefined bytes.
    Pointer allocate(uint64_t size, uint64_t align, MemoryKind kind);

    /// @brief Release the allocation @p ptr points to.
    /// @return DanglingPointer when already freed; InternalInconsistency when
    ///         @p ptr is not at offset 0 or @p kind does not match.
    EvalResult<void> deallocate(Pointer ptr, MemoryKind kind);

    /// @brief Live allocation @p id or DanglingPointer.
    EvalResult<const Allocation *> get(AllocId id) const;

    /// @brief Read @p size bytes (at most 8) at @p ptr as a scalar.
    /// @details Any undefined byte yields an undefined scalar; a relocation
    ///          exactly covering the range yields a pointer scalar.
    EvalResult<Scalar> readScalar(Pointer ptr, uint64_t size) const;

    /// @brief Store @p value into @p size bytes at @p ptr.
    EvalResult<void> writeScalar(Pointer ptr, Scalar value, uint64_t size);

    /// @brief Copy @p size bytes including definedness and relocations.
    /// @param nonoverlapping When true, overlapping ranges are an error.
    EvalResult<void> copy(Pointer src, Pointer dst, uint64_t size, bool nonoverlapping);

    /// @brief Copy the @p size bytes at @p src into @p count consecutive
    ///        slots starting at @p dst.
    EvalResult<void> copyRepeatedly(
        Pointer src, Pointer dst, uint64_t size, uint64_t count, bool nonoverlapping);

    /// @brief @p ptr advanced by @p bytes; must stay within (or one past) its
    ///        allocation.
    EvalResult<Pointer> pointerOffset(Pointer ptr, uint64_t bytes) const;

    [[nodiscard]] uint8_t pointerSize() const
    {
        return pointerSize_;
    }

    [[nodiscard]] size_t allocationCount() const
    {
        return allocs_.size();
    }

    /// @brief Structural equality over the live allocation map.
    bool operator==(const Memory &other) const
    {
        return allocs_ == other.allocs_;
    }

  private:
    EvalResult<Allocation *> checkAccess(Pointer ptr, uint64_t size);
    EvalResult<const Allocation *> checkAccess(Pointer ptr, uint64_t size) const;
    void clearRelocations(Allocation &alloc, uint64_t offset, uint64_t size);

    uint8_t pointerSize_;
    AllocId nextId_ = 1;
    std::map<AllocId, Allocation> allocs_;
};

} // namespace ember::interp
