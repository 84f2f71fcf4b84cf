//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/interp/Memory.cpp
// Purpose: Implements allocation management, bounds-checked scalar access and
//          relocation-preserving copies.
// Key invariants: Every access is checked for liveness and bounds before any
//                 byte changes; scalars are stored little-endian.
// Ownership/Lifetime: See Memory.hpp.
//
//===----------------------------------------------------------------------===//

#include "interp/Memory.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace ember::interp
{

namespace
{
std::string describe(Pointer ptr)
{
    return "alloc" + std::to_string(ptr.alloc) + "+" + std::to_string(ptr.offset);
}

/// @brief Shared liveness and bounds check for const and mutable lookups.
template <typename Map>
auto lookupChecked(Map &allocs, Pointer ptr, uint64_t size)
    -> EvalResult<decltype(&allocs.begin()->second)>
{
    auto it = allocs.find(ptr.alloc);
    if (it == allocs.end())
        return makeEvalError(EvalErrorKind::DanglingPointer,
                             "pointer " + describe(ptr) + " is dangling");
    const uint64_t len = it->second.bytes.size();
    if (ptr.offset > len || size > len - ptr.offset)
        return makeEvalError(EvalErrorKind::OutOfBounds,
                             "access of " + std::to_string(size) + " bytes at " + describe(ptr) +
                                 " is outside an allocation of " + std::to_string(len) +
                                 " bytes");
    return &it->second;
}
} // namespace

Memory::Memory(uint8_t pointerSize) : pointerSize_(pointerSize) {}

Pointer Memory::allocate(uint64_t size, uint64_t align, MemoryKind kind)
{
    const AllocId id = nextId_++;
    Allocation alloc;
    alloc.bytes.assign(size, 0);
    alloc.defined.assign(size, false);
    alloc.align = align;
    alloc.kind = kind;
    allocs_.emplace(id, std::move(alloc));
    return Pointer{id, 0};
}

EvalResult<void> Memory::deallocate(Pointer ptr, MemoryKind kind)
{
    auto it = allocs_.find(ptr.alloc);
    if (it == allocs_.end())
        return makeEvalError(EvalErrorKind::DanglingPointer,
                             "double free of " + describe(ptr));
    if (ptr.offset != 0)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "deallocating " + describe(ptr) +
                                 ", which does not point to the start of its allocation");
    if (it->second.kind != kind)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "deallocating " + describe(ptr) + " with the wrong memory kind");
    allocs_.erase(it);
    return {};
}

EvalResult<const Allocation *> Memory::get(AllocId id) const
{
    auto it = allocs_.find(id);
    if (it == allocs_.end())
        return makeEvalError(EvalErrorKind::DanglingPointer,
                             "allocation " + std::to_string(id) + " does not exist");
    return &it->second;
}

EvalResult<Allocation *> Memory::checkAccess(Pointer ptr, uint64_t size)
{
    return lookupChecked(allocs_, ptr, size);
}

EvalResult<const Allocation *> Memory::checkAccess(Pointer ptr, uint64_t size) const
{
    return lookupChecked(allocs_, ptr, size);
}

/// @brief Remove relocations overlapping [offset, offset + size).
/// @details A pointer only partially covered by the range loses its
///          relocation and its remaining bytes become undefined.
void Memory::clearRelocations(Allocation &alloc, uint64_t offset, uint64_t size)
{
    const uint64_t end = offset + size;
    const uint64_t first = offset >= pointerSize_ ? offset - pointerSize_ + 1 : 0;
    auto it = alloc.relocations.lower_bound(first);
    while (it != alloc.relocations.end() && it->first < end)
    {
        const uint64_t relStart = it->first;
        const uint64_t relEnd = relStart + pointerSize_;
        for (uint64_t i = relStart; i < offset; ++i)
            alloc.defined[i] = false;
        for (uint64_t i = end; i < relEnd && i < alloc.defined.size(); ++i)
            alloc.defined[i] = false;
        it = alloc.relocations.erase(it);
    }
}

EvalResult<Scalar> Memory::readScalar(Pointer ptr, uint64_t size) const
{
    if (size > 8)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "scalar read of " + std::to_string(size) + " bytes");
    auto checked = checkAccess(ptr, size);
    if (!checked)
        return checked.error();
    if (size == 0)
        return Scalar::fromUint(0, 0);
    const Allocation &alloc = *checked.value();

    const uint64_t end = ptr.offset + size;
    const uint64_t first = ptr.offset >= pointerSize_ ? ptr.offset - pointerSize_ + 1 : 0;
    auto rel = alloc.relocations.lower_bound(first);
    if (rel != alloc.relocations.end() && rel->first < end)
    {
        if (rel->first == ptr.offset && size == pointerSize_)
            return Scalar::fromPointer(rel->second, pointerSize_);
        return makeEvalError(EvalErrorKind::UnsupportedFeature,
                             "attempted to read part of a pointer at " + describe(ptr));
    }

    uint64_t bits = 0;
    for (uint64_t i = 0; i < size; ++i)
    {
        if (!alloc.defined[ptr.offset + i])
            return Scalar::undef();
        bits |= uint64_t{alloc.bytes[ptr.offset + i]} << (8 * i);
    }
    return Scalar::fromUint(bits, static_cast<uint8_t>(size));
}

EvalResult<void> Memory::writeScalar(Pointer ptr, Scalar value, uint64_t size)
{
    if (size > 8)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "scalar write of " + std::to_string(size) + " bytes");
    if (!value.isUndef() && value.size != size)
        return makeEvalError(EvalErrorKind::InternalInconsistency,
                             "writing a " + std::to_string(value.size) + "-byte scalar into " +
                                 std::to_string(size) + " bytes");
    auto checked = checkAccess(ptr, size);
    if (!checked)
        return checked.error();
    if (size == 0)
        return {};
    Allocation &alloc = *checked.value();
    clearRelocations(alloc, ptr.offset, size);

    if (value.isUndef())
    {
        for (uint64_t i = 0; i < size; ++i)
            alloc.defined[ptr.offset + i] = false;
        return {};
    }

    const uint64_t bits = value.isPtr() ? value.ptr.offset : value.bits;
    for (uint64_t i = 0; i < size; ++i)
    {
        alloc.bytes[ptr.offset + i] = static_cast<uint8_t>(bits >> (8 * i));
        alloc.defined[ptr.offset + i] = true;
    }
    if (value.isPtr())
        alloc.relocations[ptr.offset] = value.ptr;
    return {};
}

EvalResult<void> Memory::copy(Pointer src, Pointer dst, uint64_t size, bool nonoverlapping)
{
    if (size == 0)
        return {};
    auto srcChecked = checkAccess(src, size);
    if (!srcChecked)
        return srcChecked.error();
    auto dstChecked = checkAccess(dst, size);
    if (!dstChecked)
        return dstChecked.error();

    if (src.alloc == dst.alloc)
    {
        const bool overlaps = src.offset < dst.offset + size && dst.offset < src.offset + size;
        if (overlaps && nonoverlapping)
            return makeEvalError(EvalErrorKind::InternalInconsistency,
                                 "non-overlapping copy between overlapping ranges " +
                                     describe(src) + " and " + describe(dst));
        if (src.offset == dst.offset)
            return {};
    }

    // Snapshot the source first so overlapping copies behave like memmove.
    const Allocation &from = *srcChecked.value();
    std::vector<uint8_t> bytes(from.bytes.begin() + src.offset,
                               from.bytes.begin() + src.offset + size);
    std::vector<bool> defined(from.defined.begin() + src.offset,
                              from.defined.begin() + src.offset + size);
    std::vector<std::pair<uint64_t, Pointer>> relocs;
    for (auto it = from.relocations.lower_bound(src.offset);
         it != from.relocations.end() && it->first < src.offset + size;
         ++it)
    {
        if (it->first + pointerSize_ <= src.offset + size)
            relocs.emplace_back(it->first - src.offset, it->second);
    }
    // A pointer straddling either edge of the range cannot be copied whole.
    const uint64_t first = src.offset >= pointerSize_ ? src.offset - pointerSize_ + 1 : 0;
    for (auto it = from.relocations.lower_bound(first);
         it != from.relocations.end() && it->first < src.offset + size;
         ++it)
    {
        const uint64_t relStart = it->first;
        const uint64_t relEnd = relStart + pointerSize_;
        if (relStart >= src.offset && relEnd <= src.offset + size)
            continue;
        for (uint64_t i = std::max(relStart, src.offset); i < std::min(relEnd, src.offset + size);
             ++i)
            defined[i - src.offset] = false;
    }

    Allocation &to = *dstChecked.value();
    clearRelocations(to, dst.offset, size);
    for (uint64_t i = 0; i < size; ++i)
    {
        to.bytes[dst.offset + i] = bytes[i];
        to.defined[dst.offset + i] = defined[i];
    }
    for (const auto &[offset, target] : relocs)
        to.relocations[dst.offset + offset] = target;
    return {};
}

EvalResult<void> Memory::copyRepeatedly(
    Pointer src, Pointer dst, uint64_t size, uint64_t count, bool nonoverlapping)
{
    for (uint64_t i = 0; i < count; ++i)
    {
        auto r = copy(src, Pointer{dst.alloc, dst.offset + i * size}, size, nonoverlapping);
        if (!r)
            return r;
    }
    return {};
}

EvalResult<Pointer> Memory::pointerOffset(Pointer ptr, uint64_t bytes) const
{
    auto alloc = get(ptr.alloc);
    if (!alloc)
        return alloc.error();
    const uint64_t len = alloc.value()->bytes.size();
    if (ptr.offset > len || bytes > len - ptr.offset)
        return makeEvalError(EvalErrorKind::OutOfBounds,
                             "offsetting " + describe(ptr) + " by " + std::to_string(bytes) +
                                 " bytes leaves an allocation of " + std::to_string(len) +
                                 " bytes");
    return Pointer{ptr.alloc, ptr.offset + bytes};
}

} // namespace ember::interp
