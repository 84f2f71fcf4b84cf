//===----------------------------------------------------------------------===//
//
// Part of the Ember project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/interp/MemoryTests.cpp
// Purpose: Verify allocation bookkeeping, scalar access, definedness tracking,
//          pointer relocations and bulk copies of the abstract memory.
// Key invariants: Undefined bytes read back as an undefined scalar; pointers
//                 survive only whole-word reads and copies.
// Ownership/Lifetime: Memory instances are local to each test.
//
//===----------------------------------------------------------------------===//

#include "interp/Memory.hpp"
#include "interp/Value.hpp"

#include <gtest/gtest.h>

using namespace ember::interp;

TEST(MemoryTest, FreshAllocationIsUndefined)
{
    Memory mem(8);
    const Pointer p = mem.allocate(4, 4, MemoryKind::Stack);
    auto s = mem.readScalar(p, 4);
    ASSERT_TRUE(s.hasValue());
    EXPECT_TRUE(s.value().isUndef());
    EXPECT_EQ(mem.allocationCount(), 1u);
}

TEST(MemoryTest, LittleEndianRoundTrip)
{
    Memory mem(8);
    const Pointer p = mem.allocate(8, 8, MemoryKind::Stack);
    ASSERT_TRUE(mem.writeScalar(p, Scalar::fromUint(0x11223344, 4), 4).hasValue());
    auto alloc = mem.get(p.alloc);
    ASSERT_TRUE(alloc.hasValue());
    EXPECT_EQ(alloc.value()->bytes[0], 0x44);
    EXPECT_EQ(alloc.value()->bytes[3], 0x11);
    EXPECT_FALSE(alloc.value()->defined[4]);

    auto half = mem.readScalar(Pointer{p.alloc, 2}, 2);
    ASSERT_TRUE(half.hasValue());
    EXPECT_EQ(half.value(), Scalar::fromUint(0x1122, 2));

    auto straddle = mem.readScalar(Pointer{p.alloc, 2}, 4);
    ASSERT_TRUE(straddle.hasValue());
    EXPECT_TRUE(straddle.value().isUndef());
}

TEST(MemoryTest, SizeMismatchOnWriteIsRejected)
{
    Memory mem(8);
    const Pointer p = mem.allocate(8, 8, MemoryKind::Stack);
    auto r = mem.writeScalar(p, Scalar::fromUint(1, 2), 4);
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, EvalErrorKind::InternalInconsistency);
}

TEST(MemoryTest, AccessOutsideAllocationFails)
{
    Memory mem(8);
    const Pointer p = mem.allocate(4, 4, MemoryKind::Stack);
    auto r = mem.readScalar(Pointer{p.alloc, 2}, 4);
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, EvalErrorKind::OutOfBounds);

    auto moved = mem.pointerOffset(p, 5);
    ASSERT_FALSE(moved.hasValue());
    EXPECT_EQ(moved.error().kind, EvalErrorKind::OutOfBounds);

    auto end = mem.pointerOffset(p, 4);
    ASSERT_TRUE(end.hasValue());
    EXPECT_EQ(end.value().offset, 4u);
}

TEST(MemoryTest, DeallocationRules)
{
    Memory mem(8);
    const Pointer p = mem.allocate(4, 4, MemoryKind::Stack);

    auto wrongKind = mem.deallocate(p, MemoryKind::Heap);
    ASSERT_FALSE(wrongKind.hasValue());
    EXPECT_EQ(wrongKind.error().kind, EvalErrorKind::InternalInconsistency);

    auto interior = mem.deallocate(Pointer{p.alloc, 1}, MemoryKind::Stack);
    ASSERT_FALSE(interior.hasValue());
    EXPECT_EQ(interior.error().kind, EvalErrorKind::InternalInconsistency);

    ASSERT_TRUE(mem.deallocate(p, MemoryKind::Stack).hasValue());
    EXPECT_EQ(mem.allocationCount(), 0u);

    auto twice = mem.deallocate(p, MemoryKind::Stack);
    ASSERT_FALSE(twice.hasValue());
    EXPECT_EQ(twice.error().kind, EvalErrorKind::DanglingPointer);

    auto read = mem.readScalar(p, 1);
    ASSERT_FALSE(read.hasValue());
    EXPECT_EQ(read.error().kind, EvalErrorKind::DanglingPointer);
}

TEST(MemoryTest, PointersAreKeptAsRelocations)
{
    Memory mem(8);
    const Pointer target = mem.allocate(16, 8, MemoryKind::Heap);
    const Pointer slot = mem.allocate(16, 8, MemoryKind::Stack);
    const Pointer inner{target.alloc, 4};
    ASSERT_TRUE(mem.writeScalar(slot, Scalar::fromPointer(inner, 8), 8).hasValue());

    auto whole = mem.readScalar(slot, 8);
    ASSERT_TRUE(whole.hasValue());
    ASSERT_TRUE(whole.value().isPtr());
    EXPECT_EQ(whole.value().ptr, inner);

    auto part = mem.readScalar(Pointer{slot.alloc, 4}, 4);
    ASSERT_FALSE(part.hasValue());
    EXPECT_EQ(part.error().kind, EvalErrorKind::UnsupportedFeature);

    // Overwriting half of the pointer leaves the other half undefined.
    ASSERT_TRUE(mem.writeScalar(Pointer{slot.alloc, 4}, Scalar::fromUint(7, 4), 4).hasValue());
    auto low = mem.readScalar(slot, 4);
    ASSERT_TRUE(low.hasValue());
    EXPECT_TRUE(low.value().isUndef());
    auto high = mem.readScalar(Pointer{slot.alloc, 4}, 4);
    ASSERT_TRUE(high.hasValue());
    EXPECT_EQ(high.value(), Scalar::fromUint(7, 4));
}

TEST(MemoryTest, CopyCarriesBytesDefinednessAndPointers)
{
    Memory mem(8);
    const Pointer target = mem.allocate(1, 1, MemoryKind::Heap);
    const Pointer src = mem.allocate(16, 8, MemoryKind::Stack);
    const Pointer dst = mem.allocate(16, 8, MemoryKind::Stack);
    ASSERT_TRUE(mem.writeScalar(src, Scalar::fromPointer(target, 8), 8).hasValue());
    ASSERT_TRUE(mem.writeScalar(Pointer{src.alloc, 8}, Scalar::fromUint(5, 2), 2).hasValue());

    ASSERT_TRUE(mem.copy(src, dst, 16, true).hasValue());
    auto ptr = mem.readScalar(dst, 8);
    ASSERT_TRUE(ptr.hasValue());
    EXPECT_EQ(ptr.value(), Scalar::fromPointer(target, 8));
    EXPECT_EQ(mem.readScalar(Pointer{dst.alloc, 8}, 2).value(), Scalar::fromUint(5, 2));
    EXPECT_TRUE(mem.readScalar(Pointer{dst.alloc, 10}, 1).value().isUndef());
    EXPECT_TRUE(*mem.get(src.alloc).value() == *mem.get(dst.alloc).value());
}

TEST(MemoryTest, OverlappingCopyBehavesLikeMemmove)
{
    Memory mem(8);
    const Pointer p = mem.allocate(6, 1, MemoryKind::Stack);
    for (uint64_t i = 0; i < 4; ++i)
        ASSERT_TRUE(mem.writeScalar(Pointer{p.alloc, i}, Scalar::fromUint(i + 1, 1), 1).hasValue());

    auto strict = mem.copy(p, Pointer{p.alloc, 2}, 4, true);
    ASSERT_FALSE(strict.hasValue());
    EXPECT_EQ(strict.error().kind, EvalErrorKind::InternalInconsistency);

    ASSERT_TRUE(mem.copy(p, Pointer{p.alloc, 2}, 4, false).hasValue());
    const uint64_t expected[] = {1, 2, 1, 2, 3, 4};
    for (uint64_t i = 0; i < 6; ++i)
        EXPECT_EQ(mem.readScalar(Pointer{p.alloc, i}, 1).value(), Scalar::fromUint(expected[i], 1))
            << "byte " << i;
}

TEST(MemoryTest, CopyRepeatedlyTilesTheSource)
{
    Memory mem(8);
    const Pointer p = mem.allocate(8, 2, MemoryKind::Stack);
    ASSERT_TRUE(mem.writeScalar(p, Scalar::fromUint(0xBEEF, 2), 2).hasValue());
    ASSERT_TRUE(mem.copyRepeatedly(p, Pointer{p.alloc, 2}, 2, 3, true).hasValue());
    for (uint64_t i = 0; i < 8; i += 2)
        EXPECT_EQ(mem.readScalar(Pointer{p.alloc, i}, 2).value(), Scalar::fromUint(0xBEEF, 2));
}

TEST(MemoryTest, EqualityComparesContents)
{
    Memory a(8);
    Memory b(8);
    const Pointer pa = a.allocate(2, 1, MemoryKind::Stack);
    const Pointer pb = b.allocate(2, 1, MemoryKind::Stack);
    EXPECT_TRUE(a == b);
    ASSERT_TRUE(a.writeScalar(pa, Scalar::fromUint(1, 1), 1).hasValue());
    EXPECT_FALSE(a == b);
    ASSERT_TRUE(b.writeScalar(pb, Scalar::fromUint(1, 1), 1).hasValue());
    EXPECT_TRUE(a == b);
}

TEST(ScalarTest, FactoriesTruncateAndCheck)
{
    EXPECT_EQ(Scalar::fromUint(0x1FF, 1).bits, 0xFFu);
    EXPECT_EQ(Scalar::fromInt(-1, 2).bits, 0xFFFFu);
    EXPECT_EQ(signExtend(0x80, 1), -128);
    EXPECT_EQ(truncate(0x12345, 2), 0x2345u);

    auto undefBits = Scalar::undef().toBits(1);
    ASSERT_FALSE(undefBits.hasValue());
    EXPECT_EQ(undefBits.error().kind, EvalErrorKind::InvalidValue);

    auto wrongSize = Scalar::fromUint(1, 4).toBits(8);
    ASSERT_FALSE(wrongSize.hasValue());
    EXPECT_EQ(wrongSize.error().kind, EvalErrorKind::InternalInconsistency);

    auto notBool = Scalar::fromUint(2, 1).toBool();
    ASSERT_FALSE(notBool.hasValue());
    EXPECT_EQ(notBool.error().kind, EvalErrorKind::InvalidValue);

    auto ptrBits = Scalar::fromPointer(Pointer{1, 0}, 8).toBits(8);
    ASSERT_FALSE(ptrBits.hasValue());
    EXPECT_EQ(ptrBits.error().kind, EvalErrorKind::UnsupportedFeature);
}
