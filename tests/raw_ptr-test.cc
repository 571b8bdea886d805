#include <pointer-core/opaque_ptr.hh>
#include <pointer-core/raw_ptr.hh>

#include <nexus/test.hh>

#include <test-utils.hh>

#include <string>

TEST("raw_ptr - construction and nullable factories")
{
    int x = 5;

    SECTION("non-null construction")
    {
        auto p = pc::raw_ptr(&x);
        CHECK(p.get() == &x);
        CHECK(p.bit_pattern() == reinterpret_cast<pc::uptr>(&x));

        auto m = pc::mut_raw_ptr(&x);
        CHECK(m.get() == &x);

        pc::raw_ptr converted = m;
        CHECK(converted == p);
    }

    SECTION("from")
    {
        CHECK(!pc::raw_ptr::from(static_cast<void const*>(nullptr)).has_value());
        CHECK(!pc::mut_raw_ptr::from(static_cast<void*>(nullptr)).has_value());

        auto p = pc::raw_ptr::from(static_cast<void const*>(&x));
        REQUIRE(p.has_value());
        CHECK(p.value().get() == &x);
    }

    SECTION("bit patterns")
    {
        CHECK(pc::raw_ptr::from_bit_pattern(0) == pc::nullopt);
        CHECK(pc::mut_raw_ptr::from_bit_pattern(0) == pc::nullopt);

        auto const p = pc::raw_ptr(&x);
        auto const back = pc::raw_ptr::from_bit_pattern(p.bit_pattern());
        CHECK(back == p);
    }

    SECTION("opaque round trip")
    {
        auto const p = pc::mut_raw_ptr(&x);
        auto const o = p.to_opaque();
        CHECK(o.get() == &x);
        CHECK(pc::mut_raw_ptr(o) == p);
        CHECK(pc::raw_ptr(o) == pc::raw_ptr(p));

        auto const from_optional = pc::raw_ptr::from(pc::opaque_ptr::from(&x));
        REQUIRE(from_optional.has_value());
        CHECK(from_optional.value().get() == &x);

        CHECK(!pc::raw_ptr::from(pc::opaque_ptr::from(nullptr)).has_value());
    }

    SECTION("explicit const removal")
    {
        auto const p = pc::raw_ptr(&x);
        auto const m = pc::mut_raw_ptr(pc::mutating, p);
        m.store_bytes(42);
        CHECK(x == 42);
    }

#if PC_ASSERT_ENABLED
    SECTION("null is a precondition violation")
    {
        PC_CHECK_ASSERTS(pc::raw_ptr(static_cast<void const*>(nullptr)));
        PC_CHECK_ASSERTS(pc::mut_raw_ptr(static_cast<void*>(nullptr)));
    }
#endif
}

TEST("opaque_ptr - C interop round trip")
{
    std::string s = "payload";

    void* user_data = &s;
    auto const o = pc::opaque_ptr::from(user_data);
    REQUIRE(o.has_value());
    CHECK(o.value().get() == &s);
    CHECK(o.value().bit_pattern() == reinterpret_cast<pc::uptr>(&s));
    CHECK(o.value() == pc::opaque_ptr(&s));

    auto const typed = pc::typed_ptr<std::string>(o.value());
    CHECK(typed.get() == &s);
    CHECK(typed->size() == 7);

    CHECK(!pc::opaque_ptr::from(nullptr).has_value());

#if PC_ASSERT_ENABLED
    PC_CHECK_ASSERTS(pc::opaque_ptr(nullptr));
#endif
}

TEST("raw_ptr - byte arithmetic")
{
    alignas(16) pc::u8 bytes[32] = {};
    auto const p = pc::raw_ptr(bytes);

    auto const q = p + 8;
    CHECK(q.get() == bytes + 8);
    CHECK(q - p == 8);
    CHECK(p.distance_to(q) == 8);
    CHECK(q.distance_to(p) == -8);
    CHECK(q - 8 == p);
    CHECK(8 + p == q);
    CHECK(p.advanced(3).get() == bytes + 3);

    auto r = p;
    r += 5;
    CHECK(r.get() == bytes + 5);
    r -= 5;
    CHECK(r == p);

    CHECK(p < q);
    CHECK(q > p);
    CHECK(p <= p);
    CHECK(p != q);

    auto m = pc::mut_raw_ptr(bytes);
    m += 4;
    CHECK(m - pc::mut_raw_ptr(bytes) == 4);
    CHECK(pc::mut_raw_ptr(bytes).distance_to(m) == 4);
}

TEST("raw_ptr - alignment")
{
    alignas(16) pc::u8 bytes[32] = {};
    auto const p = pc::raw_ptr(bytes);

    CHECK(p.is_aligned(16));
    CHECK(!(p + 4).is_aligned(8));
    CHECK((p + 4).is_aligned(4));

    CHECK((p + 1).aligned_up(8) == p + 8);
    CHECK((p + 8).aligned_up(8) == p + 8);
    CHECK((p + 9).aligned_down(8) == p + 8);
    CHECK((p + 1).aligned_up<pc::u32>() == p + 4);
    CHECK((p + 7).aligned_down<pc::u32>() == p + 4);

    auto const m = pc::mut_raw_ptr(bytes);
    CHECK((m + 3).aligned_up(4) == m + 4);
    CHECK((m + 3).aligned_down<pc::u16>() == m + 2);
}

TEST("raw_ptr - load and store bytes")
{
    auto const p = pc::mut_raw_ptr::allocate(16, 8);

    SECTION("aligned round trip")
    {
        p.store_bytes<pc::u32>(0xDEADBEEF);
        CHECK(p.load<pc::u32>() == 0xDEADBEEF);

        pc::raw_ptr const view = p;
        CHECK(view.load<pc::u32>() == 0xDEADBEEF);

        p.store_bytes<pc::f64>(2.5, 8);
        CHECK(p.load<pc::f64>(8) == 2.5);
    }

    SECTION("unaligned round trip")
    {
        p.store_bytes<pc::u16>(0x1234, 5);
        CHECK(p.load_unaligned<pc::u16>(5) == 0x1234);

        p.store_bytes<pc::u32>(77, 1);
        CHECK(p.load_unaligned<pc::u32>(1) == 77);
    }

    SECTION("trivially copyable aggregates")
    {
        struct pair
        {
            pc::i32 a;
            pc::i32 b;
        };

        p.store_bytes(pair{3, -4}, 4);
        auto const v = p.load<pair>(4);
        CHECK(v.a == 3);
        CHECK(v.b == -4);
    }

#if PC_ASSERT_ENABLED
    SECTION("misaligned load")
    {
        p.store_bytes<pc::u64>(0);
        PC_CHECK_ASSERTS(p.load<pc::u32>(1));
    }
#endif

    p.deallocate();
}

namespace
{
// 8 bytes holding 0..7
pc::mut_raw_ptr allocate_counting_bytes()
{
    auto const p = pc::mut_raw_ptr::allocate(8, 1);
    for (auto i = 0; i < 8; ++i)
        p.store_bytes<pc::u8>(pc::u8(i), i);
    return p;
}
} // namespace

TEST("raw_ptr - copy_memory")
{
    SECTION("disjoint")
    {
        auto const p = allocate_counting_bytes();
        auto const q = pc::mut_raw_ptr::allocate(8, 1);
        q.copy_memory(p, 8);
        for (auto i = 0; i < 8; ++i)
            CHECK(q.load<pc::u8>(i) == i);
        q.deallocate();
        p.deallocate();
    }

    SECTION("overlapping forward behaves like a temporary copy")
    {
        auto const p = allocate_counting_bytes();
        (p + 2).copy_memory(p, 4);

        pc::u8 const expected[] = {0, 1, 0, 1, 2, 3, 6, 7};
        for (auto i = 0; i < 8; ++i)
            CHECK(p.load<pc::u8>(i) == expected[i]);
        p.deallocate();
    }

    SECTION("overlapping backward behaves like a temporary copy")
    {
        auto const p = allocate_counting_bytes();
        p.copy_memory(p + 2, 4);

        pc::u8 const expected[] = {2, 3, 4, 5, 4, 5, 6, 7};
        for (auto i = 0; i < 8; ++i)
            CHECK(p.load<pc::u8>(i) == expected[i]);
        p.deallocate();
    }

    SECTION("zero bytes")
    {
        auto const p = allocate_counting_bytes();
        p.copy_memory(p + 4, 0);
        CHECK(p.load<pc::u8>(0) == 0);
        p.deallocate();
    }
}

TEST("raw_ptr - binding and initialization")
{
    SECTION("bind then initialize")
    {
        auto const p = pc::mut_raw_ptr::allocate(4 * sizeof(int), alignof(int));
        auto const ints = p.bind_memory<int>(4);
        CHECK(ints.get() == p.get());

        ints.initialize(9, 4);
        CHECK(ints[0] == 9);
        CHECK(ints[3] == 9);

        pc::raw_ptr const view = p;
        auto const read_only = view.assuming_memory_bound<int>();
        CHECK(read_only[2] == 9);

        (void)ints.deinitialize(4);
        p.deallocate();
    }

    SECTION("initialize_memory from a value")
    {
        auto const p = pc::mut_raw_ptr::allocate(4 * sizeof(int), alignof(int));
        auto const ints = p.initialize_memory<int>(7, 4);
        CHECK(ints[0] == 7);
        CHECK(ints[3] == 7);
        CHECK(p.load<int>(12) == 7);

        auto const single = p.initialize_memory<int>(11);
        CHECK(single.load() == 11);

        ints.deinitialize(4).deallocate();
    }

    SECTION("initialize_memory from a source range, then move")
    {
        std::string const source[] = {"alpha", "beta"};

        auto const p = pc::mut_raw_ptr::allocate(2 * sizeof(std::string), alignof(std::string));
        auto const strings = p.initialize_memory<std::string>(source, 2);
        CHECK(strings[0] == "alpha");
        CHECK(strings[1] == "beta");
        CHECK(source[0] == "alpha");

        auto const q = pc::mut_raw_ptr::allocate(2 * sizeof(std::string), alignof(std::string));
        auto const moved = q.move_initialize_memory<std::string>(strings, 2);
        CHECK(moved[0] == "alpha");
        CHECK(moved[1] == "beta");

        // the source cells are uninitialized now, so the block can be released without teardown
        p.deallocate();
        moved.deinitialize(2).deallocate();
    }

    SECTION("zero-sized allocations still have a unique address")
    {
        auto const a = pc::mut_raw_ptr::allocate(0, 1);
        auto const b = pc::mut_raw_ptr::allocate(0, 1);
        CHECK(a != b);
        a.deallocate();
        b.deallocate();
    }

    SECTION("allocation honors the requested alignment")
    {
        auto const p = pc::mut_raw_ptr::allocate(24, 64);
        CHECK(p.is_aligned(64));
        p.deallocate();
    }
}

TEST("raw_ptr - scoped rebinding")
{
    auto const p = pc::mut_raw_ptr::allocate(2 * sizeof(pc::u32), alignof(pc::u32));
    auto const words = p.initialize_memory<pc::u32>(0x3F800000, 2); // bits of 1.0f

    SECTION("body sees the rebound type and its result is returned")
    {
        auto const value = p.with_memory_rebound<pc::f32>(2, [](pc::typed_ptr<pc::f32> floats) {
            auto const first = floats.load();
            floats.successor().store(2.0f);
            return first;
        });
        CHECK(value == 1.0f);

        // writes through the rebound view are observed through the original binding
        CHECK(words[1] == 0x40000000u);
    }

    SECTION("read-only rebinding")
    {
        pc::raw_ptr const view = p;
        auto const bits = view.with_memory_rebound<pc::i32>(1, [](pc::typed_ptr<pc::i32 const> ints) { return ints.load(); });
        CHECK(bits == 0x3F800000);
    }

    (void)words.deinitialize(2);
    p.deallocate();
}
