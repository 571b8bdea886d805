#include <pointer-core/allocation.hh>
#include <pointer-core/arena_resource.hh>
#include <pointer-core/memory_resource.hh>
#include <pointer-core/memory_state.hh>
#include <pointer-core/raw_ptr.hh>
#include <pointer-core/typed_ptr.hh>

#include <nexus/test.hh>

#include <test-utils.hh>

#include <string>

TEST("arena_resource - bump allocation")
{
    pc::arena_resource arena(256);
    CHECK(arena.capacity_bytes() == 256);
    CHECK(arena.used_bytes() == 0);
    CHECK(arena.remaining_bytes() == 256);

    auto* const a = arena.allocate(3, 1);
    auto* const b = arena.allocate(8, 8);
    CHECK(a != nullptr);
    CHECK(pc::is_aligned(b, 8));
    CHECK(b > a);
    CHECK(arena.used_bytes() == (b - a) + 8);
    CHECK(arena.remaining_bytes() == 256 - arena.used_bytes());

    CHECK(arena.owns(a));
    CHECK(arena.owns(b + 7));
    int local = 0;
    CHECK(!arena.owns(&local));
}

TEST("arena_resource - exhaustion")
{
    SECTION("try_allocate returns null")
    {
        pc::arena_resource arena(64);
        CHECK(arena.try_allocate(64, 1) != nullptr);
        CHECK(arena.remaining_bytes() == 0);
        CHECK(arena.try_allocate(1, 1) == nullptr);
        CHECK(arena.used_bytes() == 64);
    }

    SECTION("zero bytes consume nothing")
    {
        pc::arena_resource arena(64);
        CHECK(arena.try_allocate(0, 8) == nullptr);
        CHECK(arena.used_bytes() == 0);
    }

    SECTION("through the memory resource")
    {
        pc::arena_resource arena(64);
        CHECK(pc::try_allocate_bytes(128, 8, &arena.resource()) == nullptr);
        CHECK(arena.used_bytes() == 0);

        PC_CHECK_ASSERTS(arena.allocate(65, 1));
        PC_CHECK_ASSERTS(pc::allocate_bytes(128, 8, &arena.resource()));
    }
}

TEST("arena_resource - reset reuses the block")
{
    pc::arena_resource arena(128);

    auto* const first = arena.allocate(16, 8);
    (void)arena.allocate(32, 8);
    arena.reset();
    CHECK(arena.used_bytes() == 0);

    auto* const again = arena.allocate(16, 8);
    CHECK(again == first);
    CHECK(arena.used_bytes() == 16);
}

TEST("arena_resource - caller-provided storage")
{
    SECTION("aligned storage")
    {
        alignas(16) pc::byte storage[128];
        pc::arena_resource arena(storage, 128);

        auto* const p = arena.allocate(8, 8);
        CHECK(p == storage);
        CHECK(arena.owns(storage + 127));
        CHECK(!arena.owns(storage + 128));
    }

    SECTION("storage less aligned than the request")
    {
        alignas(16) pc::byte storage[64];
        pc::arena_resource arena(storage + 1, 63);

        auto* const p = arena.allocate(4, 4);
        CHECK(p == storage + 4);
        CHECK(arena.used_bytes() == 7);
    }
}

TEST("arena_resource - handles allocate through the arena")
{
    pc::arena_resource arena(512);

    SECTION("typed_ptr")
    {
        auto const p = pc::typed_ptr<int>::allocate(4, arena);
        CHECK(arena.owns(p.get()));
        CHECK(pc::is_aligned(p.get(), alignof(int)));

        p.initialize(1, 4);
        CHECK(p[3] == 1);

        (void)p.deinitialize(4);
        p.deallocate(4, arena);
    }

    SECTION("mut_raw_ptr")
    {
        auto const m = pc::mut_raw_ptr::allocate(24, 8, arena);
        CHECK(arena.owns(m.get()));
        m.store_bytes<pc::u64>(7, 16);
        CHECK(m.load<pc::u64>(16) == 7);
        m.deallocate(24, 8, arena);
    }

    SECTION("allocation")
    {
        {
            auto a = pc::allocation<std::string>::create_empty(4, &arena.resource());
            a.emplace_back("in");
            a.emplace_back("arena");
            CHECK(arena.owns(a.obj_start));
            CHECK(&a.resource() == &arena.resource());
            CHECK(a.obj_buffer()[1] == "arena");
        }
        CHECK(arena.used_bytes() >= 4 * pc::isize(sizeof(std::string)));
    }
}

#if PC_SHADOW_STATE_ENABLED

TEST("arena_resource - shadow tracking of sub-allocations")
{
    pc::arena_resource arena(256);
    auto const before = pc::memory_state::tracked_allocation_count();

    SECTION("released blocks are poisoned")
    {
        auto const m = pc::mut_raw_ptr::allocate(8, 8, arena);
        CHECK(*static_cast<pc::u8 const*>(m.get()) == pc::memory_state::allocated_poison);

        m.store_bytes<pc::u64>(0);
        m.deallocate(8, 8, arena);

        // still inside the arena block, so readable through the plain pointer
        auto const* bytes = static_cast<pc::u8 const*>(m.get());
        for (auto i = 0; i < 8; ++i)
            CHECK(bytes[i] == pc::memory_state::deallocated_poison);
    }

    SECTION("reset drops every sub-allocation")
    {
        (void)pc::mut_raw_ptr::allocate(8, 8, arena);
        auto const strings = pc::typed_ptr<std::string>::allocate(2, arena);
        CHECK(pc::memory_state::tracked_allocation_count() == before + 2);
        CHECK(pc::memory_state::query(strings, 1).state == pc::memory_state::cell_state::bound_uninitialized);

        arena.reset();
        CHECK(pc::memory_state::tracked_allocation_count() == before);
        CHECK(pc::memory_state::query(strings, 1).state == pc::memory_state::cell_state::untracked);

        // the same addresses are handed out again without a double-free report
        auto const again = pc::mut_raw_ptr::allocate(8, 8, arena);
        again.deallocate(8, 8, arena);
    }

    SECTION("destruction forgets the block")
    {
        {
            pc::arena_resource scoped(64);
            (void)pc::mut_raw_ptr::allocate(16, 8, scoped);
            CHECK(pc::memory_state::tracked_allocation_count() == before + 1);
        }
        CHECK(pc::memory_state::tracked_allocation_count() == before);
    }
}

TEST("arena_resource - storage from a tracked allocation")
{
    auto const before = pc::memory_state::tracked_allocation_count();
    auto const block = pc::mut_raw_ptr::allocate(256, 16);
    CHECK(pc::memory_state::tracked_allocation_count() == before + 1);

    SECTION("sub-allocations, reset and release of the block")
    {
        {
            pc::arena_resource arena(static_cast<pc::byte*>(block.get()), 256);

            auto const ints = pc::typed_ptr<int>::allocate(4, arena);
            CHECK(ints.get() == block.get());
            CHECK(pc::memory_state::tracked_allocation_count() == before + 2);
            CHECK(pc::memory_state::query(ints, 16).state == pc::memory_state::cell_state::bound_uninitialized);

            ints.initialize(3, 4);
            CHECK(ints[3] == 3);

            arena.reset();
            CHECK(pc::memory_state::tracked_allocation_count() == before + 1);

            // the arena hands out the same bytes again after reset
            auto const again = pc::typed_ptr<pc::u64>::allocate(2, arena);
            CHECK(again.get() == block.get());
        }

        // the block is tracked again and its bytes are fresh storage
        CHECK(pc::memory_state::tracked_allocation_count() == before + 1);
        CHECK(pc::memory_state::query(block, 256).state == pc::memory_state::cell_state::untyped);

        block.deallocate();
        CHECK(pc::memory_state::tracked_allocation_count() == before);

        auto const message = pc_test::assertion_message_of([&] { block.deallocate(); });
        REQUIRE(message.has_value());
        CHECK(message->find("double free") != std::string::npos);
    }

    SECTION("the block cannot be released while the arena uses it")
    {
        {
            pc::arena_resource arena(static_cast<pc::byte*>(block.get()) + 64, 128);
            (void)pc::typed_ptr<pc::u32>::allocate(8, arena);

            auto const message = pc_test::assertion_message_of([&] { block.deallocate(); });
            REQUIRE(message.has_value());
            CHECK(message->find("lent to an arena") != std::string::npos);
        }
        block.deallocate();
        CHECK(pc::memory_state::tracked_allocation_count() == before);
    }

    SECTION("storage holding a live object is rejected")
    {
        auto const s = block.initialize_memory<std::string>(std::string("live"));
        auto const message = pc_test::assertion_message_of(
            [&] { pc::arena_resource arena(static_cast<pc::byte*>(block.get()), 256); });
        REQUIRE(message.has_value());
        CHECK(message->find("live object") != std::string::npos);

        (void)s.deinitialize(1);
        block.deallocate();
    }
}

#endif
