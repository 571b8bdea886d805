#include <pointer-core/buffer_slice.hh>
#include <pointer-core/raw_buffer.hh>
#include <pointer-core/typed_buffer.hh>

#include <nexus/test.hh>

#include <test-utils.hh>

#include <string>
#include <type_traits>
#include <vector>

using pc_test::tracked;

static_assert(std::is_trivially_copyable_v<pc::typed_buffer<int>>);
static_assert(std::is_convertible_v<pc::typed_buffer<int>, pc::typed_buffer<int const>>);
static_assert(!std::is_convertible_v<pc::typed_buffer<int const>, pc::typed_buffer<int>>);

namespace
{
pc::typed_buffer<std::string> allocate_strings(std::vector<std::string> const& values, pc::isize capacity)
{
    auto const buf = pc::typed_buffer<std::string>::allocate(capacity);
    for (auto i = 0; i < pc::isize(values.size()); ++i)
        buf.initialize_element(i, values[i]);
    return buf;
}
} // namespace

TEST("typed_buffer - allocate, initialize, index, release")
{
    auto const buf = pc::typed_buffer<int>::allocate(4);
    CHECK(buf.count() == 4);
    CHECK(!buf.empty());

    buf.initialize(0);
    buf[2] = 7;

    auto sum = 0;
    for (int v : buf)
        sum += v;
    CHECK(sum == 7);

    CHECK(pc::raw_buffer(buf).load<int>(8) == 7);

    auto const bytes = buf.deinitialize();
    CHECK(bytes.count() == 4 * pc::isize(sizeof(int)));
    bytes.deallocate();
}

TEST("typed_buffer - construction and views")
{
    SECTION("default is empty")
    {
        pc::typed_buffer<int> const buf;
        CHECK(buf.empty());
        CHECK(buf.count() == 0);
        CHECK(buf.data() == nullptr);
        CHECK(buf.begin() == buf.end());
        CHECK(buf.base_address() == pc::nullopt);
    }

    SECTION("over existing objects")
    {
        int values[3] = {4, 5, 6};
        auto const buf = pc::typed_buffer<int>(values, 3);
        CHECK(buf.base_address() == pc::typed_ptr<int>(values));
        CHECK(buf[1] == 5);

        auto const from_ptr = pc::typed_buffer<int>(pc::typed_ptr<int>(values), 2);
        CHECK(from_ptr.count() == 2);

        pc::typed_buffer<int const> const read_only = buf;
        CHECK(read_only[2] == 6);

        auto const writable = pc::typed_buffer<int>(pc::mutating, read_only);
        writable[0] = 40;
        CHECK(values[0] == 40);
    }

#if PC_ASSERT_ENABLED
    SECTION("invalid construction")
    {
        int value = 0;
        PC_CHECK_ASSERTS(pc::typed_buffer<int>(&value, -1));
        PC_CHECK_ASSERTS(pc::typed_buffer<int>(static_cast<int*>(nullptr), 1));
    }
#endif
}

TEST("typed_buffer - bounds")
{
    auto const buf = pc::typed_buffer<int>::allocate(3);
    buf.initialize(1);

    CHECK(buf[0] == 1);
    CHECK(buf[2] == 1);

#if PC_ASSERT_ENABLED
    PC_CHECK_ASSERTS(buf[3]);
    PC_CHECK_ASSERTS(buf[-1]);
    PC_CHECK_ASSERTS(buf.initialize_element(3, 0));
    PC_CHECK_ASSERTS(buf.deinitialize_element(-1));
#endif

    buf.deinitialize().deallocate();
}

TEST("typed_buffer - whole-buffer initialization")
{
    SECTION("from an iterator range that is longer than the buffer")
    {
        auto const buf = pc::typed_buffer<std::string>::allocate(2);
        std::vector<std::string> const source = {"a", "b", "c"};

        auto const result = buf.initialize(source.begin(), source.end());
        CHECK(result.index == 2);
        CHECK(*result.remainder == "c");
        CHECK(buf[1] == "b");

        buf.deinitialize().deallocate();
    }

    SECTION("from an iterator range that is shorter than the buffer")
    {
        auto const buf = pc::typed_buffer<std::string>::allocate(3);
        std::vector<std::string> const source = {"a"};

        auto const result = buf.initialize(source.begin(), source.end());
        CHECK(result.index == 1);
        CHECK(result.remainder == source.end());

        // only the written prefix is alive
        auto const written = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(0, result.index));
        written.deinitialize().deallocate();
    }

    SECTION("copy from another buffer")
    {
        auto const src = allocate_strings({"x", "y"}, 2);
        auto const dest = pc::typed_buffer<std::string>::allocate(3);

        auto const end = dest.initialize(src);
        CHECK(end == 2);
        CHECK(dest[0] == "x");
        CHECK(dest[1] == "y");
        CHECK(src[0] == "x");

        pc::typed_buffer<std::string>(pc::rebasing, dest.slice(0, end)).deinitialize();
        dest.deallocate();
        src.deinitialize().deallocate();
    }

    SECTION("empty source")
    {
        auto const dest = pc::typed_buffer<std::string>::allocate(1);
        CHECK(dest.initialize(pc::typed_buffer<std::string const>()) == 0);
        dest.deallocate();
    }

#if PC_ASSERT_ENABLED
    SECTION("source must fit")
    {
        auto const src = allocate_strings({"x", "y"}, 2);
        auto const dest = pc::typed_buffer<std::string>::allocate(1);
        PC_CHECK_ASSERTS(dest.initialize(src));
        dest.deallocate();
        src.deinitialize().deallocate();
    }
#endif
}

TEST("typed_buffer - move_initialize through rebased slices")
{
    SECTION("shift right by one")
    {
        auto const buf = allocate_strings({"a", "b", "c"}, 4);

        auto const dest = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(1, 4));
        auto const src = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(0, 3));
        CHECK(dest.move_initialize(src) == 3);

        CHECK(buf[1] == "a");
        CHECK(buf[2] == "b");
        CHECK(buf[3] == "c");

        dest.deinitialize();
        buf.deallocate();
    }

    SECTION("shift left by one")
    {
        auto const buf = pc::typed_buffer<std::string>::allocate(4);
        buf.initialize_element(1, "a");
        buf.initialize_element(2, "b");
        buf.initialize_element(3, "c");

        auto const dest = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(0, 3));
        auto const src = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(1, 4));
        dest.move_initialize(src);

        CHECK(buf[0] == "a");
        CHECK(buf[2] == "c");

        dest.deinitialize();
        buf.deallocate();
    }

    SECTION("into a separate buffer")
    {
        tracked::reset();
        {
            auto const src = pc::typed_buffer<tracked>::allocate(2);
            src.initialize(tracked(8));
            auto const dest = pc::typed_buffer<tracked>::allocate(2);

            dest.move_initialize(src);
            CHECK(dest[0].value == 8);
            CHECK(tracked::alive() == 2);

            src.deallocate();
            dest.deinitialize().deallocate();
        }
        CHECK(tracked::alive() == 0);
    }
}

TEST("typed_buffer - assignment")
{
    SECTION("fill")
    {
        auto const buf = allocate_strings({"a", "b", "c"}, 3);
        buf.update("z");
        for (auto const& s : buf)
            CHECK(s == "z");
        buf.deinitialize().deallocate();
    }

    SECTION("from another buffer, overlapping")
    {
        auto const buf = allocate_strings({"a", "b", "c", "d"}, 4);

        auto const dest = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(1, 4));
        auto const src = pc::typed_buffer<std::string>(pc::rebasing, buf.slice(0, 3));
        CHECK(dest.update(src) == 3);

        CHECK(buf[0] == "a");
        CHECK(buf[1] == "a");
        CHECK(buf[2] == "b");
        CHECK(buf[3] == "c");

        buf.deinitialize().deallocate();
    }

    SECTION("move from another buffer")
    {
        auto const src = allocate_strings({"p", "q"}, 2);
        auto const dest = allocate_strings({"0", "1", "2"}, 3);

        CHECK(dest.move_update(src) == 2);
        CHECK(dest[0] == "p");
        CHECK(dest[1] == "q");
        CHECK(dest[2] == "2");

        src.deallocate();
        dest.deinitialize().deallocate();
    }
}

TEST("typed_buffer - single elements")
{
    auto const buf = pc::typed_buffer<std::string>::allocate(2);

    buf.initialize_element(0, "zero");
    buf.initialize_element(1, "one");

    auto const taken = buf.move_element(0);
    CHECK(taken == "zero");

    buf.initialize_element(0, "again");
    CHECK(buf[0] == "again");

    buf.deinitialize_element(1);
    buf.deinitialize_element(0);
    buf.deallocate();
}

TEST("typed_buffer - deinitialize destroys every element once, in reverse order")
{
    tracked::reset();

    auto const buf = pc::typed_buffer<tracked>::allocate(4);
    for (auto i = 0; i < 4; ++i)
        buf.initialize_element(i, tracked(i));

    tracked::destroyed.clear();
    auto const bytes = buf.deinitialize();

    REQUIRE(tracked::destroyed.size() == 4);
    CHECK(tracked::destroyed[0] == 3);
    CHECK(tracked::destroyed[3] == 0);
    CHECK(tracked::alive() == 0);
    CHECK(bytes.data() == reinterpret_cast<pc::u8*>(buf.data()));

    bytes.deallocate();
}

TEST("typed_buffer - slices")
{
    auto const buf = pc::typed_buffer<int>::allocate(5);
    for (auto i = 0; i < 5; ++i)
        buf.initialize_element(i, i * 10);

    auto const s = buf.slice(1, 4);
    CHECK(s.count() == 3);
    CHECK(s[1] == 10);
    CHECK(s[3] == 30);
    CHECK(&s[2] == &buf[2]);

    auto sum = 0;
    for (auto v : s)
        sum += v;
    CHECK(sum == 10 + 20 + 30);

    auto const rebased = pc::typed_buffer<int>(pc::rebasing, s);
    CHECK(rebased.count() == 3);
    CHECK(rebased[0] == 10);

    pc::typed_buffer<int const> const read_only = buf;
    CHECK(read_only.slice(2, 5)[4] == 40);

#if PC_ASSERT_ENABLED
    PC_CHECK_ASSERTS(s[0]);
    PC_CHECK_ASSERTS(s[4]);
    PC_CHECK_ASSERTS(rebased[3]);
    PC_CHECK_ASSERTS(buf.slice(3, 6));
#endif

    buf.deinitialize().deallocate();
}

TEST("typed_buffer - scoped rebinding")
{
    auto const buf = pc::typed_buffer<pc::u32>::allocate(4);
    buf.initialize(0x00010002u);

    SECTION("to a smaller element type")
    {
        auto const count = buf.with_memory_rebound<pc::u16>([](pc::typed_buffer<pc::u16> halves) {
            halves[0] = 5;
            return halves.count();
        });
        CHECK(count == 8);
        CHECK((buf[0] & 0xFFFFu) == 5u);
    }

    SECTION("to a larger element type")
    {
        auto const count = buf.with_memory_rebound<pc::u64>([](pc::typed_buffer<pc::u64> wide) { return wide.count(); });
        CHECK(count == 2);
        CHECK(buf[3] == 0x00010002u);
    }

    SECTION("read-only")
    {
        pc::typed_buffer<pc::u32 const> const read_only = buf;
        auto const first = read_only.with_memory_rebound<pc::i32>([](pc::typed_buffer<pc::i32 const> ints) { return ints[3]; });
        CHECK(first == 0x00010002);
    }

#if PC_ASSERT_ENABLED
    SECTION("byte count must divide")
    {
        auto const three = pc::typed_buffer<pc::u32>(buf.data(), 3);
        PC_CHECK_ASSERTS(three.with_memory_rebound<pc::u64>([](pc::typed_buffer<pc::u64>) {}));
    }
#endif

    buf.deinitialize().deallocate();
}
