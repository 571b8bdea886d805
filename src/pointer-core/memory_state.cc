#include "memory_state.hh"

#include <pointer-core/asserts.hh>
#include <pointer-core/mutex.hh>
#include <pointer-core/raw_ptr.hh>
#include <pointer-core/utility.hh>

#include <deque>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace
{
struct cell
{
    pc::type_descriptor const* type = nullptr;
    bool initialized = false;
};

struct rebind_record
{
    pc::uptr start = 0;
    pc::isize bytes = 0;
    bool tracked = false;
    std::vector<pc::type_descriptor const*> saved_types;
};

// sub-object of type `type` at `offset`, registered by typed_ptr::member
// only valid while the cells there are still bound to `root`
struct member_view
{
    pc::isize offset = 0;
    pc::type_descriptor const* type = nullptr;
    pc::type_descriptor const* root = nullptr;
};

struct region
{
    std::vector<cell> cells; // one per byte
    std::vector<member_view> members;
};

// a tracked allocation whose bytes [start, start + bytes) are managed by a sub-allocator (arena_resource)
struct loan
{
    pc::uptr region_start = 0;
    pc::isize bytes = 0;
    region parent;
};

struct registry
{
    // live allocations keyed by start address
    std::map<pc::uptr, region> regions;

    // allocations set aside while a sub-allocator works inside them, keyed by the start of the lent range
    std::map<pc::uptr, loan> loans;

    // recently released start addresses (double-free detection), value is the release sequence number
    // entries are dropped when the address is handed out again or when they fall out of release_order
    std::map<pc::uptr, pc::u64> released;
    std::deque<std::pair<pc::uptr, pc::u64>> release_order;
    pc::u64 release_count = 0;

    // open scoped rebinds, innermost last
    std::vector<rebind_record> rebinds;
};

// function-local so that hooks running during static initialization of other TUs see a constructed registry
pc::mutex<registry>& shadow_registry()
{
    static pc::mutex<registry> r;
    return r;
}

pc::uptr address_of(void const* p)
{
    return reinterpret_cast<pc::uptr>(p);
}

std::string name_of(pc::type_descriptor const* type)
{
    return type ? std::string(type->name) : std::string("<untyped>");
}

std::string describe_at(std::string const& what, pc::uptr address)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string hex;
    do
    {
        hex.insert(hex.begin(), digits[address & 0xF]);
        address >>= 4;
    } while (address != 0);
    return what + " (address 0x" + hex + ")";
}

bool holds_live_nontrivial(cell const& c)
{
    return c.initialized && c.type != nullptr && !c.type->is_trivial;
}

// position of [p, p + bytes) inside a tracked allocation
struct located
{
    pc::uptr region_start = 0;
    region* owner = nullptr;
    pc::isize offset = 0;
    cell* cells = nullptr;

    explicit operator bool() const { return cells != nullptr; }
};

// empty result if p lies outside every tracked allocation
located locate(registry& reg, pc::uptr p, pc::isize bytes)
{
    auto it = reg.regions.upper_bound(p);
    if (it == reg.regions.begin())
        return {};
    --it;

    auto& cells = it->second.cells;
    auto const size = pc::isize(cells.size());
    auto const offset = pc::isize(p - it->first);
    if (offset >= size)
        return {};

    PC_ASSERTS_ALWAYS(offset + bytes <= size,
                      describe_at("access of " + std::to_string(bytes) + " bytes runs past the end of a "
                                      + std::to_string(size) + "-byte allocation",
                                  p));
    return {it->first, &it->second, offset, cells.data() + offset};
}

cell* find_cells(registry& reg, pc::uptr p, pc::isize bytes)
{
    return locate(reg, p, bytes).cells;
}

bool all_bound_to(cell const* cells, pc::isize bytes, pc::type_descriptor const* type)
{
    for (pc::isize i = 0; i < bytes; ++i)
        if (cells[i].type != type)
            return false;
    return true;
}

// typed access: every cell is bound to `type`, or the range is a sub-object obtained through member()
bool is_bound_to(located const& at, pc::isize bytes, pc::type_descriptor const* type)
{
    if (all_bound_to(at.cells, bytes, type))
        return true;

    for (auto const& m : at.owner->members)
        if (m.offset == at.offset && m.type == type && all_bound_to(at.cells, bytes, m.root))
            return true;
    return false;
}

void check_bound_to(located const& at, pc::isize bytes, pc::type_descriptor const* type, char const* operation)
{
    if (is_bound_to(at, bytes, type))
        return;

    auto const* bound = at.cells[0].type;
    for (pc::isize i = 0; i < bytes && bound == type; ++i)
        bound = at.cells[i].type;
    PC_ASSERTS_ALWAYS(false, std::string(operation) + ": memory is bound to " + name_of(bound) + ", accessed as "
                                 + name_of(type));
}

void check_initialized(cell const* cells, pc::isize bytes, pc::type_descriptor const* type, char const* operation)
{
    for (pc::isize i = 0; i < bytes; ++i)
        PC_ASSERTS_ALWAYS(cells[i].initialized, std::string(operation) + ": memory of type " + name_of(type)
                                                    + " is not initialized");
}

void check_no_live_object(cell const* cells, pc::isize bytes, char const* operation)
{
    for (pc::isize i = 0; i < bytes; ++i)
        PC_ASSERTS_ALWAYS(!holds_live_nontrivial(cells[i]),
                          std::string(operation) + ": memory holds a live object of non-trivial type "
                              + name_of(cells[i].type));
}

bool contains(pc::uptr start, pc::isize bytes, pc::uptr p)
{
    return start <= p && p < start + pc::uptr(bytes);
}

void remember_release(registry& reg, pc::uptr start)
{
    auto const seq = ++reg.release_count;
    reg.released[start] = seq;
    reg.release_order.emplace_back(start, seq);

    if (pc::isize(reg.release_order.size()) > pc::memory_state::max_remembered_releases)
    {
        auto const [oldest, oldest_seq] = reg.release_order.front();
        reg.release_order.pop_front();

        // a later release of the same address is still remembered
        auto it = reg.released.find(oldest);
        if (it != reg.released.end() && it->second == oldest_seq)
            reg.released.erase(it);
    }
}

// drops the allocations lying completely inside [start, start + bytes)
void forget_inside(registry& reg, pc::uptr start, pc::isize bytes)
{
    auto const end = start + pc::uptr(bytes);
    for (auto it = reg.regions.lower_bound(start); it != reg.regions.end() && it->first < end;)
    {
        if (it->first + pc::uptr(it->second.cells.size()) <= end)
            it = reg.regions.erase(it);
        else
            ++it;
    }
    reg.released.erase(reg.released.lower_bound(start), reg.released.lower_bound(end));
}
} // namespace

pc::memory_state::summary pc::memory_state::query(raw_ptr p, isize byte_count)
{
    PC_ASSERT(byte_count >= 0, "byte count must be non-negative");
    if (byte_count == 0)
        return {};

    return shadow_registry().lock([&](registry& reg) -> summary {
        auto const* cells = find_cells(reg, address_of(p.get()), byte_count);
        if (cells == nullptr)
            return {};

        auto const classify = [](cell const& c) -> summary {
            if (c.type == nullptr)
                return {c.initialized ? cell_state::untyped_bytes : cell_state::untyped, nullptr};
            return {c.initialized ? cell_state::bound_initialized : cell_state::bound_uninitialized, c.type};
        };

        auto const first = classify(cells[0]);
        for (isize i = 1; i < byte_count; ++i)
        {
            auto const s = classify(cells[i]);
            if (s.state != first.state || s.type != first.type)
                return {cell_state::mixed, nullptr};
        }
        return first;
    });
}

pc::isize pc::memory_state::tracked_allocation_count()
{
    return shadow_registry().lock([](registry const& reg) { return isize(reg.regions.size() + reg.loans.size()); });
}

pc::isize pc::memory_state::remembered_release_count()
{
    return shadow_registry().lock([](registry const& reg) { return isize(reg.released.size()); });
}

void pc::memory_state::impl::on_allocate(void* p, isize bytes)
{
    PC_ASSERT(p != nullptr && bytes > 0, "tracked allocations are non-empty");

    auto const start = address_of(p);
    shadow_registry().lock([&](registry& reg) {
        auto const next = reg.regions.lower_bound(start);
        PC_ASSERTS_ALWAYS(next == reg.regions.end() || next->first >= start + uptr(bytes),
                          describe_at("new allocation overlaps a live tracked allocation", start));
        PC_ASSERTS_ALWAYS(find_cells(reg, start, 0) == nullptr,
                          describe_at("new allocation starts inside a live tracked allocation", start));

        reg.released.erase(start);
        reg.regions.emplace(start, region{std::vector<cell>(size_t(bytes)), {}});
    });

    pc::memset(p, allocated_poison, bytes);
}

void pc::memory_state::impl::on_deallocate(void* p)
{
    auto const start = address_of(p);
    auto const bytes = shadow_registry().lock([&](registry& reg) -> isize {
        auto it = reg.regions.find(start);
        if (it == reg.regions.end())
        {
            for (auto const& entry : reg.loans)
                PC_ASSERTS_ALWAYS(entry.second.region_start != start,
                                  describe_at("deallocating memory that is still lent to an arena", start));
            PC_ASSERTS_ALWAYS(!reg.released.contains(start), describe_at("double free", start));
            PC_ASSERTS_ALWAYS(find_cells(reg, start, 0) == nullptr,
                              describe_at("deallocating an address inside an allocation", start));
            return 0; // untracked
        }

        auto const& cells = it->second.cells;
        check_no_live_object(cells.data(), isize(cells.size()), "deallocate");

        auto const size = isize(cells.size());
        reg.regions.erase(it);
        remember_release(reg, start);
        return size;
    });

    pc::memset(p, deallocated_poison, bytes);
}

void pc::memory_state::impl::on_bind(void const* p, type_descriptor const* type, isize count)
{
    PC_ASSERT(type != nullptr && count >= 0, "invalid bind");
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto* cells = find_cells(reg, address_of(p), bytes);
        if (cells == nullptr)
            return;

        for (isize i = 0; i < bytes; ++i)
        {
            auto const& c = cells[i];
            if (!c.initialized || c.type == type || c.type == nullptr)
                continue;

            auto const layout_compatible = c.type->is_trivial && type->is_trivial && c.type->size == type->size;
            PC_ASSERTS_ALWAYS(layout_compatible, "bind_memory: rebinding initialized memory of type " + name_of(c.type)
                                                     + " to unrelated type " + name_of(type));
        }

        for (isize i = 0; i < bytes; ++i)
        {
            auto& c = cells[i];
            if (c.type == type)
                continue;
            c.initialized = c.initialized && type->is_trivial;
            c.type = type;
        }
    });
}

void pc::memory_state::impl::on_initialize(void const* p, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const at = locate(reg, address_of(p), bytes);
        if (!at)
            return;
        auto* cells = at.cells;

        check_bound_to(at, bytes, type, "initialize");
        check_no_live_object(cells, bytes, "initialize");

        for (isize i = 0; i < bytes; ++i)
            cells[i].initialized = true;
    });
}

void pc::memory_state::impl::on_deinitialize(void const* p, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const at = locate(reg, address_of(p), bytes);
        if (!at)
            return;
        auto* cells = at.cells;

        check_bound_to(at, bytes, type, "deinitialize");
        check_initialized(cells, bytes, type, "deinitialize");

        for (isize i = 0; i < bytes; ++i)
            cells[i].initialized = false;
    });
}

void pc::memory_state::impl::on_read(void const* p, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const at = locate(reg, address_of(p), bytes);
        if (!at)
            return;

        check_bound_to(at, bytes, type, "read");
        check_initialized(at.cells, bytes, type, "read");
    });
}

void pc::memory_state::impl::on_write(void const* p, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const at = locate(reg, address_of(p), bytes);
        if (!at)
            return;
        auto* cells = at.cells;

        check_bound_to(at, bytes, type, "assign");
        if (!type->is_trivial)
            check_initialized(cells, bytes, type, "assign");

        for (isize i = 0; i < bytes; ++i)
            cells[i].initialized = true;
    });
}

void pc::memory_state::impl::on_load(void const* p, isize bytes)
{
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const* cells = find_cells(reg, address_of(p), bytes);
        if (cells == nullptr)
            return;

        for (isize i = 0; i < bytes; ++i)
            PC_ASSERTS_ALWAYS(cells[i].initialized,
                              describe_at("load: reading uninitialized bytes", address_of(p) + uptr(i)));
    });
}

void pc::memory_state::impl::on_store_bytes(void const* p, isize bytes)
{
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto* cells = find_cells(reg, address_of(p), bytes);
        if (cells == nullptr)
            return;

        check_no_live_object(cells, bytes, "store_bytes");

        // bytes bound to a non-trivial type still hold no object afterwards
        for (isize i = 0; i < bytes; ++i)
            if (cells[i].type == nullptr || cells[i].type->is_trivial)
                cells[i].initialized = true;
    });
}

void pc::memory_state::impl::on_copy_bytes(void const* dest, void const* src, isize bytes)
{
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const* src_cells = find_cells(reg, address_of(src), bytes);
        auto* dest_cells = find_cells(reg, address_of(dest), bytes);

        if (src_cells != nullptr)
            check_no_live_object(src_cells, bytes, "copy_memory source");
        if (dest_cells == nullptr)
            return;
        check_no_live_object(dest_cells, bytes, "copy_memory destination");

        // snapshot first, the ranges may overlap
        std::vector<bool> initialized(size_t(bytes), true);
        if (src_cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                initialized[size_t(i)] = src_cells[i].initialized;

        for (isize i = 0; i < bytes; ++i)
            if (dest_cells[i].type == nullptr || dest_cells[i].type->is_trivial)
                dest_cells[i].initialized = initialized[size_t(i)];
    });
}

void pc::memory_state::impl::on_move_initialize(void const* dest, void const* src, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    auto const dest_start = address_of(dest);
    auto const src_start = address_of(src);

    shadow_registry().lock([&](registry& reg) {
        auto const src_at = locate(reg, src_start, bytes);
        auto const dest_at = locate(reg, dest_start, bytes);
        auto* src_cells = src_at.cells;
        auto* dest_cells = dest_at.cells;

        if (src_cells != nullptr)
        {
            check_bound_to(src_at, bytes, type, "move_initialize source");
            check_initialized(src_cells, bytes, type, "move_initialize source");
        }

        if (dest_cells != nullptr)
        {
            check_bound_to(dest_at, bytes, type, "move_initialize destination");
            // the overlapping part of the destination is the source itself
            for (isize i = 0; i < bytes; ++i)
                if (!contains(src_start, bytes, dest_start + uptr(i)))
                    PC_ASSERTS_ALWAYS(!holds_live_nontrivial(dest_cells[i]),
                                      "move_initialize: destination holds a live object of type " + name_of(type));
        }

        if (src_cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                src_cells[i].initialized = false;
        if (dest_cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                dest_cells[i].initialized = true;
    });
}

void pc::memory_state::impl::on_move_update(void const* dest, void const* src, type_descriptor const* type, isize count)
{
    auto const bytes = count * type->size;
    if (bytes == 0)
        return;

    shadow_registry().lock([&](registry& reg) {
        auto const src_at = locate(reg, address_of(src), bytes);
        auto const dest_at = locate(reg, address_of(dest), bytes);
        auto* src_cells = src_at.cells;
        auto* dest_cells = dest_at.cells;

        if (src_cells != nullptr)
        {
            check_bound_to(src_at, bytes, type, "move_update source");
            check_initialized(src_cells, bytes, type, "move_update source");
        }
        if (dest_cells != nullptr)
        {
            check_bound_to(dest_at, bytes, type, "move_update destination");
            check_initialized(dest_cells, bytes, type, "move_update destination");
        }

        if (src_cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                src_cells[i].initialized = false;
        if (dest_cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                dest_cells[i].initialized = true;
    });
}

void pc::memory_state::impl::begin_rebind(void const* p, isize bytes, type_descriptor const* type)
{
    auto const start = address_of(p);
    shadow_registry().lock([&](registry& reg) {
        rebind_record record;
        record.start = start;
        record.bytes = bytes;

        auto* cells = bytes > 0 ? find_cells(reg, start, bytes) : nullptr;
        if (cells != nullptr)
        {
            record.tracked = true;
            record.saved_types.reserve(size_t(bytes));
            for (isize i = 0; i < bytes; ++i)
                record.saved_types.push_back(cells[i].type);
        }

        reg.rebinds.push_back(pc::move(record));

        if (cells != nullptr)
            for (isize i = 0; i < bytes; ++i)
                cells[i].type = type;
    });
}

void pc::memory_state::impl::end_rebind(void const* p, isize bytes)
{
    auto const start = address_of(p);
    shadow_registry().lock([&](registry& reg) {
        PC_ASSERT_ALWAYS(!reg.rebinds.empty(), "end_rebind without matching begin_rebind");
        PC_ASSERT_ALWAYS(reg.rebinds.back().start == start && reg.rebinds.back().bytes == bytes,
                         "scoped rebinds must be closed in reverse order");

        auto record = pc::move(reg.rebinds.back());
        reg.rebinds.pop_back();
        if (!record.tracked)
            return;

        // the allocation may have been released inside the scope
        auto* cells = find_cells(reg, start, bytes);
        if (cells == nullptr)
            return;

        // initialization is kept, only the binding is restored
        for (isize i = 0; i < bytes; ++i)
            cells[i].type = record.saved_types[size_t(i)];
    });
}

void pc::memory_state::impl::on_member(void const* object,
                                      type_descriptor const* object_type,
                                      void const* member,
                                      type_descriptor const* member_type)
{
    shadow_registry().lock([&](registry& reg) {
        auto const parent = locate(reg, address_of(object), object_type->size);
        if (!parent)
            return;
        check_bound_to(parent, object_type->size, object_type, "member");

        auto const field = locate(reg, address_of(member), member_type->size);
        PC_ASSERT_ALWAYS(field.owner == parent.owner, "member lies outside of its object");

        // bound to the outermost object, also for members of members
        auto const* root = field.cells[0].type;
        if (root == member_type)
            return;

        auto& members = field.owner->members;
        for (auto const& m : members)
            if (m.offset == field.offset && m.type == member_type && m.root == root)
                return;
        members.push_back({field.offset, member_type, root});
    });
}

void pc::memory_state::impl::begin_loan(void const* p, isize bytes)
{
    auto const start = address_of(p);
    shadow_registry().lock([&](registry& reg) {
        auto const at = locate(reg, start, bytes);
        if (!at)
            return;
        check_no_live_object(at.cells, bytes, "lending memory to an arena");

        auto it = reg.regions.find(at.region_start);
        reg.loans.emplace(start, loan{it->first, bytes, pc::move(it->second)});
        reg.regions.erase(it);
    });
}

void pc::memory_state::impl::end_loan(void const* p, isize bytes)
{
    auto const start = address_of(p);
    shadow_registry().lock([&](registry& reg) {
        forget_inside(reg, start, bytes);

        auto it = reg.loans.find(start);
        if (it == reg.loans.end())
            return;

        // whatever the arena held is gone, the lent bytes are fresh storage of the parent again
        auto& l = it->second;
        auto const offset = isize(start - l.region_start);
        for (isize i = 0; i < l.bytes; ++i)
            l.parent.cells[size_t(offset + i)] = cell{};

        reg.regions.emplace(l.region_start, pc::move(l.parent));
        reg.loans.erase(it);
    });
}

void pc::memory_state::impl::forget_range(void const* p, isize bytes)
{
    shadow_registry().lock([&](registry& reg) { forget_inside(reg, address_of(p), bytes); });
}
