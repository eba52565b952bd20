#include <mirror-core/impl/object_lifetime_util.hh>
#include <mirror-core/utility.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <type_traits>
#include <vector>


namespace
{
struct MoveOnly
{
    int id;

    explicit MoveOnly(int i = 0) : id(i) {}
    MoveOnly(MoveOnly const&) = delete;
    MoveOnly& operator=(MoveOnly const&) = delete;
    MoveOnly(MoveOnly&& other) noexcept : id(other.id) { other.id = -1; }
    MoveOnly& operator=(MoveOnly&& other) noexcept
    {
        id = other.id;
        other.id = -1;
        return *this;
    }
};

// counts live instances, relocation must neither leak nor double-destroy
struct Counted
{
    int value = 0;
    static inline int live = 0;

    explicit Counted(int v) : value(v) { ++live; }
    Counted(Counted const& rhs) : value(rhs.value) { ++live; }
    Counted(Counted&& rhs) noexcept : value(rhs.value)
    {
        rhs.value = -1;
        ++live;
    }
    Counted& operator=(Counted const&) = default;
    ~Counted() { --live; }
};
} // namespace

TEST("utility - move, forward and exchange")
{
    int x = 5;
    static_assert(std::is_same_v<decltype(mc::move(x)), int&&>);
    static_assert(std::is_same_v<decltype(mc::forward<int&>(x)), int&>);
    static_assert(std::is_same_v<decltype(mc::forward<int>(x)), int&&>);

    SECTION("exchange returns the old value")
    {
        int v = 1;
        auto const old = mc::exchange(v, 2);
        CHECK(old == 1);
        CHECK(v == 2);
    }

    SECTION("exchange with pointers")
    {
        int target = 3;
        int* p = &target;
        auto const taken = mc::exchange(p, nullptr);
        CHECK(taken == &target);
        CHECK(p == nullptr);
    }

    SECTION("swap_by_move with move-only types")
    {
        auto a = MoveOnly(1);
        auto b = MoveOnly(2);
        mc::swap_by_move(a, b);
        CHECK(a.id == 2);
        CHECK(b.id == 1);
    }
}

TEST("utility - max")
{
    CHECK(mc::max(3, 7) == 7);
    CHECK(mc::max(7, 3) == 7);
    CHECK(mc::max(-1, -1) == -1);

    // equal values return b
    int const a = 4;
    int const b = 4;
    CHECK(&mc::max(a, b) == &b);
}

TEST("utility - integer arithmetic")
{
    SECTION("int_round_up_to_multiple")
    {
        CHECK(mc::int_round_up_to_multiple(0, 10) == 0);
        CHECK(mc::int_round_up_to_multiple(1, 10) == 10);
        CHECK(mc::int_round_up_to_multiple(10, 10) == 10);
        CHECK(mc::int_round_up_to_multiple(23, 10) == 30);
        CHECK(mc::int_round_up_to_multiple(mc::isize(4097), mc::isize(4096)) == 8192);
    }

    SECTION("int_gcd and int_lcm")
    {
        CHECK(mc::int_gcd(12, 18) == 6);
        CHECK(mc::int_gcd(7, 13) == 1);
        CHECK(mc::int_lcm(4096, 8) == 4096);
        CHECK(mc::int_lcm(4096, 24) == 12288);
        CHECK(mc::int_lcm(16, 12) == 48);
        CHECK(mc::int_lcm(5, 5) == 5);
    }

    SECTION("is_power_of_two")
    {
        CHECK(mc::is_power_of_two(1));
        CHECK(mc::is_power_of_two(2));
        CHECK(mc::is_power_of_two(4096));
        CHECK(!mc::is_power_of_two(3));
        CHECK(!mc::is_power_of_two(12));
        CHECK(!mc::is_power_of_two(4095));
    }
}

#if MC_ASSERT_ENABLED
TEST("utility - precondition failures trigger assertions")
{
    CHECK(test::asserts_on([] { (void)mc::int_round_up_to_multiple(10, 0); }));
    CHECK(test::asserts_on([] { (void)mc::int_gcd(0, 4); }));
    CHECK(test::asserts_on([] { (void)mc::is_power_of_two(0); }));
    CHECK(test::asserts_on([] { (void)mc::is_power_of_two(-8); }));
    CHECK(test::asserts_on([] { mc::memcpy(nullptr, nullptr, -1); }));
}
#endif

TEST("utility - memcpy and memmove")
{
    SECTION("zero bytes with nullptr is a no-op")
    {
        mc::memcpy(nullptr, nullptr, 0);
        mc::memmove(nullptr, nullptr, 0);
        SUCCEED();
    }

    SECTION("memmove handles overlap")
    {
        int v[] = {1, 2, 3, 4, 5};
        mc::memmove(v + 1, v, 4 * sizeof(int));
        CHECK(v[0] == 1);
        CHECK(v[1] == 1);
        CHECK(v[2] == 2);
        CHECK(v[3] == 3);
        CHECK(v[4] == 4);
    }
}

TEST("utility - function_ptr converts signatures to pointers")
{
    static_assert(std::is_same_v<mc::function_ptr<int(float)>, int (*)(float)>);
    static_assert(std::is_same_v<mc::function_ptr<void(mc::byte*, mc::isize, void*)>, void (*)(mc::byte*, mc::isize, void*)>);
    static_assert(std::is_same_v<mc::function_ptr<void() noexcept>, void (*)() noexcept>);
    SUCCEED();
}

TEST("utility - MC_DEFER executes at scope exit")
{
    std::vector<int> events;

    {
        MC_DEFER { events.push_back(1); };
        MC_DEFER { events.push_back(2); };
        events.push_back(0);
    }

    // deferred blocks run in reverse declaration order
    REQUIRE(events.size() == 3);
    CHECK(events[0] == 0);
    CHECK(events[1] == 2);
    CHECK(events[2] == 1);
}

TEST("utility - relocate_objects_to")
{
    Counted::live = 0;

    // raw storage for 8 slots, live objects are placed manually
    mc::storage_for<Counted> slots[8];
    auto const at = [&](int i) { return &slots[i].value; };

    SECTION("toward the back, overlapping")
    {
        for (auto i = 0; i < 4; ++i)
            new (mc::placement_new, at(i)) Counted(i + 10);
        CHECK(Counted::live == 4);

        // [0, 4) -> [1, 5)
        mc::impl::relocate_objects_to(at(1), at(0), at(4));
        CHECK(Counted::live == 4);
        CHECK(at(1)->value == 10);
        CHECK(at(2)->value == 11);
        CHECK(at(3)->value == 12);
        CHECK(at(4)->value == 13);

        mc::impl::destroy_objects_in_reverse(at(1), at(5));
        CHECK(Counted::live == 0);
    }

    SECTION("toward the front, overlapping")
    {
        for (auto i = 2; i < 6; ++i)
            new (mc::placement_new, at(i)) Counted(i);

        // [2, 6) -> [1, 5)
        mc::impl::relocate_objects_to(at(1), at(2), at(6));
        CHECK(Counted::live == 4);
        CHECK(at(1)->value == 2);
        CHECK(at(4)->value == 5);

        mc::impl::destroy_objects_in_reverse(at(1), at(5));
        CHECK(Counted::live == 0);
    }

    SECTION("disjoint and empty ranges")
    {
        new (mc::placement_new, at(0)) Counted(7);
        mc::impl::relocate_objects_to(at(6), at(0), at(1));
        CHECK(Counted::live == 1);
        CHECK(at(6)->value == 7);

        mc::impl::relocate_objects_to(at(3), at(3), at(3));
        CHECK(Counted::live == 1);

        mc::impl::destroy_objects_in_reverse(at(6), at(7));
        CHECK(Counted::live == 0);
    }

    SECTION("trivially copyable types use memmove")
    {
        int v[6] = {1, 2, 3, 0, 0, 0};
        mc::impl::relocate_objects_to(v + 2, v, v + 3);
        CHECK(v[2] == 1);
        CHECK(v[3] == 2);
        CHECK(v[4] == 3);
    }
}

TEST("utility - create objects helpers advance dest_end")
{
    Counted::live = 0;
    mc::storage_for<Counted> slots[6];
    auto* const base = &slots[0].value;

    auto* obj_end = base;
    mc::impl::fill_create_objects_to(obj_end, 2, Counted(5));
    CHECK(obj_end == base + 2);
    CHECK(Counted::live == 2);

    auto* moved_end = base + 2;
    mc::impl::move_create_objects_to(moved_end, base, base + 2);
    CHECK(moved_end == base + 4);
    CHECK(base[2].value == 5);
    CHECK(base[0].value == -1); // moved-from, still alive
    CHECK(Counted::live == 4);

    Counted const src[] = {Counted(8), Counted(9)};
    auto* copied_end = base + 4;
    mc::impl::copy_create_objects_to(copied_end, src, src + 2);
    CHECK(copied_end == base + 6);
    CHECK(base[5].value == 9);

    mc::impl::destroy_objects_in_reverse(base, base + 6);
    CHECK(Counted::live == 2); // only src remains
}
