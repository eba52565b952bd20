#include <mirror-core/backend.hh>
#include <mirror-core/result.hh>

#include <nexus/test.hh>

#include "test-util.hh"

#include <memory>
#include <string>


namespace
{
struct Counted
{
    static inline int live = 0;
    int value = 0;

    explicit Counted(int v) : value(v) { ++live; }
    Counted(Counted const& rhs) : value(rhs.value) { ++live; }
    Counted(Counted&& rhs) noexcept : value(rhs.value) { ++live; }
    Counted& operator=(Counted const&) = default;
    ~Counted() { --live; }
};

mc::result<int, mc::mirror_error> parse_half(int bytes)
{
    if (bytes % 2 != 0)
        return mc::failure(mc::mirror_error::allocation_failure);
    return bytes / 2;
}
} // namespace

TEST("result - success and error")
{
    SECTION("success")
    {
        mc::result<int, mc::mirror_error> r = 5;
        CHECK(r.has_value());
        CHECK(!r.has_error());
        CHECK(r.value() == 5);
    }

    SECTION("error")
    {
        mc::result<int, mc::mirror_error> r = mc::failure(mc::mirror_error::race_exhausted);
        CHECK(!r.has_value());
        CHECK(r.has_error());
        CHECK(r.error() == mc::mirror_error::race_exhausted);
    }

    SECTION("returned from functions")
    {
        auto const ok = parse_half(8);
        auto const bad = parse_half(7);
        REQUIRE(ok.has_value());
        CHECK(ok.value() == 4);
        REQUIRE(bad.has_error());
        CHECK(bad.error() == mc::mirror_error::allocation_failure);
    }

    SECTION("pointer values")
    {
        int target = 0;
        mc::result<int*, mc::mirror_error> r = &target;
        CHECK(r.value() == &target);
    }
}

TEST("result - object lifetimes")
{
    Counted::live = 0;

    SECTION("value is destroyed with the result")
    {
        {
            mc::result<Counted, mc::mirror_error> r = Counted(3);
            CHECK(Counted::live == 1);
            CHECK(r.value().value == 3);
        }
        CHECK(Counted::live == 0);
    }

    SECTION("copy and move")
    {
        mc::result<Counted, mc::mirror_error> a = Counted(1);
        auto b = a;
        auto c = mc::move(a);
        CHECK(b.value().value == 1);
        CHECK(c.value().value == 1);
        CHECK(Counted::live == 3);
    }

    SECTION("assigning an error over a value destroys the value")
    {
        mc::result<Counted, mc::mirror_error> r = Counted(1);
        r = mc::result<Counted, mc::mirror_error>(mc::failure(mc::mirror_error::allocation_failure));
        CHECK(r.has_error());
        CHECK(Counted::live == 0);
    }

    SECTION("self assignment")
    {
        mc::result<Counted, mc::mirror_error> r = Counted(9);
        auto& self = r;
        r = self;
        CHECK(r.value().value == 9);
        CHECK(Counted::live == 1);
    }
}

TEST("result - move-only types")
{
    mc::result<std::unique_ptr<int>, mc::mirror_error> r = std::make_unique<int>(11);
    REQUIRE(r.has_value());

    auto p = mc::move(r).value();
    REQUIRE(p != nullptr);
    CHECK(*p == 11);
}

TEST("result - mirror_error names")
{
    CHECK(std::string(mc::to_string(mc::mirror_error::allocation_failure)) == "allocation_failure");
    CHECK(std::string(mc::to_string(mc::mirror_error::race_exhausted)) == "race_exhausted");
}

#if MC_ASSERT_ENABLED
TEST("result - wrong alternative access asserts")
{
    mc::result<int, mc::mirror_error> ok = 1;
    mc::result<int, mc::mirror_error> bad = mc::failure(mc::mirror_error::allocation_failure);

    CHECK(test::asserts_on([&] { (void)ok.error(); }));
    CHECK(test::asserts_on([&] { (void)bad.value(); }));
}
#endif
