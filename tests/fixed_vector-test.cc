#include <stack-array/fixed_vector.hh>
#include <stack-array/utility.hh>

#include "test-helpers.hh"

#include <nexus/test.hh>

#include <string>
#include <unordered_set>
#include <vector>

using test::MoveOnly;
using test::ThrowingCopy;
using test::Tracked;

// inline storage: live count plus the slots, no pointer
static_assert(sizeof(sa::fixed_vector<sa::u8, 8>) == sizeof(sa::isize) + 8);
static_assert(sizeof(sa::fixed_vector<sa::i64, 4>) == sizeof(sa::isize) + 4 * sizeof(sa::i64));
static_assert(sa::fixed_vector<int, 7>::capacity() == 7);

TEST("fixed_vector - default construction invariants")
{
    SECTION("empty state - int")
    {
        sa::fixed_vector<int, 4> v;
        CHECK(v.size() == 0);
        CHECK(v.empty());
        CHECK(!v.is_full());
        CHECK(v.capacity() == 4);
        CHECK(v.remaining_capacity() == 4);
        CHECK(v.begin() == v.end());
        CHECK(v.data() != nullptr);
    }

    SECTION("empty state - Tracked")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 8> v;
            CHECK(v.size() == 0);
        }
        // no slot is constructed or destroyed up front
        CHECK(Tracked::ctor_count == 0);
        CHECK(Tracked::dtor_count == 0);
    }

    SECTION("zero capacity")
    {
        sa::fixed_vector<std::string, 0> v;
        CHECK(v.empty());
        CHECK(v.is_full());
        CHECK(v.capacity() == 0);
        CHECK(!v.try_push_back("x"));
        CHECK_VIOLATION(capacity_exceeded, v.push_back("x"));
        CHECK(v.empty());
    }
}

TEST("fixed_vector - initializer list")
{
    SECTION("fits")
    {
        auto v = sa::fixed_vector<int, 4>{1, 2, 3};
        CHECK(v.size() == 3);
        CHECK(v[0] == 1);
        CHECK(v[2] == 3);
    }

    SECTION("exactly full")
    {
        auto v = sa::fixed_vector<int, 3>{1, 2, 3};
        CHECK(v.is_full());
        CHECK(v.remaining_capacity() == 0);
        CHECK(v.size_bytes() == 3 * sa::isize(sizeof(int)));
    }

    SECTION("longer than the capacity is rejected")
    {
        Tracked::reset_counters();
        {
            auto const info = test::capture_violation(
                [&]
                {
                    auto v = sa::fixed_vector<Tracked, 2>{Tracked(1), Tracked(2), Tracked(3)};
                    CHECK(false); // not reached
                });
            REQUIRE(info.has_value());
            CHECK(info->kind == sa::impl::violation_kind::capacity_exceeded);
            CHECK(info->value == 3);
            CHECK(info->bound == 2);
        }
        // nothing was copied into a container
        CHECK(Tracked::copy_ctor_count == 0);
        CHECK(Tracked::alive() == 0);
    }
}

TEST("fixed_vector - factories")
{
    SECTION("create_defaulted")
    {
        auto v = sa::fixed_vector<int, 5>::create_defaulted(3);
        CHECK(v.size() == 3);
        for (auto x : v)
            CHECK(x == 0);
    }

    SECTION("create_filled")
    {
        auto v = sa::fixed_vector<std::string, 5>::create_filled(4, "ab");
        CHECK(v.size() == 4);
        for (auto const& s : v)
            CHECK(s == "ab");
    }

    SECTION("create_filled too large")
    {
        CHECK_VIOLATION(capacity_exceeded, sa::fixed_vector<int, 2>::create_filled(3, 1));
    }

    SECTION("create_copy_of")
    {
        int const values[] = {4, 5, 6};
        auto v = sa::fixed_vector<int, 8>::create_copy_of(values);
        CHECK(v.size() == 3);
        CHECK(v == values);
    }

    SECTION("create_copy_of too large")
    {
        int const values[] = {4, 5, 6};
        CHECK_VIOLATION(capacity_exceeded, sa::fixed_vector<int, 2>::create_copy_of(values));
    }

    SECTION("create_from moves out of the array")
    {
        auto v = sa::fixed_vector<MoveOnly, 4>::create_from({MoveOnly(1), MoveOnly(2)});
        CHECK(v.size() == 2);
        CHECK(v[0].value == 1);
        CHECK(v[1].value == 2);
    }
}

TEST("fixed_vector - push_back and pop_back")
{
    SECTION("pushes up to capacity")
    {
        sa::fixed_vector<int, 4> v;
        for (int i = 0; i < 4; ++i)
        {
            v.push_back(i * 10);
            CHECK(v.size() == i + 1);
        }
        CHECK(v.is_full());
        CHECK(v.front() == 0);
        CHECK(v.back() == 30);
    }

    SECTION("push on full is rejected and leaves the state unchanged")
    {
        auto v = sa::fixed_vector<int, 3>{1, 2, 3};
        auto const info = test::capture_violation([&] { v.push_back(4); });
        REQUIRE(info.has_value());
        CHECK(info->kind == sa::impl::violation_kind::capacity_exceeded);
        CHECK(info->value == 4);
        CHECK(info->bound == 3);
        CHECK(test::elements_equal(v, {1, 2, 3}));
    }

    SECTION("try_push_back")
    {
        sa::fixed_vector<std::string, 1> v;
        CHECK(v.try_push_back("a"));

        auto s = std::string("keep me");
        CHECK(!v.try_push_back(sa::move(s)));
        CHECK(s == "keep me"); // untouched on failure
        CHECK(v.size() == 1);
    }

    SECTION("push and pop are LIFO")
    {
        sa::fixed_vector<int, 8> v;
        v.push_back(1);
        v.push_back(2);
        v.push_back(3);

        CHECK(v.pop_back() == 3);
        CHECK(v.pop_back() == 2);
        v.push_back(7);
        CHECK(v.pop_back() == 7);
        CHECK(v.pop_back() == 1);
        CHECK(v.empty());
    }

    SECTION("pop from empty is a precondition violation")
    {
        sa::fixed_vector<int, 2> v;
        CHECK_VIOLATION(precondition, v.pop_back());
        CHECK_VIOLATION(precondition, v.remove_back());
        CHECK_VIOLATION(precondition, v.front());
        CHECK_VIOLATION(precondition, v.back());
    }

    SECTION("try_pop_back")
    {
        auto v = sa::fixed_vector<int, 2>{5};
        auto a = v.try_pop_back();
        REQUIRE(a.has_value());
        CHECK(a.value() == 5);
        CHECK(!v.try_pop_back().has_value());
    }

    SECTION("emplace_back constructs in place")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 4> v;
            v.emplace_back(7);
            CHECK(v[0].value == 7);
            CHECK(Tracked::ctor_count == 1);
            CHECK(Tracked::move_ctor_count == 0);
            CHECK(Tracked::copy_ctor_count == 0);
        }
        CHECK(Tracked::dtor_count == 1);
    }

    SECTION("throwing element constructor leaves the container unchanged")
    {
        ThrowingCopy::alive = 0;
        {
            sa::fixed_vector<ThrowingCopy, 4> v;
            v.emplace_back(1);
            auto const x = ThrowingCopy(2);

            ThrowingCopy::copies_until_throw = 0;
            bool thrown = false;
            try
            {
                v.push_back(x);
            }
            catch (int)
            {
                thrown = true;
            }
            ThrowingCopy::copies_until_throw = -1;

            CHECK(thrown);
            CHECK(v.size() == 1);
            CHECK(v[0].value == 1);
        }
        CHECK(ThrowingCopy::alive == 0);
    }
}

namespace
{
// const members: a slot reused by a new object must be re-read, not assumed unchanged
struct Labeled
{
    int const id;
    int const rank;
};
} // namespace

TEST("fixed_vector - slots are reused by objects with const members")
{
    auto v = sa::fixed_vector<Labeled, 2>{};
    v.push_back(Labeled{1, 10});
    v.push_back(Labeled{2, 20});
    CHECK(v[1].id == 2);

    v.pop_back();
    v.push_back(Labeled{3, 30});
    CHECK(v[1].id == 3);
    CHECK(v.back().rank == 30);

    v.remove_at(0);
    CHECK(v.size() == 1);
    CHECK(v.front().id == 3);
    CHECK(v.data()->rank == 30);
}

TEST("fixed_vector - indexing")
{
    auto v = sa::fixed_vector<int, 8>{1, 2, 3};

    SECTION("read and write")
    {
        v[1] = 20;
        CHECK(v[0] == 1);
        CHECK(v[1] == 20);
        CHECK(v[2] == 3);
    }

    SECTION("out of bounds reports index and size")
    {
        auto const info = test::capture_violation([&] { (void)v[3]; });
        REQUIRE(info.has_value());
        CHECK(info->kind == sa::impl::violation_kind::index_out_of_bounds);
        CHECK(info->value == 3);
        CHECK(info->bound == 3);

        CHECK_VIOLATION(index_out_of_bounds, v[-1]);
    }

    SECTION("slots past size are not reachable even though they exist")
    {
        CHECK(v.capacity() == 8);
        CHECK_VIOLATION(index_out_of_bounds, v[5]);
    }
}

TEST("fixed_vector - sub-range views")
{
    auto v = sa::fixed_vector<int, 8>{0, 1, 2, 3, 4};

    SECTION("subspan(start, end)")
    {
        auto s = v.subspan(1, 3);
        CHECK(s.size() == 2);
        CHECK(s[0] == 1);
        CHECK(s[1] == 2);

        // views write through
        s[0] = 10;
        CHECK(v[1] == 10);
    }

    SECTION("subspan(start)")
    {
        auto s = v.subspan(2);
        CHECK(s.size() == 3);
        s[2] = 40;
        CHECK(v[4] == 40);
    }

    SECTION("prefix")
    {
        auto s = v.subspan(0, 2);
        CHECK(s.size() == 2);
        CHECK(s.back() == 1);
    }

    SECTION("bad ranges")
    {
        CHECK_VIOLATION(index_out_of_bounds, v.subspan(3, 2));
        CHECK_VIOLATION(index_out_of_bounds, v.subspan(0, 6));
        CHECK_VIOLATION(index_out_of_bounds, v.subspan(6));
        CHECK_VIOLATION(index_out_of_bounds, v.split_at(6));
    }

    SECTION("split_at gives two mutable halves")
    {
        auto [left, right] = v.split_at(2);
        CHECK(left.size() == 2);
        CHECK(right.size() == 3);

        left[0] = right[0];
        right[2] = 99;
        CHECK(test::elements_equal(v, {2, 1, 2, 3, 99}));
    }

    SECTION("as_span")
    {
        auto const& cv = v;
        auto s = cv.as_span();
        CHECK(s.size() == 5);
        CHECK(s.data() == v.data());
    }
}

TEST("fixed_vector - insert_at and pop_at")
{
    SECTION("insert into the middle")
    {
        auto v = sa::fixed_vector<int, 5>{1, 2, 3};
        v.insert_at(1, 9);
        CHECK(test::elements_equal(v, {1, 9, 2, 3}));
    }

    SECTION("insert at the front and at the end")
    {
        auto v = sa::fixed_vector<int, 5>{1, 2};
        v.insert_at(0, 0);
        v.insert_at(3, 3);
        CHECK(test::elements_equal(v, {0, 1, 2, 3}));
    }

    SECTION("insert then pop_at restores the sequence")
    {
        auto v = sa::fixed_vector<std::string, 6>{"a", "b", "c", "d"};
        auto const before = v;
        for (sa::isize i = 0; i <= v.size(); ++i)
        {
            v.insert_at(i, "new");
            CHECK(v[i] == "new");
            CHECK(v.pop_at(i) == "new");
            CHECK(v == before);
        }
    }

    SECTION("insert past size is rejected")
    {
        auto v = sa::fixed_vector<int, 5>{1, 2};
        auto const info = test::capture_violation([&] { v.insert_at(3, 0); });
        REQUIRE(info.has_value());
        CHECK(info->kind == sa::impl::violation_kind::index_out_of_bounds);
        CHECK(info->value == 3);
        CHECK(info->bound == 2);
        CHECK(v.size() == 2);
    }

    SECTION("insert into a full container is rejected")
    {
        auto v = sa::fixed_vector<int, 2>{1, 2};
        CHECK_VIOLATION(capacity_exceeded, v.insert_at(0, 0));
        CHECK(test::elements_equal(v, {1, 2}));
    }

    SECTION("insert a copy of an element of the same container")
    {
        auto v = sa::fixed_vector<std::string, 4>{"x", "y"};
        v.insert_at(0, v[1]);
        CHECK(test::elements_equal(v, {"y", "x", "y"}));
    }

    SECTION("shifting does not create or lose elements")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 6> v;
            for (int i = 0; i < 4; ++i)
                v.emplace_back(i);
            v.emplace_at(1, 100);
            REQUIRE(v.size() == 5);
            CHECK(v[0].value == 0);
            CHECK(v[1].value == 100);
            CHECK(v[2].value == 1);
            CHECK(v[4].value == 3);

            v.remove_at(1);
            CHECK(v[1].value == 1);
            CHECK(v.size() == 4);
            CHECK(Tracked::alive() == 4);
        }
        CHECK(Tracked::alive() == 0);
    }

    SECTION("pop_at out of bounds")
    {
        auto v = sa::fixed_vector<int, 4>{1};
        CHECK_VIOLATION(index_out_of_bounds, v.pop_at(1));
        CHECK_VIOLATION(index_out_of_bounds, v.remove_at(-1));
        CHECK(v.size() == 1);
    }
}

TEST("fixed_vector - pop_at_unordered")
{
    SECTION("fills the hole with the last element")
    {
        auto v = sa::fixed_vector<std::string, 4>{"foo", "bar", "baz", "qux"};
        CHECK(v.pop_at_unordered(1) == "bar");
        CHECK(test::elements_equal(v, {"foo", "qux", "baz"}));

        CHECK(v.pop_at_unordered(0) == "foo");
        CHECK(test::elements_equal(v, {"baz", "qux"}));
    }

    SECTION("removing the last element")
    {
        auto v = sa::fixed_vector<std::string, 4>{"a", "b"};
        CHECK(v.pop_at_unordered(1) == "b");
        CHECK(v.size() == 1);
        CHECK(v[0] == "a");
    }

    SECTION("remove_at_unordered destroys exactly one element")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 4> v;
            v.emplace_back(1);
            v.emplace_back(2);
            v.emplace_back(3);
            std::vector<int> order;
            Tracked::destruction_order = &order;
            v.remove_at_unordered(0);
            Tracked::destruction_order = nullptr;

            REQUIRE(order.size() == 2);
            CHECK(order[0] == 1);  // the removed element
            CHECK(order[1] == -1); // the moved-from source of the relocation
            CHECK(v[0].value == 3);
            CHECK(v[1].value == 2);
            CHECK(Tracked::alive() == 2);
        }
    }

    SECTION("out of bounds")
    {
        sa::fixed_vector<int, 4> v;
        CHECK_VIOLATION(index_out_of_bounds, v.pop_at_unordered(0));
    }
}

TEST("fixed_vector - truncate and clear")
{
    SECTION("keeps exactly the first k")
    {
        auto v = sa::fixed_vector<int, 8>{1, 2, 3, 4, 5};
        v.truncate(2);
        CHECK(test::elements_equal(v, {1, 2}));
    }

    SECTION("larger or equal length is a no-op")
    {
        auto v = sa::fixed_vector<int, 8>{1, 2, 3};
        v.truncate(3);
        CHECK(v.size() == 3);
        v.truncate(7);
        CHECK(v.size() == 3);
    }

    SECTION("negative length")
    {
        auto v = sa::fixed_vector<int, 8>{1, 2, 3};
        CHECK_VIOLATION(precondition, v.truncate(-1));
        CHECK(v.size() == 3);
    }

    SECTION("destroys the removed elements once, in slot order")
    {
        Tracked::reset_counters();
        std::vector<int> order;
        {
            sa::fixed_vector<Tracked, 8> v;
            for (int i = 0; i < 5; ++i)
                v.emplace_back(i);

            Tracked::destruction_order = &order;
            v.truncate(2);
            CHECK(v.size() == 2);
            CHECK(test::elements_equal(order, {2, 3, 4}));

            v.clear();
            CHECK(v.empty());
            CHECK(test::elements_equal(order, {2, 3, 4, 0, 1}));
        }
        Tracked::destruction_order = nullptr;
        CHECK(Tracked::dtor_count == 5);
    }
}

TEST("fixed_vector - append")
{
    SECTION("moves all elements across capacities")
    {
        auto a = sa::fixed_vector<std::string, 5>{"a", "b"};
        auto b = sa::fixed_vector<std::string, 3>{"c", "d", "e"};
        a.append(b);
        CHECK(test::elements_equal(a, {"a", "b", "c", "d", "e"}));
        CHECK(b.empty());
    }

    SECTION("elements are relocated, not duplicated")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 4> a;
            sa::fixed_vector<Tracked, 4> b;
            a.emplace_back(1);
            b.emplace_back(2);
            b.emplace_back(3);
            a.append(b);

            CHECK(a.size() == 3);
            CHECK(b.size() == 0);
            CHECK(a[2].value == 3);
            CHECK(Tracked::copy_ctor_count == 0);
            CHECK(Tracked::alive() == 3);
        }
        CHECK(Tracked::alive() == 0);
    }

    SECTION("does not fit")
    {
        auto a = sa::fixed_vector<int, 3>{1, 2};
        auto b = sa::fixed_vector<int, 3>{3, 4};
        CHECK_VIOLATION(capacity_exceeded, a.append(b));
        CHECK(a.size() == 2);
        CHECK(b.size() == 2);
    }
}

TEST("fixed_vector - extend_from_span")
{
    SECTION("copies the values")
    {
        auto v = sa::fixed_vector<int, 6>{1};
        int const more[] = {2, 3, 4};
        v.extend_from_span(more);
        CHECK(test::elements_equal(v, {1, 2, 3, 4}));
    }

    SECTION("does not fit")
    {
        auto v = sa::fixed_vector<int, 3>{1};
        int const more[] = {2, 3, 4};
        CHECK_VIOLATION(capacity_exceeded, v.extend_from_span(more));
        CHECK(v.size() == 1);
    }

    SECTION("all or nothing when a copy throws")
    {
        ThrowingCopy::alive = 0;
        {
            ThrowingCopy const src[] = {ThrowingCopy(1), ThrowingCopy(2), ThrowingCopy(3)};
            sa::fixed_vector<ThrowingCopy, 8> v;
            v.emplace_back(0);

            ThrowingCopy::copies_until_throw = 2; // third copy throws
            bool thrown = false;
            try
            {
                v.extend_from_span(src);
            }
            catch (int)
            {
                thrown = true;
            }
            ThrowingCopy::copies_until_throw = -1;

            CHECK(thrown);
            CHECK(v.size() == 1);
            CHECK(ThrowingCopy::alive == 4); // src + the one element
        }
        CHECK(ThrowingCopy::alive == 0);
    }
}

TEST("fixed_vector - copy and move")
{
    SECTION("copies are disjoint and equal")
    {
        auto a = sa::fixed_vector<int, 4>{1, 2, 3};
        auto b = a;
        CHECK(a == b);
        CHECK(a.data() != b.data());

        b[0] = 10;
        CHECK(a[0] == 1);
    }

    SECTION("copy assignment replaces the content")
    {
        auto a = sa::fixed_vector<std::string, 4>{"x"};
        auto b = sa::fixed_vector<std::string, 4>{"1", "2", "3"};
        a = b;
        CHECK(a == b);
        b = b;
        CHECK(b.size() == 3);
    }

    SECTION("move leaves the source empty")
    {
        auto a = sa::fixed_vector<std::string, 4>{"a", "b"};
        auto b = sa::move(a);
        CHECK(a.empty());
        CHECK(test::elements_equal(b, {"a", "b"}));

        auto c = sa::fixed_vector<std::string, 4>{"z"};
        c = sa::move(b);
        CHECK(b.empty());
        CHECK(c.size() == 2);
        CHECK(c[1] == "b");
    }

    SECTION("move-only elements")
    {
        sa::fixed_vector<MoveOnly, 3> a;
        a.emplace_back(1);
        a.emplace_back(2);
        auto b = sa::move(a);
        CHECK(b.size() == 2);
        CHECK(b[1].value == 2);
        CHECK(b.pop_back().value == 2);
    }

    SECTION("copy that throws half-way leaves nothing behind")
    {
        ThrowingCopy::alive = 0;
        {
            sa::fixed_vector<ThrowingCopy, 4> a;
            a.emplace_back(1);
            a.emplace_back(2);
            a.emplace_back(3);

            ThrowingCopy::copies_until_throw = 1;
            bool thrown = false;
            try
            {
                auto b = a;
                CHECK(false); // not reached
            }
            catch (int)
            {
                thrown = true;
            }
            ThrowingCopy::copies_until_throw = -1;

            CHECK(thrown);
            CHECK(ThrowingCopy::alive == 3);
        }
        CHECK(ThrowingCopy::alive == 0);
    }

    SECTION("each element destroyed exactly once across siblings")
    {
        Tracked::reset_counters();
        {
            sa::fixed_vector<Tracked, 4> a;
            sa::fixed_vector<Tracked, 4> b;
            a.emplace_back(1);
            a.emplace_back(2);
            b.emplace_back(3);
            b.emplace_back(4);

            // destroy one sibling explicitly
            auto moved = sa::move(a);
            moved.clear();
            CHECK(a.empty());
        }
        CHECK(Tracked::alive() == 0);
        CHECK(Tracked::dtor_count == Tracked::ctor_count + Tracked::move_ctor_count);
    }
}

TEST("fixed_vector - comparison and hashing")
{
    SECTION("equality across capacities, spans and arrays")
    {
        auto a = sa::fixed_vector<int, 3>{1, 2};
        auto b = sa::fixed_vector<int, 8>{1, 2};
        int const arr[] = {1, 2};

        CHECK(a == b);
        CHECK(b == a);
        CHECK(a == arr);
        CHECK(a == b.as_span());
        CHECK(!(a == sa::fixed_vector<int, 3>{1, 3}));
        CHECK(!test::elements_equal(a, {1}));
        CHECK(a != a.subspan(1));
    }

    SECTION("lexicographic order")
    {
        using vec = sa::fixed_vector<int, 4>;
        auto const empty = vec{};
        auto const v0 = vec{0};
        auto const v12 = vec{1, 2};
        auto const v120 = vec{1, 2, 0};
        auto const v13 = vec{1, 3};
        auto const v199 = vec{1, 9, 9};
        auto const v2 = vec{2};

        CHECK(v12 < v13);
        CHECK(v12 < v120);
        CHECK(empty < v0);
        CHECK(v2 > v199);
        CHECK(v12 <= v12);
        CHECK((v12 <=> v12) == 0);
    }

    SECTION("ordering across capacities")
    {
        auto const small = sa::fixed_vector<int, 2>{1, 2};
        auto const large = sa::fixed_vector<int, 8>{1, 2, 0};

        CHECK(small < large);
        CHECK(large > small);
        CHECK((small <=> sa::fixed_vector<int, 8>{1, 2}) == 0);
        CHECK(sa::fixed_vector<int, 8>{1, 3} > small);
    }

    SECTION("hash is order sensitive and equal for equal content")
    {
        using vec = sa::fixed_vector<int, 4>;
        auto const h = std::hash<vec>{};
        CHECK(h(vec{1, 2, 3}) == h(vec{1, 2, 3}));
        CHECK(h(vec{1, 2, 3}) != h(vec{3, 2, 1}));

        std::unordered_set<vec> set;
        set.insert(vec{1, 2});
        set.insert(vec{1, 2});
        set.insert(vec{2, 1});
        CHECK(set.size() == 2);
    }
}
