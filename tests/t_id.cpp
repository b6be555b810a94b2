#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <set>
#include <type_traits>
#include <unordered_set>
#include <vector>

#include "catch2/catch_all.hpp"

#include "tagid/tagid_id.hpp"

namespace tagid::tests
{
    struct player_tag
    {
    };

    struct enemy_tag
    {
    };

    struct named_tag
    {
        static constexpr std::string_view tag_name = "named";
    };

    struct sentinel_tag
    {
    };

    struct escape_tag
    {
    };

    struct collision_tag
    {
    };

    struct ordering_tag
    {
    };

    template <typename lhs_t, typename rhs_t>
    concept can_compare_equal = requires(const lhs_t& lhs, const rhs_t& rhs) { lhs == rhs; };

    template <typename lhs_t, typename rhs_t>
    concept can_compare_less = requires(const lhs_t& lhs, const rhs_t& rhs) { lhs < rhs; };

    template <typename lhs_t, typename rhs_t>
    concept can_compare_three_way = requires(const lhs_t& lhs, const rhs_t& rhs) { lhs <=> rhs; };
}

namespace tagid::tests
{
    using player_id = id<player_tag>;
    using enemy_id = id<enemy_tag>;

    static_assert(can_compare_equal<player_id, player_id>);
    static_assert(can_compare_less<player_id, player_id>);
    static_assert(can_compare_three_way<player_id, player_id>);
    static_assert(std::totally_ordered<player_id>);

    static_assert(!can_compare_equal<player_id, enemy_id>);
    static_assert(!can_compare_less<player_id, enemy_id>);
    static_assert(!can_compare_three_way<player_id, enemy_id>);
    static_assert(!can_compare_equal<player_id, id_u32<player_tag>>);
    static_assert(!can_compare_equal<player_id, std::size_t>);

    static_assert(!std::is_convertible_v<enemy_id, player_id>);
    static_assert(!std::is_assignable_v<player_id&, enemy_id>);
    static_assert(!std::is_constructible_v<player_id, std::size_t>);
    static_assert(!std::is_convertible_v<player_id, std::size_t>);

    static_assert(sizeof(player_id) == sizeof(std::size_t));
    static_assert(sizeof(id_u8<player_tag>) == sizeof(std::uint8_t));
    static_assert(sizeof(id_u16<player_tag>) == sizeof(std::uint16_t));
    static_assert(sizeof(id_u32<player_tag>) == sizeof(std::uint32_t));
    static_assert(sizeof(id_u64<player_tag>) == sizeof(std::uint64_t));
    static_assert(std::is_trivially_copyable_v<player_id>);

    static_assert(player_id().value() == 1);
    static_assert(player_id::unchecked(7).value() == 7);
    static_assert(player_id::unchecked(7) < player_id::unchecked(8));
}

TEST_CASE("tagid::id", "[tagid][tagid::id]")
{
    using namespace tagid;
    using namespace tagid::tests;

    SECTION("minted ids are distinct and increasing")
    {
        const player_id id1 = player_id::mint();
        const player_id id2 = player_id::mint();

        CHECK(id1 != id2);
        CHECK(id1.value() != id2.value());
        CHECK(id2 > id1);
        CHECK(id2.value() > id1.value());
        CHECK(id1.value() != 0);
        CHECK(id2.value() != 0);
    }

    SECTION("default construction yields the sentinel without minting")
    {
        using id_type = id<sentinel_tag>;

        const id_type sentinel;

        CHECK(sentinel.value() == 1);
        CHECK(id_type::counter_type::minted() == 0);

        const id_type first = id_type::mint();

        CHECK(first.value() == 1);
        CHECK(first == sentinel);
    }

    SECTION("unchecked construction leaves the counter alone")
    {
        using id_type = id_u32<escape_tag>;

        const id_type minted = id_type::mint();
        const id_type external = id_type::unchecked(1000);

        CHECK(external.value() == 1000);
        CHECK(id_type::counter_type::minted() == 1);
        CHECK(id_type::mint().value() == minted.value() + 1);
    }

    SECTION("unchecked construction can collide with minted ids")
    {
        using id_type = id<collision_tag>;

        const id_type external = id_type::unchecked(1);
        const id_type minted = id_type::mint();

        // uniqueness is the caller's responsibility
        CHECK(external == minted);
    }

    SECTION("ids are totally ordered by value")
    {
        using id_type = id_u16<ordering_tag>;

        const id_type low = id_type::unchecked(3);
        const id_type high = id_type::unchecked(9);

        CHECK(low < high);
        CHECK(low <= high);
        CHECK(high > low);
        CHECK(high >= low);
        CHECK(low != high);
        CHECK((low <=> high) == std::strong_ordering::less);
        CHECK((high <=> low) == std::strong_ordering::greater);
        CHECK((low <=> id_type::unchecked(3)) == std::strong_ordering::equal);

        const std::set<id_type> ordered {high, low, id_type::unchecked(5)};
        std::vector<std::uint16_t> values;
        for (const id_type& identifier : ordered)
        {
            values.push_back(identifier.value());
        }

        CHECK(values == std::vector<std::uint16_t>({3, 5, 9}));
    }

    SECTION("equal ids hash equally")
    {
        const player_id identifier = player_id::unchecked(77);
        const player_id same = player_id::unchecked(77);

        CHECK(std::hash<player_id>()(identifier) == std::hash<player_id>()(same));

        std::unordered_set<player_id> ids {identifier, same, player_id::unchecked(78)};
        CHECK(ids.size() == 2);
        CHECK(ids.contains(player_id::unchecked(78)));
    }

    SECTION("value is unchanged by copies, comparisons and hashing")
    {
        const player_id identifier = player_id::mint();
        const auto value = identifier.value();

        player_id copy = identifier;
        const player_id other = player_id::mint();

        for (std::size_t index = 0; index < 10; ++index)
        {
            (void) (copy == other);
            (void) (copy < other);
            (void) std::hash<player_id>()(copy);
            copy = player_id(identifier);
        }

        CHECK(identifier.value() == value);
        CHECK(copy.value() == value);
        CHECK(copy == identifier);
    }

    SECTION("format")
    {
        CHECK(std::format("{}", player_id::unchecked(43)) == "43");
        CHECK(to_string(player_id::unchecked(43)) == "43");
        CHECK(std::format("{:?}", player_id::unchecked(42)) == "id<tagid::tests::player_tag>(42)");
        CHECK(std::format("{:?}", id_u16<named_tag>::unchecked(1337)) == "id<named>(1337)");
        CHECK(std::format("{:?}", id_u8<named_tag>::unchecked(200)) == "id<named>(200)");
        CHECK(std::format("[{}]", id<unsigned int>::unchecked(5)) == "[5]");
    }
}
