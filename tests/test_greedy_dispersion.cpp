#include <catch2/catch.hpp>

#include <algorithm>
#include <limits>
#include <set>
#include <stdexcept>

#include "geospread/geodesic.hpp"
#include "geospread/greedy_dispersion.hpp"
#include "geospread/omp_utils.hpp"
#include "test_fixtures.hpp"

namespace
{
    using namespace geospread;
    using geospread::test::make_city;

    double isolation(const CityRecord& c, const std::vector<CityRecord>& selected, size_t prefix)
    {
        double best = std::numeric_limits<double>::infinity();
        for (size_t s = 0; s < prefix; ++s)
            best = std::min(best, distance_km(c, selected[s]));
        return best;
    }
}

TEST_CASE("greedy seeds with the most populous city and takes the farthest next", "[greedy]")
{
    const std::vector<CityRecord> pool = {
        make_city(1, "A", 0.0, 0.0, 100.0),
        make_city(2, "B", 0.0, 1.0, 50.0),
        make_city(3, "C", 0.0, 10.0, 10.0),
    };
    GreedyOptions opt;
    opt.n = 2;
    const auto res = greedy_dispersion_select(pool, opt);

    REQUIRE(res.selected.size() == 2);
    REQUIRE(res.selected[0].id == 1);
    REQUIRE(res.selected[1].id == 3);
    REQUIRE_FALSE(res.size_reduced);
    REQUIRE(res.warnings.empty());
    REQUIRE(res.pick_scores[1] == Approx(1111.9492664).epsilon(1e-9));
}

TEST_CASE("greedy tie-breaks follow population order then id", "[greedy]")
{
    SECTION("seed among equally populous cities is the lowest id")
    {
        const std::vector<CityRecord> pool = {
            make_city(9, "x", 10.0, 10.0, 500.0),
            make_city(4, "y", -10.0, 40.0, 500.0),
            make_city(7, "z", 30.0, -40.0, 100.0),
        };
        GreedyOptions opt;
        opt.n = 1;
        REQUIRE(greedy_dispersion_select(pool, opt).selected.front().id == 4);
    }
    SECTION("equal isolation scores pick the earlier city in scan order")
    {
        const std::vector<CityRecord> pool = {
            make_city(1, "hub", 0.0, 0.0, 1000.0),
            make_city(3, "east", 0.0, 10.0, 5.0),
            make_city(2, "west", 0.0, -10.0, 5.0),
        };
        GreedyOptions opt;
        opt.n = 2;
        const auto res = greedy_dispersion_select(pool, opt);
        REQUIRE(res.selected[1].id == 2);
    }
}

TEST_CASE("every greedy pick maximizes the isolation score of its round", "[greedy]")
{
    const auto pool = geospread::test::scattered_cities(60, 7);
    GreedyOptions opt;
    opt.n = 15;
    const auto res = greedy_dispersion_select(pool, opt);
    REQUIRE(res.selected.size() == 15);

    for (size_t r = 1; r < res.selected.size(); ++r)
    {
        const double chosen = isolation(res.selected[r], res.selected, r);
        REQUIRE(res.pick_scores[r] == Approx(chosen));
        for (const auto& c : pool)
        {
            const bool already = std::any_of(res.selected.begin(), res.selected.begin() + static_cast<long>(r),
                                             [&](const CityRecord& s) { return s.id == c.id; });
            if (already)
                continue;
            REQUIRE(chosen >= isolation(c, res.selected, r));
        }
    }
}

TEST_CASE("greedy isolation scores never increase from round to round", "[greedy]")
{
    const auto pool = geospread::test::scattered_cities(80, 11);
    GreedyOptions opt;
    opt.n = 25;
    const auto res = greedy_dispersion_select(pool, opt);
    for (size_t r = 2; r < res.pick_scores.size(); ++r)
        REQUIRE(res.pick_scores[r] <= res.pick_scores[r - 1]);
}

TEST_CASE("parallel merge rule prefers higher scores then earlier positions", "[greedy]")
{
    REQUIRE(better_pick(5.0, 9, -1.0, -1));
    REQUIRE(better_pick(5.0, 9, 4.0, 2));
    REQUIRE_FALSE(better_pick(4.0, 1, 5.0, 9));
    REQUIRE(better_pick(5.0, 2, 5.0, 9));
    REQUIRE_FALSE(better_pick(5.0, 9, 5.0, 2));
}

TEST_CASE("greedy result does not depend on the thread count", "[greedy]")
{
    const auto pool = geospread::test::scattered_cities(120, 3);
    GreedyOptions one;
    one.n = 30;
    one.threads = 1;
    GreedyOptions many = one;
    many.threads = 4;

    const auto a = greedy_dispersion_select(pool, one);
    const auto b = greedy_dispersion_select(pool, many);
    REQUIRE(a.selected.size() == b.selected.size());
    for (size_t i = 0; i < a.selected.size(); ++i)
        REQUIRE(a.selected[i].id == b.selected[i].id);
}

TEST_CASE("greedy shrinks the target when the pool is too small", "[greedy]")
{
    const auto pool = geospread::test::scattered_cities(10, 5);
    GreedyOptions opt;
    opt.n = 50;
    const auto res = greedy_dispersion_select(pool, opt);

    REQUIRE(res.selected.size() == 10);
    REQUIRE(res.size_reduced);
    REQUIRE(res.requested == 50);
    REQUIRE(res.warnings.size() == 1);

    std::set<std::int64_t> ids;
    for (const auto& c : res.selected)
        ids.insert(c.id);
    REQUIRE(ids.size() == 10);
}

TEST_CASE("greedy handles an empty pool and rejects bad input", "[greedy]")
{
    GreedyOptions opt;
    opt.n = 3;
    const auto empty = greedy_dispersion_select({}, opt);
    REQUIRE(empty.selected.empty());
    REQUIRE(empty.size_reduced);

    opt.n = 0;
    REQUIRE_THROWS_AS(greedy_dispersion_select(geospread::test::scattered_cities(4, 1), opt), std::invalid_argument);

    opt.n = 2;
    const std::vector<CityRecord> no_coords = {
        make_city(1, "hub", 0.0, 0.0, 1000.0),
        make_city(2, "lost", std::numeric_limits<double>::quiet_NaN(), 10.0, 5.0),
        make_city(3, "near", 0.0, 1.0, 1.0),
    };
    REQUIRE_THROWS_AS(greedy_dispersion_select(no_coords, opt), std::invalid_argument);
    const std::vector<CityRecord> off_globe = {make_city(1, "a", 0.0, 0.0, 1.0), make_city(2, "b", 95.0, 0.0, 2.0)};
    REQUIRE_THROWS_AS(greedy_dispersion_select(off_globe, opt), std::invalid_argument);

    const std::vector<CityRecord> dup = {make_city(1, "a", 0.0, 0.0, 1.0), make_city(1, "b", 5.0, 5.0, 2.0)};
    REQUIRE_THROWS_AS(greedy_dispersion_select(dup, opt), std::invalid_argument);
}
