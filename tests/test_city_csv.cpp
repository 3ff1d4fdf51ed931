#include <catch2/catch.hpp>

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "geospread/city_csv.hpp"

using namespace geospread;

TEST_CASE("split_csv_line honours quotes", "[csv]")
{
    const auto f = split_csv_line("1,\"Washington, D.C.\",\"say \"\"hi\"\"\",38.9\r");
    REQUIRE(f.size() == 4);
    REQUIRE(f[1] == "Washington, D.C.");
    REQUIRE(f[2] == "say \"hi\"");
    REQUIRE(f[3] == "38.9");
    REQUIRE_THROWS_AS(split_csv_line("1,\"open"), std::runtime_error);
}

TEST_CASE("read_city_csv loads a simplemaps-style catalog", "[csv]")
{
    std::istringstream in(
        "\"city\",\"lat\",\"lng\",\"country\",\"population\",\"id\"\n"
        "\"Tokyo\",\"35.6897\",\"139.6922\",\"Japan\",\"37732000\",\"1392685764\"\n"
        "\"Jakarta\",\"-6.1750\",\"106.8275\",\"Indonesia\",\"33756000\",\"1360771077\"\n"
        "\"Nowhere\",\"\",\"\",\"Atlantis\",\"5\",\"42\"\n"
        "\n");
    const auto table = read_city_csv(in);

    REQUIRE(table.rows_read == 3);
    REQUIRE(table.cities.size() == 3);
    REQUIRE(table.rows_missing_coordinates == 1);
    REQUIRE(table.cities[0].name == "Tokyo");
    REQUIRE(table.cities[0].id == 1392685764);
    REQUIRE(table.cities[0].lat == Approx(35.6897));
    REQUIRE(table.cities[1].population == Approx(33756000.0));
    REQUIRE(std::isnan(table.cities[2].lat));
    REQUIRE_FALSE(has_valid_coordinates(table.cities[2]));
}

TEST_CASE("read_city_csv applies the population floor and default ids", "[csv]")
{
    std::istringstream in(
        "name,lat,lng,population\n"
        "a,1,1,100\n"
        "b,2,2,10\n"
        "c,3,3,\n"
        "d,4,4,500\n");
    ReadCityCsvOptions opt;
    opt.population_min = 50.0;
    const auto table = read_city_csv(in, opt);

    REQUIRE(table.rows_read == 4);
    REQUIRE(table.rows_below_population_min == 2);
    REQUIRE(table.cities.size() == 2);
    REQUIRE(table.cities[0].id == 0);
    REQUIRE(table.cities[1].id == 3);
    REQUIRE(table.cities[1].name == "d");
}

TEST_CASE("read_city_csv reports schema problems as SchemaError", "[csv]")
{
    SECTION("no coordinate columns")
    {
        std::istringstream in("id,city,population\n1,a,5\n");
        REQUIRE_THROWS_AS(read_city_csv(in), SchemaError);
    }
    SECTION("longitude column missing")
    {
        std::istringstream in("id,lat,population\n1,5,5\n");
        REQUIRE_THROWS_AS(read_city_csv(in), SchemaError);
    }
    SECTION("population column missing")
    {
        std::istringstream in("id,lat,lng\n1,5,5\n");
        REQUIRE_THROWS_AS(read_city_csv(in), SchemaError);
    }
    SECTION("empty input")
    {
        std::istringstream in("");
        REQUIRE_THROWS_AS(read_city_csv(in), SchemaError);
    }
}

TEST_CASE("read_city_csv rejects malformed rows", "[csv]")
{
    SECTION("bad number")
    {
        std::istringstream in("id,lat,lng,population\n1,north,5,5\n");
        REQUIRE_THROWS_WITH(read_city_csv(in), Catch::Contains("line 2"));
    }
    SECTION("duplicate id")
    {
        std::istringstream in("id,lat,lng,population\n1,1,1,5\n1,2,2,5\n");
        REQUIRE_THROWS_WITH(read_city_csv(in), Catch::Contains("duplicate id"));
    }
    SECTION("negative population")
    {
        std::istringstream in("id,lat,lng,population\n1,1,1,-5\n");
        REQUIRE_THROWS_AS(read_city_csv(in), std::runtime_error);
    }
    SECTION("column count mismatch")
    {
        std::istringstream in("id,lat,lng,population\n1,1,1\n");
        REQUIRE_THROWS_AS(read_city_csv(in), std::runtime_error);
    }
}

TEST_CASE("write_selection_csv output reads back as a catalog", "[csv]")
{
    std::vector<CityRecord> cities(2);
    cities[0].id = 7;
    cities[0].name = "Washington, D.C.";
    cities[0].lat = 38.9047;
    cities[0].lng = -77.0163;
    cities[0].population = 5379184;
    cities[1].id = 3;
    cities[1].name = "Quito";
    cities[1].lat = -0.22;
    cities[1].lng = -78.5125;
    cities[1].population = 2011388;

    std::ostringstream out;
    write_selection_csv(out, cities);
    REQUIRE(out.str().rfind("rank,id,city,lat,lng,population\n", 0) == 0);

    std::istringstream in(out.str());
    const auto table = read_city_csv(in);
    REQUIRE(table.cities.size() == 2);
    REQUIRE(table.cities[0].name == "Washington, D.C.");
    REQUIRE(table.cities[0].id == 7);
    REQUIRE(table.cities[0].lat == cities[0].lat);
    REQUIRE(table.cities[1].lng == cities[1].lng);
}
