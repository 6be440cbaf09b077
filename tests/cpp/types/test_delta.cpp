#include <catch2/catch_test_macros.hpp>
#include <deltaflow/types/delta.h>

#include <fmt/format.h>

#include <string>

using namespace deltaflow;

TEST_CASE("Delta - negate flips the direction", "[delta]") {
    CHECK(negate(Delta::Insert) == Delta::Retract);
    CHECK(negate(Delta::Retract) == Delta::Insert);
    CHECK(negate(negate(Delta::Insert)) == Delta::Insert);
}

TEST_CASE("Delta - weight is the signed multiplicity change", "[delta]") {
    CHECK(weight(Delta::Insert) == 1);
    CHECK(weight(Delta::Retract) == -1);
    static_assert(weight(Delta::Insert) + weight(Delta::Retract) == 0);
}

TEST_CASE("Delta - to_string and fmt", "[delta]") {
    CHECK(to_string(Delta::Insert) == "Insert");
    CHECK(to_string(Delta::Retract) == "Retract");
    CHECK(fmt::format("{}", Delta::Retract) == "Retract");
}

TEST_CASE("Change - construction helpers and equality", "[delta]") {
    auto ins = insert_of(5);
    auto ret = retract_of(5);

    CHECK(ins.is_insert());
    CHECK_FALSE(ins.is_retract());
    CHECK(ret.is_retract());
    CHECK(ins == Change{5, Delta::Insert});
    CHECK(ins != ret);
    CHECK(insert_of(std::string{"a"}) != insert_of(std::string{"b"}));
}

TEST_CASE("Change - formats with a sign prefix", "[delta]") {
    CHECK(fmt::format("{}", insert_of(5)) == "+5");
    CHECK(fmt::format("{}", retract_of(std::string{"x"})) == "-x");
}
