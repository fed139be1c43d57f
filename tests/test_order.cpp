#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "schemaver/lib.hpp"
#include "schemaver/order.hpp"

using namespace schemaver;

static std::vector<std::array<int, 3>> items_of(const std::vector<Order>& orders) {
    std::vector<std::array<int, 3>> ret;
    for (const auto& o : orders) ret.push_back(o.items());
    return ret;
}

TEST_CASE("Natural order compares the triple") {
    REQUIRE(Order(0, 0, 1) < Order(0, 1, 0));
    REQUIRE(Order(1, 0, 0) > Order(0, 9, 9));
    REQUIRE(Order(2, 3, 4).compare(Order(2, 3, 4)) == 0);
    REQUIRE(Order(1, 2, 3).str() == "(1, 2, 3)");

    // labels do not take part in simple comparisons
    REQUIRE(Order(0, 0, 0, {"x"}).compare(Order(0, 0, 0, {}, {"y"})) == 0);
}

TEST_CASE("Labels are cleaned") {
    Order o(0, 0, 0, {"Widgets_Table!", "!!"}, {"Schema.Orders"});
    REQUIRE(o.occurs_before() == std::vector<std::string> {"widgetstable"});
    REQUIRE(o.occurs_after() == std::vector<std::string> {"schema.orders"});
}

TEST_CASE("Order from items needs three values") {
    REQUIRE(Order::from_items({1, 2, 3}).items() == std::array<int, 3> {1, 2, 3});
    REQUIRE_THROWS_AS(Order::from_items({1, 2}), OrderError);
    REQUIRE_THROWS_AS(Order::from_items({1, 2, 3, 4}), OrderError);
}

TEST_CASE("Full sort without labels keeps the natural order") {
    std::vector<Order> orders {
        Order(1, 0, 0), Order(0, 2, 0), Order(0, 0, 5), Order(0, 2, 1), Order(0, 0, 1),
    };
    auto sorted = Order::full_sort(orders);
    REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {
        {0, 0, 1}, {0, 0, 5}, {0, 2, 0}, {0, 2, 1}, {1, 0, 0},
    });
}

TEST_CASE("Full sort of equal orders keeps the input order") {
    std::vector<Order> orders {Order(0, 0, 1, {"first"}), Order(0, 0, 1, {"second"})};
    auto sorted = Order::full_sort(orders);
    REQUIRE(sorted[0].occurs_before() == std::vector<std::string> {"first"});
    REQUIRE(sorted[1].occurs_before() == std::vector<std::string> {"second"});
}

TEST_CASE("Occurs after a named order moves it down") {
    Order c(0, 0, 0, {}, {"D"});
    Order d(0, 0, 1);

    SECTION("label mapped to an order") {
        auto sorted = Order::full_sort({c, d}, {{"D", 1}});
        REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {{0, 0, 1}, {0, 0, 0}});
    }
    SECTION("unmapped label is only a placeholder") {
        auto sorted = Order::full_sort({c, d});
        REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {{0, 0, 0}, {0, 0, 1}});
    }
}

TEST_CASE("Occurs before a named order moves it up") {
    Order a(0, 0, 0);
    Order b(0, 0, 1);
    Order c(0, 0, 2, {"a"});
    auto sorted = Order::full_sort({a, b, c}, {{"a", 0}});
    REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {{0, 0, 2}, {0, 0, 0}, {0, 0, 1}});
}

TEST_CASE("A placeholder label chains two orders") {
    Order a(0, 0, 0, {}, {"z"});
    Order b(0, 0, 1, {"z"});
    auto sorted = Order::full_sort({a, b});
    REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {{0, 0, 1}, {0, 0, 0}});
}

TEST_CASE("Orders are visited before placeholder labels") {
    // were the label visited first, it would pull b ahead of a
    Order a(0, 0, 0);
    Order b(0, 0, 1, {"x"});
    auto sorted = Order::full_sort({a, b});
    REQUIRE(items_of(sorted) == std::vector<std::array<int, 3>> {{0, 0, 0}, {0, 0, 1}});
}

TEST_CASE("Sort indices point into the input") {
    Order a(0, 0, 3);
    Order b(0, 0, 1);
    Order c(0, 0, 2);
    auto idx = Order::sort_indices({&a, &b, &c});
    REQUIRE(idx == std::vector<std::size_t> {1, 2, 0});
}

TEST_CASE("Cyclic dependencies fail") {
    SECTION("two orders naming each other") {
        Order a(0, 0, 0, {"x"});
        Order b(0, 0, 1, {"a"});
        REQUIRE_THROWS_AS(Order::full_sort({a, b}, {{"a", 0}, {"x", 1}}), CyclicDependencyError);
        REQUIRE_THROWS_WITH(Order::full_sort({a, b}, {{"a", 0}, {"x", 1}}),
                            Catch::Contains("cyclic dependency in orders"));
    }
    SECTION("before and after the same placeholder") {
        Order a(0, 0, 0, {"x"}, {"x"});
        REQUIRE_THROWS_AS(Order::full_sort({a}), CyclicDependencyError);
    }
    SECTION("an order after itself") {
        Order a(0, 0, 0, {}, {"self"});
        REQUIRE_THROWS_AS(Order::full_sort({a}, {{"self", 0}}), CyclicDependencyError);
    }
    SECTION("a longer loop through a placeholder") {
        Order a(0, 0, 0, {"mid"}, {"c"});
        Order b(0, 0, 1, {}, {"mid"});
        Order c(0, 0, 2, {}, {"b"});
        REQUIRE_THROWS_AS(Order::full_sort({a, b, c}, {{"b", 1}, {"c", 2}}), OrderError);
    }
}
