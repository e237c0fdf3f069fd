#include "cachify/key_template.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace cachify;

namespace {

struct Customer {
  long long id{0};
  std::string region;
};

Value to_value(const Customer &c) {
  return Value(Value::Object{{"id", c.id}, {"region", c.region}});
}

struct Order {
  Customer customer;
  std::vector<std::string> items;
};

Value to_value(const Order &o) {
  return Value(Value::Object{{"customer", to_value(o.customer)},
                             {"items", cachify::to_value(o.items)}});
}

struct Handle {
  int fd{-1};
};

} // namespace

TEST_CASE("Named placeholders resolve from bound arguments", "[key]") {
  KeyTemplate t("read_user-{user_id}");
  CHECK(t.resolve(bind_arguments({"user_id"}, 42)) == "read_user-42");
  CHECK(t.resolve(bind_arguments({"user_id"}, std::string("abc"))) ==
        "read_user-abc");
}

TEST_CASE("A pattern without placeholders is a constant key", "[key]") {
  KeyTemplate t("global-report");
  CHECK(t.placeholders().empty());
  CHECK(t.resolve(bind_arguments({"a"}, 1)) == "global-report");
  CHECK(t.resolve(bind_arguments({"a"}, 2)) == "global-report");
}

TEST_CASE("Attribute and index access walk into structured values",
          "[key]") {
  Order o{{7, "eu"}, {"apple", "pear"}};
  KeyTemplate t("order-{order.customer.id}-{order.items[1]}-{order[customer]"
                "[region]}");
  t.check_params({"order"});
  CHECK(t.resolve(bind_arguments({"order"}, o)) == "order-7-pear-eu");
}

TEST_CASE("Positional placeholders use argument order", "[key]") {
  KeyTemplate manual("{1}:{0}");
  CHECK(manual.resolve(bind_arguments({"a", "b"}, 1, 2)) == "2:1");

  KeyTemplate automatic("{}-{}");
  CHECK(automatic.resolve(bind_arguments({"a", "b"}, "x", "y")) == "x-y");

  KeyTemplate automatic_path("{.id}/{}");
  CHECK(automatic_path.resolve(bind_arguments(
            {"c", "n"}, Customer{9, "us"}, 3)) == "9/3");
}

TEST_CASE("Doubled braces are literal", "[key]") {
  KeyTemplate t("{{raw}}-{x}");
  CHECK(t.resolve(bind_arguments({"x"}, true)) == "{raw}-true");
}

TEST_CASE("Malformed patterns are rejected at construction", "[key]") {
  CHECK_THROWS_AS(KeyTemplate("user-{id"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("user-}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("user-{id!r}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("user-{id:>10}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("{}-{0}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("{a[}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("{a[0]x}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("{9-bad}"), KeyResolutionError);
  CHECK_THROWS_AS(KeyTemplate("{99999999999999999999999}"),
                  KeyResolutionError);
}

TEST_CASE("check_params rejects placeholders naming no parameter", "[key]") {
  KeyTemplate t("u-{user}-{1}");
  CHECK_NOTHROW(t.check_params({"user", "other"}));
  CHECK_THROWS_AS(t.check_params({"id", "other"}), KeyResolutionError);
  CHECK_THROWS_AS(t.check_params({"user"}), KeyResolutionError);
}

TEST_CASE("Resolution failures raise KeyResolutionError", "[key]") {
  KeyTemplate attr("{c.missing}");
  CHECK_THROWS_AS(attr.resolve(bind_arguments({"c"}, Customer{})),
                  KeyResolutionError);

  KeyTemplate index("{v[5]}");
  CHECK_THROWS_AS(
      index.resolve(bind_arguments({"v"}, std::vector<int>{1, 2})),
      KeyResolutionError);

  KeyTemplate on_scalar("{n.field}");
  CHECK_THROWS_AS(on_scalar.resolve(bind_arguments({"n"}, 5)),
                  KeyResolutionError);
}

TEST_CASE("Arguments without to_value may be passed but not rendered",
          "[key]") {
  KeyTemplate t("conn-{id}");
  CHECK(t.resolve(bind_arguments({"handle", "id"}, Handle{3}, 8)) ==
        "conn-8");

  KeyTemplate uses_handle("conn-{handle}");
  CHECK_THROWS_AS(uses_handle.resolve(bind_arguments({"handle"}, Handle{3})),
                  KeyResolutionError);
}

TEST_CASE("bind_arguments checks the declared arity", "[key]") {
  CHECK_THROWS_AS(bind_arguments({"a", "b"}, 1), KeyResolutionError);
  CHECK_THROWS_AS(bind_arguments({}, 1), KeyResolutionError);
}

TEST_CASE("Equal arguments always give the same key", "[key]") {
  KeyTemplate t("u-{u}");
  const auto a = t.resolve(bind_arguments({"u"}, Customer{1, "A"}));
  const auto b = t.resolve(bind_arguments({"u"}, Customer{1, "A"}));
  CHECK(a == b);
  CHECK(a == R"(u-{"id":1,"region":"A"})");
}
