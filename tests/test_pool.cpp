#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <random>
#include <set>
#include <edudraw/pool.hpp>
#include <edudraw/random.hpp>

using namespace edudraw;

TEST_CASE("full_pool and filter_pool") {
  REQUIRE(full_pool(0).empty());
  REQUIRE(full_pool(4) == IndexPool{0, 1, 2, 3});

  SECTION("stale indices are dropped, order kept") {
    REQUIRE(filter_pool({5, 1, 3, 0}, 4) == IndexPool{1, 3, 0});
    REQUIRE(filter_pool({7, 9}, 4).empty());
  }
}

TEST_CASE("draw_from_pool without repeats") {
  std::mt19937 rng(2024);
  IndexPool pool = full_pool(5);
  std::set<std::size_t> seen;

  for (int i = 0; i < 5; ++i) {
    DrawError why{DrawError::EmptyList};
    auto d = draw_from_pool(5, pool, true, rng, &why);
    REQUIRE(d.has_value());
    REQUIRE(why == DrawError::None);
    REQUIRE(d->index < 5);
    REQUIRE(std::find(pool.begin(), pool.end(), d->index) != pool.end());
    REQUIRE(d->pool.size() == pool.size() - 1);
    REQUIRE(is_drawn(d->pool, d->index, true));
    seen.insert(d->index);
    pool = d->pool;
  }
  REQUIRE(seen.size() == 5);  // every item exactly once

  SECTION("exhausted pool reports PoolExhausted") {
    DrawError why{DrawError::None};
    REQUIRE_FALSE(draw_from_pool(5, pool, true, rng, &why).has_value());
    REQUIRE(why == DrawError::PoolExhausted);
  }
}

TEST_CASE("draw_from_pool with repeats allowed") {
  std::mt19937 rng(7);
  const IndexPool pool{2};  // ignored when repeats are allowed
  std::set<std::size_t> seen;
  for (int i = 0; i < 200; ++i) {
    auto d = draw_from_pool(3, pool, false, rng);
    REQUIRE(d.has_value());
    REQUIRE(d->pool == pool);
    seen.insert(d->index);
  }
  REQUIRE(seen.size() == 3);
  REQUIRE_FALSE(is_drawn(IndexPool{}, 0, false));
}

TEST_CASE("draw_from_pool edge cases") {
  std::mt19937 rng(1);

  SECTION("empty list") {
    DrawError why{DrawError::None};
    REQUIRE_FALSE(draw_from_pool(0, {}, true, rng, &why).has_value());
    REQUIRE(why == DrawError::EmptyList);
    REQUIRE_FALSE(draw_from_pool(0, {}, false, rng, &why).has_value());
    REQUIRE(why == DrawError::EmptyList);
  }

  SECTION("pool holding only indices past a shrunk list counts as exhausted") {
    DrawError why{DrawError::None};
    REQUIRE_FALSE(draw_from_pool(2, {4, 5}, true, rng, &why).has_value());
    REQUIRE(why == DrawError::PoolExhausted);
  }

  SECTION("single candidate is always picked") {
    auto d = draw_from_pool(3, {1}, true, rng);
    REQUIRE(d.has_value());
    REQUIRE(d->index == 1);
    REQUIRE(d->pool.empty());
  }
}

TEST_CASE("fisher_yates permutes in place") {
  std::mt19937 rng(99);
  std::vector<int> v{1, 2, 3, 4, 5, 6, 7, 8};
  auto sorted = v;
  fisher_yates(v, rng);
  auto check = v;
  std::sort(check.begin(), check.end());
  REQUIRE(check == sorted);

  std::vector<int> one{42};
  fisher_yates(one, rng);
  REQUIRE(one == std::vector<int>{42});
}
