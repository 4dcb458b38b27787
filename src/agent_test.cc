#include <optional>

#include "absl/container/flat_hash_map.h"

#include "catch2/catch_all.hpp"

#include "agent.h"
#include "cell.h"
#include "minesweeper.h"


TEST_CASE("Agent", "[agent]") {
  Dims dims(3, 3);
  Agent agent(dims, Catch::getSeed() + 1);

  SECTION("Nothing known, so guess") {
    REQUIRE(agent.choose_safe_move() == std::nullopt);
    Move move = agent.choose_move();
    REQUIRE(move.type == RANDOM);
    REQUIRE(dims.contains(move.cell));
  }

  SECTION("Prefers the smallest safe move") {
    agent.observe({1, 1}, 0);
    REQUIRE(agent.choose_safe_move() == Cell(0, 0));
    REQUIRE(agent.choose_move() == Move{SAFE, {0, 0}});

    agent.observe({0, 0}, 0);
    REQUIRE(agent.choose_move() == Move{SAFE, {0, 1}});
  }

  SECTION("Revealed cells aren't safe moves") {
    agent.observe({0, 0}, 1);
    REQUIRE(agent.knowledge().is_safe({0, 0}));
    REQUIRE(agent.choose_safe_move() == std::nullopt);
  }

  SECTION("Random moves avoid revealed cells and mines") {
    // 3 * .
    // * * .
    // . . .
    agent.observe({0, 0}, 3);
    REQUIRE(agent.knowledge().mines() == CellSet{{0, 1}, {1, 0}, {1, 1}});
    REQUIRE(agent.choose_safe_move() == std::nullopt);

    CellSet allowed{{0, 2}, {1, 2}, {2, 0}, {2, 1}, {2, 2}};
    absl::flat_hash_map<Cell, int> seen;
    for (int i = 0; i < 1000; ++i) {
      std::optional<Cell> c = agent.choose_random_move();
      REQUIRE(c.has_value());
      CAPTURE(*c);
      REQUIRE(allowed.contains(*c));
      seen[*c]++;
    }
    // Each cell is expected 200 times.
    REQUIRE(seen.size() == allowed.size());
    for (const auto& [c, n] : seen) {
      CAPTURE(c, n);
      REQUIRE(n > 100);
      REQUIRE(n < 300);
    }
  }

  SECTION("Stuck once everything is revealed or a mine") {
    Agent small(Dims(1, 2), 7);
    small.observe({0, 0}, 1);
    REQUIRE(small.knowledge().mines() == CellSet{{0, 1}});
    REQUIRE(small.choose_safe_move() == std::nullopt);
    REQUIRE(small.choose_random_move() == std::nullopt);
    REQUIRE(small.choose_move().type == STUCK);
  }

  SECTION("Reset") {
    agent.observe({1, 1}, 0);
    agent.reset();
    REQUIRE(agent.knowledge().safes().empty());
    REQUIRE(agent.choose_move().type == RANDOM);
  }

  SECTION("Same seed, same guesses") {
    Agent a(dims, 42);
    Agent b(dims, 42);
    for (int i = 0; i < 20; ++i) {
      REQUIRE(a.choose_random_move() == b.choose_random_move());
    }
  }
}
