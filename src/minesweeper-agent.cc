#include <cstdint>
#include <iostream>
#include <string>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_format.h"

#include "agent.h"
#include "board.h"
#include "game.h"
#include "minesweeper.h"
#include "random.h"

ABSL_FLAG(int, height, 8, "Board height.");
ABSL_FLAG(int, width, 8, "Board width.");
ABSL_FLAG(int, mines, 8, "Number of mines.");
ABSL_FLAG(uint64_t, seed, 0, "Random seed, 0 for a random one. Game i places mines with seed + 2i "
          "and guesses with seed + 2i + 1.");
ABSL_FLAG(int, games, 1, "How many games to play.");
ABSL_FLAG(bool, verbose, false, "Print every move.");


int main(int argc, char **argv) {
  absl::SetProgramUsageMessage("Plays minesweeper with a knowledge based agent.\n");
  absl::ParseCommandLine(argc, argv);

  Dims dims(absl::GetFlag(FLAGS_height), absl::GetFlag(FLAGS_width));
  int mines = absl::GetFlag(FLAGS_mines);
  int games = absl::GetFlag(FLAGS_games);
  uint64_t seed = resolve_seed(absl::GetFlag(FLAGS_seed));
  bool verbose = absl::GetFlag(FLAGS_verbose);

  std::cout << absl::StrFormat("Board: %dx%d, mines: %d, seed: %d\n",
                               dims.height, dims.width, mines, seed);

  int won = 0;
  int lost = 0;
  int stuck = 0;
  try {
    for (int i = 0; i < games; ++i) {
      // Separate streams for the board and the agent, so the agent's guesses
      // don't depend on how the mines were placed.
      Board board(dims, mines, seed + 2 * i);
      Agent agent(dims, seed + 2 * i + 1);
      if (verbose) {
        std::cout << board;
      }

      GameResult result = play_game(board, agent, verbose);
      std::cout << absl::StrFormat(
          "Game %d: %s after %d moves (%d safe, %d random), flagged %d of %d mines\n",
          i, outcome_name(result.outcome), result.moves, result.safe_moves,
          result.random_moves, result.mines_flagged, board.mine_count());

      switch (result.outcome) {
        case WON:       won++;   break;
        case LOST:      lost++;  break;
        case EXHAUSTED: stuck++; break;
      }
    }
  } catch(const std::exception& ex) {
    std::cout << "exception: " << ex.what() << std::endl;
    return 1;
  }

  std::cout << absl::StrFormat("Won %d, lost %d, stuck %d of %d games (%.1f%% won)\n",
                               won, lost, stuck, games, games > 0 ? 100.0 * won / games : 0.0);
  return 0;
}
