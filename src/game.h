#pragma once

#include <cstdint>

#include "agent.h"
#include "board.h"

enum GameOutcome : int8_t {
  WON,
  LOST,
  EXHAUSTED,  // Nothing left to reveal, yet the flags don't match the mines.
};

const char* outcome_name(GameOutcome outcome);

struct GameResult {
  GameOutcome outcome;
  int moves;
  int safe_moves;
  int random_moves;
  int mines_flagged;
  MoveType last_move;  // STUCK if no move was made.
};

// Lets `agent` play on `board` until it wins, hits a mine or runs out of moves.
// With `verbose`, prints every move to stdout.
GameResult play_game(const Board& board, Agent& agent, bool verbose = false);
