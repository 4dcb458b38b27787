#include "game.h"

#include <iostream>
#include <stdexcept>

#include "absl/strings/str_format.h"

#include "agent.h"
#include "board.h"
#include "minesweeper.h"

const char* outcome_name(GameOutcome outcome) {
  switch (outcome) {
    case WON:       return "won";
    case LOST:      return "lost";
    case EXHAUSTED: return "stuck";
  }
  return "unknown";
}

GameResult play_game(const Board& board, Agent& agent, bool verbose) {
  if (board.dims() != agent.knowledge().dims()) {
    throw std::invalid_argument("The agent and board must be the same size");
  }

  GameResult result{EXHAUSTED, 0, 0, 0, 0, STUCK};
  while (true) {
    // Flag everything the agent has proven.
    if (board.all_mines_flagged(agent.knowledge().mines())) {
      result.outcome = WON;
      break;
    }

    Move move = agent.choose_move();
    if (move.type == STUCK) {
      if (verbose) {
        std::cout << "No moves left\n";
      }
      result.outcome = EXHAUSTED;
      break;
    }

    result.moves++;
    result.last_move = move.type;
    if (move.type == SAFE) {
      result.safe_moves++;
    } else {
      result.random_moves++;
    }

    if (board.is_mine(move.cell)) {
      if (verbose) {
        std::cout << absl::StrFormat("%s move {%d, %d}: mine!\n",
                                     move.type == SAFE ? "Safe" : "Random",
                                     move.cell.row, move.cell.col);
        std::cout << board;
      }
      result.outcome = LOST;
      break;
    }

    int count = board.adjacent_mine_count(move.cell);
    agent.observe(move.cell, count);
    if (verbose) {
      std::cout << absl::StrFormat("%s move {%d, %d}: %d, known safe %d, known mines %d, sentences %d\n",
                                   move.type == SAFE ? "Safe" : "Random",
                                   move.cell.row, move.cell.col, count,
                                   agent.knowledge().safes().size(),
                                   agent.knowledge().mines().size(),
                                   agent.knowledge().sentences().size());
    }
  }
  result.mines_flagged = agent.knowledge().mines().size();
  return result;
}
