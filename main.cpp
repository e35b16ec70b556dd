#include "board.h"
#include "display.h"
#include "logger.h"

#include <cstring>
#include <iostream>
#include <vector>

#include <spdlog/spdlog.h>

using namespace tb;

/**
 * Drop a fixed sequence of pieces straight down, clearing rows after each
 * placement, and print the board. Pass --log to write the board log.
 */
int main(int argc, char *argv[])
{
  bool use_logging = argc > 1 && std::strcmp(argv[1], "--log") == 0;
  spdlog::set_level(use_logging ? spdlog::level::debug : spdlog::level::info);
  tb::log::init_logger(use_logging);

  const std::vector<std::pair<Piece, int>> drops{
      {Piece::parse("0 0 1 0 2 0 3 0"), 0},
      {Piece::parse("0 0 0 1 1 0 1 1"), 4},
      {Piece::parse("0 0 1 0 1 1 2 0"), 6},
      {Piece::parse("0 0 0 1 0 2 0 3"), 9},
      {Piece::parse("0 0 1 0 1 1 2 1"), 0},
      {Piece::parse("0 0 0 1 0 2 1 0"), 3},
  };

  Board board;
  board.new_game();
  int total_cleared = 0;

  for (const auto &[piece, x] : drops)
    {
      int y = board.drop_height(piece, x);
      PlaceResult res = board.place(piece, x, y);
      if (is_error(res))
        {
          spdlog::warn("Cannot drop {} at column {}: {}", display::to_string(piece), x, to_string(res));
          board.undo();
          continue;
        }
      if (res == PlaceResult::RowFilled)
        {
          total_cleared += board.clear_rows();
        }
      board.commit();

      if (board.max_height() >= board.height())
        {
          std::cout << "Game over" << std::endl;
          break;
        }
    }

  std::cout << board << std::endl;
  std::cout << "Rows cleared : " << total_cleared << std::endl;

  return 0;
}
