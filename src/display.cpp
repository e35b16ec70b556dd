#include "display.h"

#include <sstream>
#include <string>

#include "board.h"
#include "constants.h"
#include "piece.h"

namespace tb::display {

std::string to_string(const Board& board)
{
  std::stringstream ss;

  // For every row, top first
  for (int y = board.height() - 1; y >= 0; --y)
  {
    ss << CHAR_WALL;
    for (int x = 0; x < board.width(); ++x)
    {
      ss << (board.occupied(x, y) ? CHAR_FILLED : CHAR_EMPTY);
    }
    ss << CHAR_WALL << '\n';
  }
  ss << std::string(board.width() + 2, CHAR_FLOOR);

  return ss.str();
}

std::string to_string(const Piece& piece)
{
  std::string cells(piece.width() * piece.height(), CHAR_EMPTY);
  for (const auto& pt : piece.body())
  {
    cells[pt.x + piece.width() * pt.y] = CHAR_FILLED;
  }

  std::stringstream ss;
  for (int y = piece.height() - 1; y >= 0; --y)
  {
    ss << cells.substr(piece.width() * y, piece.width()) << '\n';
  }
  return ss.str();
}

} // namespace tb::display
