#ifndef __TB_DISPLAY_H_
#define __TB_DISPLAY_H_

#include <string>

namespace tb {

class Board;
class Piece;

} // namespace tb

namespace tb::display {

/**
 * The rows of the board from top to bottom between two walls,
 * filled cells as '+', followed by the floor.
 */
extern std::string to_string(const Board& board);

/**
 * The bounding box of the piece from top to bottom, without borders.
 */
extern std::string to_string(const Piece& piece);

} // namespace tb::display

#endif
