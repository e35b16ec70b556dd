#ifndef __TB_PIECE_H_
#define __TB_PIECE_H_

#include <iosfwd>
#include <string_view>
#include <vector>

#include "types.h"

namespace tb {

/**
 * @Class A read-only piece shape as seen by the board: the ordered
 * offsets of its cells relative to its anchor (the lower left corner
 * of its bounding box) and the derived skirt.
 *
 * @Note The skirt holds, for every relative column of the piece, the
 * lowest dy occupied in that column, or NO_CELL for a gap. It lets
 * `Board::drop_height` read the landing row straight off the column heights.
 */
class Piece
{
 public:
  /** Skirt value of a column of the bounding box that holds no cell. */
  static constexpr int NO_CELL = -1;

  explicit Piece(Body body);

  /**
   * Build a piece from a body string of whitespace separated
   * coordinate pairs, e.g. "0 0 0 1 0 2 0 3" for the vertical stick.
   */
  static Piece parse(std::string_view);

  const Body& body() const { return m_body; }
  const std::vector<int>& skirt() const { return m_skirt; }
  int width() const { return m_width; }
  int height() const { return m_height; }

  /** Two pieces are equal when they cover the same cells, in any order. */
  bool operator==(const Piece& other) const;
  bool operator!=(const Piece& other) const { return !(*this == other); }

  friend std::ostream& operator<<(std::ostream&, const Piece&);

 private:
  Body m_body;
  std::vector<int> m_skirt;
  int m_width;
  int m_height;
};

} // namespace tb

#endif
