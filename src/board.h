/// board.h
///
#ifndef __TB_BOARD_H_
#define __TB_BOARD_H_

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>

#include "constants.h"
#include "grid.h"
#include "piece.h"
#include "types.h"

namespace tb {

/**
 * Thrown by `Board::undo` when the board has never taken a snapshot,
 * i.e. it was neither started with `new_game` nor mutated.
 */
class NoBackupError : public std::logic_error
{
 public:
  explicit NoBackupError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @Class The playing field: an occupancy grid with cached column heights
 * and row widths, and a single-level undo.
 *
 * @Note The board is a two-state machine. When committed, the backup is
 * stale and `undo` does nothing. The first `place` or `clear_rows` after
 * a commit snapshots the grid and its tallies and makes the board
 * uncommitted; further mutations join the same episode until `commit`
 * or `undo` closes it. There is no history beyond that one snapshot.
 *
 * A freshly constructed board is empty but uncommitted without a snapshot
 * until `new_game` is called.
 */
class Board
{
 public:
  explicit Board(int width = DEFAULT_WIDTH, int height = DEFAULT_HEIGHT);

  /** Empty the grid and the tallies, and commit. */
  void new_game();

  int width() const { return m_width; }
  int height() const { return m_height; }

  /** Height of the tallest column, 0 for an empty board. */
  int max_height() const;

  /** One more than the highest filled row of column x, 0 when empty. */
  int column_height(int x) const;

  /** Number of filled cells in row y. */
  int row_width(int y) const;

  /**
   * True if the cell is filled. Cells outside the grid are always
   * occupied so callers can test cells around a piece without bounds checks.
   */
  bool occupied(int x, int y) const;

  /**
   * The y at which the piece comes to rest when dropped straight down
   * with its anchor in column x. Computed from the column heights only.
   */
  int drop_height(const Piece& piece, int x) const;

  /**
   * Write the cells of the piece anchored at (x, y).
   *
   * The offsets are written in the piece's order and the first one that
   * is out of bounds or already filled stops the placement. Cells written
   * before it remain written: the board is then invalid for play and the
   * only recovery is `undo`.
   */
  PlaceResult place(const Piece& piece, int x, int y);

  /**
   * Remove every full row and let the rows above drop down, keeping their order.
   *
   * @Return The number of rows removed.
   */
  int clear_rows();

  /** Accept the pending mutations. */
  void commit();

  /** Revert to the state at the start of the pending episode, if any. */
  void undo();

  bool committed() const { return m_committed; }

  /**
   * Recompute the tallies from the grid and compare them with the cached ones.
   */
  bool check_tallies() const;

  const Grid& grid() const { return m_grid; }
  const std::vector<int>& column_heights() const { return m_col_heights; }
  const std::vector<int>& row_widths() const { return m_row_widths; }

  friend std::ostream& operator<<(std::ostream&, const Board&);

 private:
  /** Snapshot and leave the committed state, once per episode. */
  void begin_episode();
  void backup();
  void restore();

  /**
   * Rederive column heights and row widths from the grid. Needed after
   * compaction, when any number of rows may have moved.
   */
  void recompute_tallies();

  void debug_check(const char* where) const;

  int m_width;
  int m_height;

  Grid m_grid;
  std::vector<int> m_col_heights;
  std::vector<int> m_row_widths;

  Grid m_backup_grid;
  std::vector<int> m_backup_col_heights;
  std::vector<int> m_backup_row_widths;

  bool m_committed { false };
  bool m_has_backup { false };
};

} // namespace tb

#endif
