// board.cpp
#include "board.h"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <iostream>
#include <string>

#include "debug.h"
#include "display.h"
#include "logger.h"

namespace tb {

Board::Board(int width, int height)
  : m_width(width)
  , m_height(height)
  , m_grid(width, height)
  , m_col_heights(width, 0)
  , m_row_widths(height, 0)
  , m_backup_grid(width, height)
  , m_backup_col_heights(width, 0)
  , m_backup_row_widths(height, 0)
{
}

void Board::new_game()
{
  m_grid.clear();
  std::fill(m_col_heights.begin(), m_col_heights.end(), 0);
  std::fill(m_row_widths.begin(), m_row_widths.end(), 0);
  m_committed = true;
}

//******************************** Queries **************************************/

int Board::max_height() const
{
  return *std::max_element(m_col_heights.begin(), m_col_heights.end());
}

int Board::column_height(int x) const
{
  return m_col_heights.at(x);
}

int Board::row_width(int y) const
{
  return m_row_widths.at(y);
}

bool Board::occupied(int x, int y) const
{
  return !m_grid.in_bounds(x, y) || m_grid(x, y);
}

int Board::drop_height(const Piece& piece, int x) const
{
  const auto& skirt = piece.skirt();
  int ret = 0;
  for (int i = 0; i < piece.width(); ++i)
  {
    const std::int64_t col = std::int64_t{x} + i;
    if (col < 0 || col >= m_width)
    {
      throw std::out_of_range("Board::drop_height: column " + std::to_string(col) + " is off the board");
    }
    // Gaps in the piece rest on nothing
    if (skirt[i] == Piece::NO_CELL)
      continue;
    ret = std::max(ret, m_col_heights[col] - skirt[i]);
  }
  return ret;
}

//******************************** Place / Clear **************************************/

PlaceResult Board::place(const Piece& piece, int x, int y)
{
  if (!m_committed && !m_has_backup)
  {
    spdlog::warn("place called on a board that was never started");
  }
  begin_episode();

  PlaceResult res = PlaceResult::Ok;
  for (const auto& offset : piece.body())
  {
    // Summed wide so that any anchor ends up out of bounds instead of overflowing
    const std::int64_t wx = std::int64_t{x} + offset.x;
    const std::int64_t wy = std::int64_t{y} + offset.y;

    if (wx < 0 || wx >= m_width || wy < 0 || wy >= m_height)
    {
      res = PlaceResult::OutOfBounds;
      break;
    }
    const int cx = static_cast<int>(wx);
    const int cy = static_cast<int>(wy);

    if (m_grid(cx, cy))
    {
      res = PlaceResult::Collision;
      break;
    }
    m_grid.set(cx, cy, true);
    m_col_heights[cx] = std::max(m_col_heights[cx], cy + 1);
    if (++m_row_widths[cy] == m_width)
    {
      res = PlaceResult::RowFilled;
    }
  }

  if (is_error(res))
  {
    spdlog::debug("place at ({}, {}) failed: {}", x, y, to_string(res));
  }
  if (Debug::board::debug_place)
  {
    log::board_logger()->debug("place at ({}, {}) -> {}\n{}", x, y, to_string(res), display::to_string(*this));
  }
  debug_check("place");
  return res;
}

/**
 * Bottom-up pass over the rows that hold cells before the pass. `row_to` is the
 * next row to write, `cur_row` the row being read: full rows are skipped, the
 * other ones are moved down onto `row_to`. What is left between `row_to` and the
 * old top of the stack is emptied.
 */
int Board::clear_rows()
{
  begin_episode();

  const int top = max_height();
  int row_to = 0;
  int rows_cleared = 0;

  for (int cur_row = 0; cur_row < top; ++cur_row)
  {
    if (m_row_widths[cur_row] == m_width)
    {
      ++rows_cleared;
      continue;
    }
    if (row_to != cur_row)
    {
      m_grid.copy_row(cur_row, row_to);
    }
    ++row_to;
  }

  if (rows_cleared > 0)
  {
    for (; row_to < top; ++row_to)
    {
      m_grid.clear_row(row_to);
    }
    recompute_tallies();
    log::board_logger()->trace("cleared {} rows", rows_cleared);
  }

  debug_check("clear_rows");
  return rows_cleared;
}

void Board::recompute_tallies()
{
  std::fill(m_col_heights.begin(), m_col_heights.end(), 0);
  std::fill(m_row_widths.begin(), m_row_widths.end(), 0);

  for (int y = 0; y < m_height; ++y)
  {
    for (int x = 0; x < m_width; ++x)
    {
      if (m_grid(x, y))
      {
        m_col_heights[x] = y + 1;
        ++m_row_widths[y];
      }
    }
  }
}

bool Board::check_tallies() const
{
  std::vector<int> col_heights(m_width, 0);
  std::vector<int> row_widths(m_height, 0);

  for (int y = 0; y < m_height; ++y)
  {
    for (int x = 0; x < m_width; ++x)
    {
      if (m_grid(x, y))
      {
        col_heights[x] = y + 1;
        ++row_widths[y];
      }
    }
  }
  return col_heights == m_col_heights && row_widths == m_row_widths;
}

void Board::debug_check(const char* where) const
{
  if (Debug::board::debug_tallies && !check_tallies())
  {
    spdlog::error("{}: cached tallies don't match the grid\n{}", where, display::to_string(*this));
  }
}

//******************************** Commit / Undo **************************************/

void Board::begin_episode()
{
  if (m_committed || !m_has_backup)
  {
    backup();
    m_has_backup = true;
    m_committed = false;
    log::board_logger()->trace("snapshot taken, board uncommitted");
  }
}

void Board::commit()
{
  m_committed = true;
}

void Board::undo()
{
  if (m_committed)
  {
    spdlog::trace("undo on a committed board does nothing");
    return;
  }
  if (!m_has_backup)
  {
    throw NoBackupError("Board::undo: no snapshot to restore");
  }
  restore();
  m_committed = true;
  log::board_logger()->trace("board restored from snapshot");
}

void Board::backup()
{
  m_backup_grid.assign(m_grid);
  std::copy(m_col_heights.begin(), m_col_heights.end(), m_backup_col_heights.begin());
  std::copy(m_row_widths.begin(), m_row_widths.end(), m_backup_row_widths.begin());
}

void Board::restore()
{
  m_grid.assign(m_backup_grid);
  std::copy(m_backup_col_heights.begin(), m_backup_col_heights.end(), m_col_heights.begin());
  std::copy(m_backup_row_widths.begin(), m_backup_row_widths.end(), m_row_widths.begin());
}

//*************************** Display *************************/

std::ostream& operator<<(std::ostream& _out, const Board& _board)
{
  return _out << display::to_string(_board);
}

} // namespace tb
