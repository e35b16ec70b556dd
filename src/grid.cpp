#include "grid.h"

#include <algorithm>
#include <stdexcept>
#include <string>


namespace tb {

namespace {

int checked_dimension (int value, const char *name)
{
  if (value <= 0)
    {
      throw std::invalid_argument (std::string ("Grid ") + name + " must be positive, got "
                                   + std::to_string (value));
    }
  return value;
}

} // namespace


Grid::Grid (int width, int height)
    : m_width (checked_dimension (width, "width")),
      m_height (checked_dimension (height, "height")),
      m_data (static_cast<size_type> (width) * static_cast<size_type> (height), 0)
{
  //ctor
}


void Grid::copy_row (int from, int to)
{
  auto src = m_data.begin () + m_width * from;
  std::copy_n (src, m_width, m_data.begin () + m_width * to);
}


void Grid::clear_row (int y)
{
  std::fill_n (m_data.begin () + m_width * y, m_width, 0);
}


void Grid::clear ()
{
  std::fill (m_data.begin (), m_data.end (), 0);
}


void Grid::assign (const Grid &other)
{
  if (other.m_width != m_width || other.m_height != m_height)
    {
      throw std::invalid_argument ("Grid::assign: dimensions differ");
    }
  std::copy (other.m_data.begin (), other.m_data.end (), m_data.begin ());
}

} // namespace tb
