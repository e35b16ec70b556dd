// piece.cpp
#include "piece.h"
#include "constants.h"

#include <algorithm>
#include <charconv>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace tb {

namespace {

int parse_coordinate(const std::string& token)
{
  int value = 0;
  auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc() || ptr != token.data() + token.size())
  {
    throw std::invalid_argument("Piece::parse: bad coordinate '" + token + "'");
  }
  return value;
}

} // namespace

Piece::Piece(Body body)
  : m_body(std::move(body)), m_skirt(), m_width(0), m_height(0)
{
  if (m_body.empty())
  {
    throw std::invalid_argument("Piece: empty body");
  }
  for (const auto& pt : m_body)
  {
    if (pt.x < 0 || pt.y < 0)
    {
      throw std::invalid_argument("Piece: negative offset in body");
    }
    if (pt.x > MAX_PIECE_OFFSET || pt.y > MAX_PIECE_OFFSET)
    {
      throw std::invalid_argument("Piece: offset larger than " + std::to_string(MAX_PIECE_OFFSET));
    }
    m_width = std::max(m_width, pt.x + 1);
    m_height = std::max(m_height, pt.y + 1);
  }

  m_skirt.assign(m_width, NO_CELL);
  for (const auto& pt : m_body)
  {
    if (m_skirt[pt.x] == NO_CELL || pt.y < m_skirt[pt.x])
      m_skirt[pt.x] = pt.y;
  }
}

Piece Piece::parse(std::string_view desc)
{
  std::istringstream ss{std::string(desc)};
  std::vector<int> coords;
  std::string token;

  while (ss >> token)
  {
    coords.push_back(parse_coordinate(token));
  }
  if (coords.size() % 2 != 0)
  {
    throw std::invalid_argument("Piece::parse: odd number of coordinates");
  }

  Body body;
  body.reserve(coords.size() / 2);
  for (size_t i = 0; i < coords.size(); i += 2)
  {
    body.push_back(Point{coords[i], coords[i + 1]});
  }
  return Piece(std::move(body));
}

bool Piece::operator==(const Piece& other) const
{
  if (m_body.size() != other.m_body.size())
  {
    return false;
  }
  // Create copies so we can sort them
  auto this_body = m_body;
  auto other_body = other.m_body;
  std::sort(this_body.begin(), this_body.end());
  std::sort(other_body.begin(), other_body.end());
  return this_body == other_body;
}

std::ostream& operator<<(std::ostream& _out, const Piece& _piece)
{
  for (auto it = _piece.m_body.begin(); it != _piece.m_body.end(); ++it)
  {
    if (it != _piece.m_body.begin())
      _out << ' ';
    _out << it->x << ' ' << it->y;
  }
  return _out;
}

} // namespace tb
