// types.cpp
#include "types.h"

#include <iostream>

namespace tb {

std::string_view to_string(PlaceResult res)
{
  switch (res)
  {
    case PlaceResult::Ok:          return "Ok";
    case PlaceResult::RowFilled:   return "RowFilled";
    case PlaceResult::OutOfBounds: return "OutOfBounds";
    case PlaceResult::Collision:   return "Collision";
  }
  return "?";
}

std::ostream& operator<<(std::ostream& _out, PlaceResult _res)
{
  return _out << to_string(_res);
}

std::ostream& operator<<(std::ostream& _out, const Point& _pt)
{
  return _out << '(' << _pt.x << ", " << _pt.y << ')';
}

} // namespace tb
