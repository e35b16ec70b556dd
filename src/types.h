// types.h
#ifndef __TB_TYPES_H_
#define __TB_TYPES_H_

#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace tb {

/**
 * A cell offset relative to the anchor of a piece, or an absolute
 * position on the board. `y` grows upwards, row 0 is the floor.
 */
struct Point {
    int x { 0 };
    int y { 0 };
};

inline bool operator==(const Point& a, const Point& b)
{
    return a.x == b.x && a.y == b.y;
}

inline bool operator<(const Point& a, const Point& b)
{
    return a.x < b.x || (a.x == b.x && a.y < b.y);
}

using Body = std::vector<Point>;

/**
 * Outcome of `Board::place`.
 *
 * `OutOfBounds` and `Collision` are ordinary results, not failures of the
 * board: the cells written before the offending offset stay written and
 * the caller recovers with `Board::undo`.
 */
enum class PlaceResult : uint8_t {
    Ok,
    RowFilled,
    OutOfBounds,
    Collision
};

inline constexpr bool is_error(PlaceResult res)
{
    return res == PlaceResult::OutOfBounds || res == PlaceResult::Collision;
}

std::string_view to_string(PlaceResult);

std::ostream& operator<<(std::ostream&, PlaceResult);
std::ostream& operator<<(std::ostream&, const Point&);

} // namespace tb

#endif
