#ifndef __TB_GRID_H_
#define __TB_GRID_H_

#include <algorithm>
#include <cstdint>
#include <vector>

namespace tb {

/**
 * Occupancy grid of the board stored as one contiguous buffer, row after row.
 * Cell (x, y) lives at index x + width * y so that a row is a contiguous slice.
 *
 * Copies are deep: a copied Grid never shares storage with its source.
 */
class Grid {
public:
    using Array = std::vector<uint8_t>;
    using value_type = uint8_t;
    using iterator = Array::iterator;
    using const_iterator = Array::const_iterator;
    using size_type = Array::size_type;

    Grid(int width, int height);
    Grid(const Grid& other) = default;
    Grid(Grid&& other) = default;
    Grid& operator=(const Grid& other) = default;
    Grid& operator=(Grid&& other) = default;
    ~Grid() = default;

    bool operator==(const Grid& other) const { return m_width == other.m_width && m_data == other.m_data; }
    bool operator!=(const Grid& other) const { return !(*this == other); }

    int width() const { return m_width; }
    int height() const { return m_height; }
    size_type size() const { return m_data.size(); }
    bool empty() const { return std::all_of(m_data.begin(), m_data.end(), [](const uint8_t c) { return c == 0; }); }

    bool in_bounds(int x, int y) const { return x >= 0 && x < m_width && y >= 0 && y < m_height; }

    /** Unchecked access, (x, y) must be in bounds. */
    bool operator()(int x, int y) const { return m_data[x + m_width * y] != 0; }
    void set(int x, int y, bool filled) { m_data[x + m_width * y] = filled; }

    /**
     * Overwrite the row `to` with the contents of the row `from`.
     */
    void copy_row(int from, int to);

    /**
     * Empty every cell of the given row.
     */
    void clear_row(int y);

    /**
     * Empty the whole grid.
     */
    void clear();

    /**
     * Copy the cells of a grid of the same dimensions into this one,
     * reusing the existing buffer.
     */
    void assign(const Grid& other);

    iterator begin() { return m_data.begin(); }
    iterator end() { return m_data.end(); }
    const_iterator begin() const { return m_data.cbegin(); }
    const_iterator end() const { return m_data.cend(); }

private:
    int m_width;
    int m_height;
    Array m_data;
};

} // namespace tb

#endif
