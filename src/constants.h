#ifndef __TB_CONSTANTS_H_
#define __TB_CONSTANTS_H_

namespace tb {

inline constexpr auto DEFAULT_WIDTH  = 10;
inline constexpr auto DEFAULT_HEIGHT = 24;

// Largest dx or dy accepted in a piece body
inline constexpr auto MAX_PIECE_OFFSET = 255;

// Text rendering
inline constexpr auto CHAR_FILLED  = '+';
inline constexpr auto CHAR_EMPTY   = ' ';
inline constexpr auto CHAR_WALL    = '|';
inline constexpr auto CHAR_FLOOR   = '-';

// Rotating log file used by `log::init_logger`
inline constexpr auto LOG_FILE       = "logs/board.txt";
inline constexpr auto LOG_MAX_SIZE   = 1048576 * 5;
inline constexpr auto LOG_MAX_FILES  = 3;

} // namespace tb

#endif
