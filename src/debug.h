#ifndef __TB_DEBUG_H_
#define __TB_DEBUG_H_

namespace Debug {

namespace board {

  // Board Settings
  extern bool debug_tallies;
  extern bool debug_place;

  inline void set_debug_tallies(bool c) { debug_tallies = c; }
  inline void set_debug_place(bool c)   { debug_place   = c; }

} // namespace board

} // namespace Debug

#endif
