// debug.cpp
#include "debug.h"

namespace Debug {
namespace board {

bool debug_tallies = false;
bool debug_place   = false;

} // namespace board
} // namespace Debug
