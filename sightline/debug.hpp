/* debug.hpp

   Copyright (C) 2012 Risto Saarelma

   This program is free software: you can redistribute it and/or modify
   it under the terms of the GNU General Public License as published by
   the Free Software Foundation, either version 3 of the License, or
   (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License
   along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SIGHTLINE_DEBUG_HPP
#define SIGHTLINE_DEBUG_HPP

#include <SDL/SDL.h>
#include "core.hpp"

namespace sightline {

/// Log how long the enclosing scope took when it exits, and the time per
/// run when the scope repeats a workload.
class Print_Time {
public:
  Print_Time(const char *label, int runs = 1)
    : label(label), runs(runs), ms_ticks(SDL_GetTicks()) {}

  ~Print_Time() {
    double seconds = (SDL_GetTicks() - ms_ticks) / 1000.0;
    if (runs > 1)
      log_print("%s: %s runs took %s seconds, %s ms per run\n",
                label, runs, seconds, 1000.0 * seconds / runs);
    else
      log_print("%s: took %s seconds.\n", label, seconds);
  }
private:
  Print_Time(const Print_Time&);
  Print_Time& operator=(const Print_Time&);

  const char* label;
  int runs;
  Uint32 ms_ticks;
};

}

#endif
