/* core.cpp

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

#include "core.hpp"
#include <cstdio>
#include <stdlib.h>

#ifdef __GLIBC__
#include <execinfo.h>

static void print_trace(void) {
  void *array[20];
  int size;
  char **strings;
  int i;

  size = backtrace(array, sizeof(array) / sizeof(array[0]));
  strings = backtrace_symbols(array, size);

  fprintf(stderr, "Obtained %d stack frames.\n", size);

  for (i = 0; i < size; i++)
    fprintf(stderr, "%s\n", strings[i]);

  free(strings);
}
#else
static void print_trace(void) {}
#endif

namespace sightline {

void die(const char* str) {
  #ifndef NDEBUG
  print_trace();
  #endif

  fprintf(stderr, "%s\n", str);
  exit(1);
}

}
