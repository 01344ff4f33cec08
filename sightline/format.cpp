/* format.cpp

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

#include "format.hpp"

namespace sightline {

std::string format(const char* fmt) {
  std::string result;
  while (*fmt) {
    if (*fmt == '%' && *(fmt + 1) == '%') {
      result += '%';
      fmt += 2;
    } else if (*fmt == '%') {
      die("too few arguments given to format");
    } else {
      result += *fmt++;
    }
  }
  return result;
}

}
