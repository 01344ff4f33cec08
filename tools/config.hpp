/* config.hpp

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

#ifndef TOOLS_CONFIG_HPP
#define TOOLS_CONFIG_HPP

#include <string>
#include <vector>
#include <boost/any.hpp>
#include <boost/optional.hpp>
#include <sightline/vec.hpp>

struct Query_Config {
  std::string map_file;
  bool fov;
  int radius;
  bool walls;
  boost::optional<sightline::Vec2i> from;
  boost::optional<sightline::Vec2i> to;
};

extern Query_Config g_config;

void parse_command_line(int argc, char* argv[]);

namespace sightline {

/// Let program_options read points written as "x,y".
void validate(boost::any& v, const std::vector<std::string>& values, Vec2i*, int);

}

#endif
