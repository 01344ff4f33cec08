/* config.cpp

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

#include "config.hpp"
#include <cstdlib>
#include <iostream>
#include <string>
#include <boost/program_options.hpp>
#include <boost/tokenizer.hpp>
#include <sightline/core.hpp>

using namespace std;
using namespace boost::program_options;

Query_Config g_config;

namespace sightline {

void validate(boost::any& v, const vector<string>& values, Vec2i*, int) {
  validators::check_first_occurrence(v);
  const string& s = validators::get_single_string(values);

  boost::char_separator<char> sep(",");
  boost::tokenizer<boost::char_separator<char>> tokens(s, sep);
  vector<int> coords;
  try {
    for (auto& token : tokens)
      coords.push_back(stoi(token));
  } catch (logic_error&) {
    throw validation_error(validation_error::invalid_option_value);
  }
  if (coords.size() != 2)
    throw validation_error(validation_error::invalid_option_value);
  v = boost::any(Vec2i(coords[0], coords[1]));
}

}

void parse_command_line(int argc, char* argv[]) {
  try {
    options_description desc("Options");
    desc.add_options()
        ("help", "Show this message")
        ("map", value<string>(&g_config.map_file)->required(), "Text map file, '#' for walls and 'x' for the spawn point")
        ("fov", bool_switch(&g_config.fov), "Compute the field of view from the origin")
        ("radius", value<int>(&g_config.radius)->default_value(8), "Field of view radius")
        ("walls", value<bool>(&g_config.walls)->default_value(true), "Include the walls in the field of view")
        ("from", value<sightline::Vec2i>(), "Origin as x,y, defaults to the spawn point")
        ("to", value<sightline::Vec2i>(), "Find a path from the origin to x,y")
        ;
    variables_map vm;
    store(parse_command_line(argc, argv, desc), vm);
    if (vm.count("help")) {
      cout << desc << "\n";
      exit(0);
    }
    notify(vm);

    if (vm.count("from"))
      g_config.from = vm["from"].as<sightline::Vec2i>();
    if (vm.count("to"))
      g_config.to = vm["to"].as<sightline::Vec2i>();
  } catch (exception& e) {
    sightline::die(e.what());
  }
}
