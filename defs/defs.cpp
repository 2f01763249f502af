
//    --------------------------------------------------------------------
//
//    This file is part of CMEA.
//
//    CMEA is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    CMEA is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with CMEA. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "defs/defs.h"

std::string globals::version;
std::string globals::date;

int globals::retcode;

void (*globals::bail_function) ( const std::string & );

bool globals::bail_on_fail;

void (*globals::logger_function) ( const std::string & );

bool globals::silent;
bool globals::cache_log;
bool globals::api_mode;
bool globals::verbose;


void globals::api()
{
  silent = true;
  api_mode = true;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.4.1";

  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  bail_on_fail = true;

  //
  // Optional redirect of logger?
  //

  logger_function = NULL;

  //
  // Output
  //

  silent = false;

  cache_log = false;

  api_mode = false;

  verbose = false;

}
