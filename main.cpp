
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

#include "cmea.h"
#include "main.h"
#include "eval.h"

#include <new>
#include <cstring>
#include <cstdlib>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main( int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << cmea_version() ;
      std::cerr << "Eigen library v"
		<< EIGEN_WORLD_VERSION << "."
		<< EIGEN_MAJOR_VERSION << "."
		<< EIGEN_MINOR_VERSION << "\n";
      std::cerr << "sqlite v"
		<< SQL::library_version() << "\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = cmea_version() +
    "usage: cmea COMMAND [key=value ...] [@param-file]\n"
    "\n"
    "  DETECT    bin= nch= ch= [fs=] [cal=] [amp=] [dead=] [filter=F] out=\n"
    "  SORT      spikes= bin= nch= ch= [low=] [high=] [win=] [eps=] [minpts=] out=\n"
    "  TAG       spikes= [sep=] [min-events=] [max-jitter=] [keep-frac=] [out=]\n"
    "  COFIRE    spikes= e1= e2= [sep=]\n"
    "  CONDENSE  dir= out=\n"
    "  MAP       spikes=\n"
    "\n"
    "  spike tables are CSV, or SQLite for names ending .db\n";

  if ( argc == 1
       || strcmp( argv[1] , "-h" ) == 0
       || strcmp( argv[1] , "--help" ) == 0 )
    {
      std::cerr << usage_msg;
      logger.off();
      std::exit( argc == 1 ? 1 : 0 );
    }


  //
  // command and options
  //

  const std::string cmd = argv[1];

  param_t param;

  for (int i=2; i<argc; i++)
    {
      std::string x = argv[i];
      if ( x == "" ) continue;
      if ( x[0] == '@' ) param.read( x.substr(1) );
      else param.parse( x );
    }

  if ( param.has( "log" ) )
    logger.write_log( param.value( "log" ) );

  globals::verbose = param.has( "verbose" ) && param.yesno( "verbose" );


  //
  // banner
  //

  logger.banner( globals::version , globals::date );


  //
  // process
  //

  cmea_eval( cmd , param );

  std::exit( globals::retcode );

}


//
// report version
//

std::string cmea_version()
{
  std::stringstream ss;
  ss << "cmea version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "cmea build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* You need a smaller dataset or a bigger computer...*\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
