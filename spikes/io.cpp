
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

#include "spikes/io.h"
#include "spikes/spikedb.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <cctype>

extern logger_t logger;


// shortest representation that reads back to the same double
static std::string num2str( const double x )
{
  for (int dp=15; dp<=17; dp++)
    {
      std::ostringstream ss;
      ss << std::setprecision( dp ) << x;
      double y = 0;
      if ( dp == 17 || ( Helper::str2dbl( ss.str() , &y ) && y == x ) )
	return ss.str();
    }
  return "";
}


static bool str2bool( const std::string & s0 , bool * b )
{
  const std::string s = Helper::toupper( Helper::unquote( Helper::lrtrim( s0 ) ) );
  if ( s == "T" || s == "TRUE" || s == "1" || s == "Y" || s == "YES" ) { *b = true; return true; }
  if ( s == "F" || s == "FALSE" || s == "0" || s == "N" || s == "NO" ) { *b = false; return true; }
  return false;
}


spike_table_t mea::read_csv( const std::string & f )
{

  const std::string filename = Helper::expand( f );

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  spike_table_t spikes;

  std::string line;

  Helper::safe_getline( IN1 , line );

  const std::vector<std::string> hdr = Helper::parse( line , "," , true );

  int col_e = -1 , col_t = -1 , col_a = -1 , col_th = -1 , col_c = -1;

  for (int i=0; i<hdr.size(); i++)
    {
      const std::string h = Helper::tolower( Helper::unquote( Helper::lrtrim( hdr[i] ) ) );
      if      ( h == "electrode" )   col_e = i;
      else if ( h == "time" )        col_t = i;
      else if ( h == "amplitude" )   col_a = i;
      else if ( h == "threshold" )   col_th = i;
      else if ( h == "conductance" ) col_c = i;
    }

  if ( col_e == -1 || col_t == -1 )
    Helper::halt( filename + " does not have electrode and time columns" );

  int ln = 1;

  while ( ! IN1.eof() )
    {

      Helper::safe_getline( IN1 , line );

      ++ln;

      if ( IN1.eof() && line == "" ) break;

      if ( Helper::lrtrim( line ) == "" ) continue;

      const std::vector<std::string> tok = Helper::parse( line , "," , true );

      if ( tok.size() != hdr.size() )
	Helper::halt( "expecting " + Helper::int2str( (int)hdr.size() ) + " columns on line "
		      + Helper::int2str( ln ) + " of " + filename );

      spike_t s;

      s.electrode = Helper::unquote( Helper::lrtrim( tok[ col_e ] ) );

      if ( s.electrode == "" || s.electrode == "." )
	Helper::halt( "missing electrode on line " + Helper::int2str( ln ) + " of " + filename );

      if ( ! Helper::str2dbl( tok[ col_t ] , &s.time ) )
	Helper::halt( "bad time value on line " + Helper::int2str( ln ) + " of " + filename );

      if ( col_a != -1 && tok[ col_a ] != "." && ! Helper::str2dbl( tok[ col_a ] , &s.amplitude ) )
	Helper::halt( "bad amplitude value on line " + Helper::int2str( ln ) + " of " + filename );

      if ( col_th != -1 && tok[ col_th ] != "." && ! Helper::str2dbl( tok[ col_th ] , &s.threshold ) )
	Helper::halt( "bad threshold value on line " + Helper::int2str( ln ) + " of " + filename );

      if ( col_c != -1 && tok[ col_c ] != "." && ! str2bool( tok[ col_c ] , &s.conductance ) )
	Helper::halt( "bad conductance value on line " + Helper::int2str( ln ) + " of " + filename );

      spikes.add( s );
    }

  IN1.close();

  logger << "  read " << spikes.size() << " spikes on "
	 << spikes.ngroups() << " electrodes from " << filename << "\n";

  return spikes;
}


void mea::write_csv( const spike_table_t & spikes , const std::string & f )
{

  const std::string filename = Helper::expand( f );

  std::ofstream O1( filename.c_str() , std::ios::out );

  if ( ! O1.good() )
    Helper::halt( "could not open " + filename + " for writing" );

  O1 << "electrode,time,amplitude,threshold,conductance\n";

  for (int r=0; r<spikes.size(); r++)
    {
      const spike_t & s = spikes[r];
      O1 << s.electrode << ","
	 << num2str( s.time ) << ","
	 << num2str( s.amplitude ) << ","
	 << num2str( s.threshold ) << ","
	 << ( s.conductance ? "True" : "False" ) << "\n";
    }

  O1.close();

  logger << "  wrote " << spikes.size() << " spikes to " << filename << "\n";
}


spike_table_t mea::load_spikes( const std::string & filename )
{
  if ( Helper::file_extension( filename , "db" ) )
    {
      if ( ! Helper::fileExists( Helper::expand( filename ) ) )
	Helper::halt( "could not find " + filename );
      spikedb_t db( filename );
      return db.read();
    }
  return read_csv( filename );
}


void mea::save_spikes( const spike_table_t & spikes , const std::string & filename )
{
  if ( Helper::file_extension( filename , "db" ) )
    {
      spikedb_t db( filename );
      db.write( spikes );
      return;
    }
  write_csv( spikes , filename );
}


void mea::condense_spikes( const std::string & folder , const std::string & f )
{

  const std::string filename = Helper::expand( f );

  std::string dir = Helper::expand( folder );
  if ( dir.size() == 0 ) dir = ".";
  if ( dir[ dir.size() - 1 ] != '/' ) dir += "/";

  // sorted by name
  const std::vector<std::string> files = Helper::folder_files( dir );

  std::ofstream O1( filename.c_str() , std::ios::out | std::ios::app );

  if ( ! O1.good() )
    Helper::halt( "could not open " + filename + " for writing" );

  O1 << "electrode,time\n";

  int nlines = 0;

  for (int i=0; i<files.size(); i++)
    {

      // a4 from spikes_a4.csv
      std::string label = files[i];
      const size_t p = label.rfind( '_' );
      if ( p != std::string::npos ) label = label.substr( p + 1 );
      if ( label.size() >= 4 ) label = label.substr( 0 , label.size() - 4 );

      std::ifstream IN1( ( dir + files[i] ).c_str() , std::ios::in );

      if ( ! IN1.good() )
	Helper::halt( "could not open " + dir + files[i] );

      while ( ! IN1.eof() )
	{
	  std::string line;
	  Helper::safe_getline( IN1 , line );
	  if ( line.size() == 0 || ! isdigit( (unsigned char)line[0] ) ) continue;
	  O1 << label << "," << line << "\n";
	  ++nlines;
	}

      IN1.close();
    }

  O1.close();

  logger << "  condensed " << nlines << " spike times from "
	 << files.size() << " files into " << filename << "\n";
}
