
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

#include "mea/electrodes.h"
#include "helper/helper.h"

static const std::string column_letters = "abcdefghjklm";


std::string mea::base_tag( const std::string & tag )
{
  const size_t p = tag.find( '.' );
  return p == std::string::npos ? tag : tag.substr( 0 , p );
}


bool mea::is_analog( const std::string & tag )
{
  return Helper::tolower( tag ).compare( 0 , 6 , "analog" ) == 0;
}


std::pair<int,int> mea::coordinates_for_electrode( const std::string & t )
{

  const std::string tag = Helper::tolower( base_tag( t ) );

  if ( is_analog( tag ) )
    {
      const char c = tag[ tag.size() - 1 ];
      switch ( c )
	{
	case '1' : return std::make_pair( 0 , 0 );
	case '2' : return std::make_pair( 1 , 0 );
	case '3' : return std::make_pair( 10 , 0 );
	case '4' : return std::make_pair( 11 , 0 );
	case '5' : return std::make_pair( 0 , 11 );
	case '6' : return std::make_pair( 1 , 11 );
	case '7' : return std::make_pair( 10 , 11 );
	case '8' : return std::make_pair( 11 , 11 );
	}
      Helper::halt( "unknown analog channel " + t );
      return std::make_pair( -1 , -1 );
    }

  const size_t col = tag.size() < 2 ? std::string::npos : column_letters.find( tag[0] );

  int row = 0;

  if ( col == std::string::npos || ! Helper::str2int( tag.substr(1) , &row ) )
    {
      Helper::halt( "invalid electrode tag " + t );
      return std::make_pair( -1 , -1 );
    }

  return std::make_pair( (int)col , row - 1 );
}


std::string mea::tag_for_electrode( const int x , const int y )
{

  if ( x < 0 || x >= column_letters.size() )
    {
      Helper::halt( "invalid electrode column " + Helper::int2str( x ) );
      return "";
    }

  const std::string tag = column_letters.substr( x , 1 ) + Helper::int2str( y + 1 );

  if      ( tag == "a1" )  return "analog1";
  else if ( tag == "b1" )  return "analog2";
  else if ( tag == "l1" )  return "analog3";
  else if ( tag == "m1" )  return "analog4";
  else if ( tag == "a12" ) return "analog5";
  else if ( tag == "b12" ) return "analog6";
  else if ( tag == "l12" ) return "analog7";
  else if ( tag == "m12" ) return "analog8";

  return tag;
}
