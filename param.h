
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

#ifndef __CMEA_PARAM_H__
#define __CMEA_PARAM_H__

#include <string>
#include <map>
#include <vector>
#include <sstream>

//
// Helper to parse command syntax: key=value options
//

struct param_t
{

 public:

  void add( const std::string & option , const std::string & value = "" );

  int size() const;

  // key=value, or a bare key (stored as a flag)
  void parse( const std::string & s );

  // @param-file : one key=value per line, '%' starts a comment
  void read( const std::string & filename );

  void clear();

  bool has(const std::string & s ) const;

  bool empty(const std::string & s ) const;

  // if ! has(X) return F, else return yesno(value(X))
  // bare key (no value) returns T
  bool yesno(const std::string & s ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;

  std::string requires( const std::string & s , const bool uppercase = false ) const;

  int requires_int( const std::string & s ) const;

  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;


private:

  std::map<std::string,std::string> opt;

};


#endif
