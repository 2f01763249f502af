
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

#ifndef __CMEA_SQLWRAP_H__
#define __CMEA_SQLWRAP_H__

#include <iostream>
#include <string>
#include <vector>
#include <set>
#include <stdint.h>

#include "sqlite3.h"

class SQL {

 public:

  SQL() {
    db = NULL;
    name = "";
  }

  ~SQL() { close(); }

  bool open( const std::string & n );
  void synchronous( bool );
  void close();
  bool is_open() const { return db; }
  bool query( const std::string & q );
  bool table_exists( const std::string & );

  sqlite3_stmt * prepare( const std::string & q );

  bool step( sqlite3_stmt * stmt );
  void reset( sqlite3_stmt * stmt );
  void finalise( sqlite3_stmt * stmt );

  void begin();
  void commit();

  void bind_int( sqlite3_stmt * stmt , const std::string index , int value );
  void bind_double( sqlite3_stmt * stmt , const std::string index , double value );
  void bind_text( sqlite3_stmt * stmt , const std::string index , const std::string & value );

  int get_int( sqlite3_stmt * , int );
  double get_double( sqlite3_stmt * , int );
  std::string get_text( sqlite3_stmt * , int );
  bool is_null( sqlite3_stmt * , int );

  int lookup_int( const std::string & q );

  static std::string library_version()
    {
      return SQLITE_VERSION;
    }

 private:

  // Keep track of all prepared statements
  std::set<sqlite3_stmt*> qset;

  // Database
  sqlite3 * db;

  // Return code
  int rc;

  // Name of database
  std::string name;

};

#endif
