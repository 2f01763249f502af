
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

#ifndef __CMEA_SPIKEDB_H__
#define __CMEA_SPIKEDB_H__

#include "db/sqlwrap.h"
#include "spikes/spikes.h"

#include <string>

//
// SQLite store for a spike table: one 'spikes' table, keyed by row
//

struct spikedb_t {

  spikedb_t( const std::string & );

  ~spikedb_t() { release(); }

  bool attached() const { return sql.is_open(); }

  // replaces any previous contents
  void write( const spike_table_t & spikes );

  // rows in original order
  spike_table_t read();

  int count();

  // number of rows currently flagged as conductance artifacts
  int count_flagged();

private:

  bool init();

  bool release();

  SQL sql;

  std::string filename;

  //
  // Prepared queries
  //

  sqlite3_stmt * stmt_insert;

  sqlite3_stmt * stmt_fetch;

};

#endif
