
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

#include "spikes/spikedb.h"

#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

spikedb_t::spikedb_t( const std::string & f1 )
{

  stmt_insert = stmt_fetch = NULL;

  filename = Helper::expand( f1 );

  sql.open( filename );

  sql.synchronous( false );

  if ( ! sql.table_exists( "spikes" ) )
    sql.query( " CREATE TABLE spikes ("
	       "   row          INTEGER PRIMARY KEY , "
	       "   electrode    VARCHAR(16) NOT NULL , "
	       "   time         REAL NOT NULL , "
	       "   amplitude    REAL , "
	       "   threshold    REAL , "
	       "   conductance  INTEGER );" );

  init();
}


bool spikedb_t::init()
{
  stmt_insert = sql.prepare( " INSERT OR REPLACE INTO spikes ( row , electrode , time , amplitude , threshold , conductance ) "
			     " values( :row , :electrode , :time , :amplitude , :threshold , :conductance ); " );

  stmt_fetch = sql.prepare( "SELECT electrode , time , amplitude , threshold , conductance FROM spikes ORDER BY row ;" );

  return true;
}


bool spikedb_t::release()
{
  sql.finalise( stmt_insert );
  sql.finalise( stmt_fetch );
  stmt_insert = stmt_fetch = NULL;
  return true;
}


void spikedb_t::write( const spike_table_t & spikes )
{

  sql.begin();

  sql.query( "DELETE FROM spikes;" );

  for (int r=0; r<spikes.size(); r++)
    {
      const spike_t & s = spikes[r];
      sql.bind_int( stmt_insert , ":row" , r );
      sql.bind_text( stmt_insert , ":electrode" , s.electrode );
      sql.bind_double( stmt_insert , ":time" , s.time );
      sql.bind_double( stmt_insert , ":amplitude" , s.amplitude );
      sql.bind_double( stmt_insert , ":threshold" , s.threshold );
      sql.bind_int( stmt_insert , ":conductance" , s.conductance );
      sql.step( stmt_insert );
      sql.reset( stmt_insert );
    }

  sql.commit();

  logger << "  wrote " << spikes.size() << " spikes to " << filename << "\n";
}


spike_table_t spikedb_t::read()
{
  spike_table_t spikes;

  while ( sql.step( stmt_fetch ) )
    {
      spike_t s;
      s.electrode   = sql.get_text( stmt_fetch , 0 );
      s.time        = sql.get_double( stmt_fetch , 1 );
      s.amplitude   = sql.get_double( stmt_fetch , 2 );
      s.threshold   = sql.get_double( stmt_fetch , 3 );
      s.conductance = ! sql.is_null( stmt_fetch , 4 ) && sql.get_int( stmt_fetch , 4 ) != 0;
      spikes.add( s );
    }

  sql.reset( stmt_fetch );

  logger << "  read " << spikes.size() << " spikes on "
	 << spikes.ngroups() << " electrodes from " << filename << "\n";

  return spikes;
}


int spikedb_t::count()
{
  return sql.lookup_int( "SELECT COUNT(*) FROM spikes;" );
}


int spikedb_t::count_flagged()
{
  return sql.lookup_int( "SELECT COUNT(*) FROM spikes WHERE conductance != 0;" );
}
