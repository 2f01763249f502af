
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

#include <stdexcept>
#include <cstdio>
#include <sys/stat.h>
#include <unistd.h>

extern globals global;

namespace {

  int g_failures = 0;

  void CHECK( bool cond , const char * msg )
  {
    if ( ! cond )
      {
	++g_failures;
	std::cerr << "[FAIL] " << msg << "\n";
      }
  }

  void throw_on_halt( const std::string & msg ) { throw std::runtime_error( msg ); }

  void api_mode()
  {
    global.init_defs();
    global.api();
    globals::bail_function = throw_on_halt;
    globals::bail_on_fail = false;
  }


  spike_table_t example()
  {
    spike_table_t s;
    s.add( spike_t( "b5" , 0.30 , -40 , -20 ) );
    s.add( spike_t( "a4" , 0.10 , -50 , -21 ) );
    s.add( spike_t( "b5" , 0.10 , -45 , -20 ) );
    s.add( spike_t( "c6" , 0.50 , -10 , -5 , true ) );
    s.add( spike_t( "a4" , 0.20 , -55 , -21 ) );
    s.add( spike_t( "b5" , 0.20 , -42 , -20 ) );
    return s;
  }

  void TEST_Groups()
  {
    std::cout << "[RUN ] Groups\n";
    const spike_table_t s = example();
    CHECK( s.size() == 6 , "six rows" );
    CHECK( s.ngroups() == 3 , "three electrode groups" );
    CHECK( s.tag( 0 ) == "b5" && s.tag( 1 ) == "a4" && s.tag( 2 ) == "c6" , "groups in order of first appearance" );

    const std::vector<int> & g = s.group( "b5" );
    CHECK( g.size() == 3 && g[0] == 2 && g[1] == 5 && g[2] == 0 , "group rows in time order" );
    CHECK( s.group( 1 ) == s.group( "a4" ) , "group by position matches group by tag" );
    CHECK( s.group( "d7" ).size() == 0 , "missing tag gives an empty group" );
    CHECK( s.group( 7 ).size() == 0 , "missing position gives an empty group" );

    const std::vector<spike_t> sp = s.spikes( "a4" );
    CHECK( sp.size() == 2 && sp[0].amplitude == -50 && sp[1].amplitude == -55 , "spikes of one electrode" );

    const std::vector<std::string> e = s.electrodes();
    CHECK( e.size() == 3 && e[0] == "a4" && e[1] == "b5" && e[2] == "c6" , "electrodes listed alphabetically" );
    CHECK( s.max_time() == 0.50 , "latest spike time" );
    CHECK( s.flagged() == 1 && s.flagged( "c6" ) == 1 , "flag counts" );
    std::cout << "[DONE] Groups\n";
  }

  void TEST_SortGroups()
  {
    std::cout << "[RUN ] SortGroups\n";
    spike_table_t s = example();
    s.add( spike_t( "d7" , 0.9 ) );

    s.sort();
    CHECK( s.tag( 0 ) == "b5" && s.tag( 1 ) == "a4" , "largest groups first" );
    CHECK( s.tag( 2 ) == "c6" && s.tag( 3 ) == "d7" , "equal sizes keep their order" );

    s.sort( spike_table_t::group_size , false );
    CHECK( s.tag( 0 ) == "c6" && s.tag( 1 ) == "d7" && s.tag( 3 ) == "b5" , "ascending by size" );

    // rows are untouched
    CHECK( s[0].electrode == "b5" && s[0].time == 0.30 , "row order unchanged" );

    s.sort( []( const std::vector<spike_t> & x ) {
	double m = 0;
	for (int i=0; i<x.size(); i++) m += x[i].amplitude;
	return x.size() ? m / x.size() : 0.0; } );
    CHECK( s.tag( 0 ) == "d7" && s.tag( 1 ) == "c6" && s.tag( 2 ) == "b5" && s.tag( 3 ) == "a4" ,
	   "a keyed sort is descending by default" );

    s.sort( []( const std::vector<spike_t> & x ) { return x.size() ? x[0].time : 0.0; } , false );
    CHECK( s.tag( 0 ) == "b5" && s.tag( 1 ) == "a4" && s.tag( 2 ) == "c6" && s.tag( 3 ) == "d7" ,
	   "ascending by first spike time, ties keep their order" );
    std::cout << "[DONE] SortGroups\n";
  }

  void TEST_RelabelAndFlags()
  {
    std::cout << "[RUN ] RelabelAndFlags\n";
    spike_table_t s = example();

    std::vector<std::string> tags;
    for (int r=0; r<s.size(); r++) tags.push_back( s[r].electrode + ( s[r].time < 0.25 ? ".0" : ".1" ) );
    s.relabel( tags );

    CHECK( s.size() == 6 , "no rows created or lost" );
    CHECK( ! s.has( "b5" ) && s.has( "b5.0" ) && s.has( "b5.1" ) , "groups follow the new tags" );
    CHECK( s.group( "b5.0" ).size() == 2 && s.group( "b5.1" ).size() == 1 , "group sizes" );
    CHECK( s.tag( 0 ) == "b5.1" , "group order from the rows" );

    s.clear_flags();
    CHECK( s.flagged() == 0 , "flags cleared" );

    std::set<int> rows;
    rows.insert( 1 ); rows.insert( 4 ); rows.insert( 1 );
    s.flag( rows );
    s.flag( rows );
    CHECK( s.flagged() == 2 && s[1].conductance && s[4].conductance , "flags set once" );

    rows.insert( 99 );
    bool threw = false;
    try { s.flag( rows ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "flag on a missing row halts" );
    std::cout << "[DONE] RelabelAndFlags\n";
  }

  bool same( const spike_table_t & a , const spike_table_t & b )
  {
    if ( a.size() != b.size() ) return false;
    for (int r=0; r<a.size(); r++)
      if ( a[r].electrode != b[r].electrode
	   || a[r].time != b[r].time
	   || a[r].amplitude != b[r].amplitude
	   || a[r].threshold != b[r].threshold
	   || a[r].conductance != b[r].conductance ) return false;
    return true;
  }

  void TEST_CsvRoundTrip()
  {
    std::cout << "[RUN ] CsvRoundTrip\n";
    spike_table_t s = example();
    s.add( spike_t( "e10.-1" , 1.0 / 3.0 , -12.345678901234567 , -0.1 , true ) );

    mea::write_csv( s , "test_spikes.csv" );
    const spike_table_t t = mea::read_csv( "test_spikes.csv" );
    CHECK( same( s , t ) , "export then import preserves every field" );
    CHECK( t.keys() == s.keys() , "group order preserved" );

    std::ifstream IN1( "test_spikes.csv" );
    std::string hdr , row;
    std::getline( IN1 , hdr );
    std::getline( IN1 , row );
    IN1.close();
    CHECK( hdr == "electrode,time,amplitude,threshold,conductance" , "header row" );
    CHECK( row == "b5,0.3,-40,-20,False" , "compact numbers and boolean spelling" );

    std::remove( "test_spikes.csv" );
    std::cout << "[DONE] CsvRoundTrip\n";
  }

  void TEST_CsvColumns()
  {
    std::cout << "[RUN ] CsvColumns\n";
    std::ofstream O( "test_columns.csv" );
    O << "time,conductance,electrode,extra\n"
      << "0.5,T,a4,x\n"
      << "0.25,0,b5,y\n"
      << "\n"
      << "0.75,True,a4,z";
    O.close();

    const spike_table_t s = mea::read_csv( "test_columns.csv" );
    CHECK( s.size() == 3 , "three rows, blank line skipped, last line without newline read" );
    CHECK( s.size() == 3 && s[0].electrode == "a4" && s[0].time == 0.5 && s[0].conductance , "columns found by name" );
    CHECK( s.size() == 3 && s[1].amplitude == 0 && ! s[1].conductance , "missing amplitude defaults to zero" );
    CHECK( s.size() == 3 && s[2].conductance , "True read as set" );

    O.open( "test_columns.csv" );
    O << "electrode,time\n" << "a4,oops\n";
    O.close();
    bool threw = false;
    try { mea::read_csv( "test_columns.csv" ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "bad time value halts" );

    O.open( "test_columns.csv" );
    O << "electrode,amplitude\n" << "a4,1\n";
    O.close();
    threw = false;
    try { mea::read_csv( "test_columns.csv" ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "missing time column halts" );

    O.open( "test_columns.csv" );
    O << "electrode,time\n" << "a4,1,2\n";
    O.close();
    threw = false;
    try { mea::read_csv( "test_columns.csv" ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "ragged row halts" );

    std::remove( "test_columns.csv" );
    std::cout << "[DONE] CsvColumns\n";
  }

  void TEST_DatabaseRoundTrip()
  {
    std::cout << "[RUN ] DatabaseRoundTrip\n";
    std::remove( "test_spikes.db" );

    spike_table_t s = example();
    mea::save_spikes( s , "test_spikes.db" );
    spike_table_t t = mea::load_spikes( "test_spikes.db" );
    CHECK( same( s , t ) , "SQLite store preserves every field" );

    // overwrite, not append
    s.clear_flags();
    mea::save_spikes( s , "test_spikes.db" );
    t = mea::load_spikes( "test_spikes.db" );
    CHECK( same( s , t ) , "second save replaces the first" );

    {
      spikedb_t db( "test_spikes.db" );
      CHECK( db.attached() , "store attached" );
      CHECK( db.count() == 6 , "row count" );
      CHECK( db.count_flagged() == 0 , "flag count" );
    }

    std::remove( "test_spikes.db" );
    std::cout << "[DONE] DatabaseRoundTrip\n";
  }

  void TEST_Condense()
  {
    std::cout << "[RUN ] Condense\n";
    mkdir( "test_condense" , 0755 );

    std::ofstream O( "test_condense/spikes_b5.txt" );
    O << "2.0\n";
    O.close();

    O.open( "test_condense/spikes_a4.txt" );
    O << "# times\n" << "0.5\n" << "\xb5s units\n" << "1.25\n";
    O.close();

    std::remove( "test_condensed.csv" );
    mea::condense_spikes( "test_condense" , "test_condensed.csv" );

    const spike_table_t s = mea::read_csv( "test_condensed.csv" );
    CHECK( s.size() == 3 , "one row per numeric line, non-ASCII lines skipped" );
    CHECK( s.size() == 3 && s[0].electrode == "a4" && s[0].time == 0.5 , "files in name order" );
    CHECK( s.size() == 3 && s[2].electrode == "b5" && s[2].time == 2.0 , "label from the file name" );

    std::remove( "test_condense/spikes_b5.txt" );
    std::remove( "test_condense/spikes_a4.txt" );
    rmdir( "test_condense" );
    std::remove( "test_condensed.csv" );
    std::cout << "[DONE] Condense\n";
  }

} // namespace

int main()
{
  std::cout << "=== Spike table Unit Tests ===\n";
  api_mode();
  TEST_Groups();
  TEST_SortGroups();
  TEST_RelabelAndFlags();
  TEST_CsvRoundTrip();
  TEST_CsvColumns();
  TEST_DatabaseRoundTrip();
  TEST_Condense();
  if ( g_failures == 0 )
    {
      std::cout << "[PASS] All tests passed.\n";
      return 0;
    }
  std::cout << "[FAIL] " << g_failures << " check(s) failed.\n";
  return 1;
}
