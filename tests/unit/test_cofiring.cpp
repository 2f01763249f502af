
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


  void TEST_IsolatedPair()
  {
    std::cout << "[RUN ] IsolatedPair\n";
    spike_table_t s;
    s.add( spike_t( "A" , 1.000 ) );
    s.add( spike_t( "B" , 1.0008 ) );
    s.add( spike_t( "A" , 1.010 ) );

    const std::vector<cofiring_event_t> ev = mea::cofiring_events( s , "A" , "B" , 0.0012 );
    CHECK( ev.size() == 1 , "exactly one cofiring event" );
    CHECK( ev.size() == 1 && ev[0].a == 0 && ev[0].b == 1 , "event holds the first two rows" );

    const std::vector<cofiring_event_t> ev2 = mea::cofiring_events( s , "A" , "B" , 0.0005 );
    CHECK( ev2.size() == 0 , "gap wider than the separation splits the pair" );
    std::cout << "[DONE] IsolatedPair\n";
  }

  void TEST_RunsOfOtherSizes()
  {
    std::cout << "[RUN ] RunsOfOtherSizes\n";
    spike_table_t s;
    // run of three
    s.add( spike_t( "a4" , 2.0 ) );
    s.add( spike_t( "b5" , 2.0005 ) );
    s.add( spike_t( "a4" , 2.001 ) );
    // same-electrode pair
    s.add( spike_t( "a4" , 3.0 ) );
    s.add( spike_t( "a4" , 3.0003 ) );
    // isolated
    s.add( spike_t( "b5" , 4.0 ) );

    const std::vector<cofiring_event_t> ev = mea::cofiring_events( s , "a4" , "b5" , 0.0012 );
    CHECK( ev.size() == 0 , "runs of one, three, or a single electrode are not events" );
    std::cout << "[DONE] RunsOfOtherSizes\n";
  }

  void TEST_CanonicalOrder()
  {
    std::cout << "[RUN ] CanonicalOrder\n";
    spike_table_t s;
    s.add( spike_t( "b5" , 5.0 , -10 ) );
    s.add( spike_t( "a4" , 5.0004 , -20 ) );
    s.add( spike_t( "a4" , 1.0 , -30 ) );
    s.add( spike_t( "b5" , 1.0001 , -40 ) );

    const std::vector<cofiring_event_t> ev = mea::cofiring_events( s , "b5" , "a4" , 0.0005 );
    CHECK( ev.size() == 2 , "two events" );
    if ( ev.size() == 2 )
      {
	CHECK( ev[0].a == 2 && ev[0].b == 3 , "events in time order" );
	CHECK( ev[1].a == 1 && ev[1].b == 0 , "members ordered by electrode tag" );
      }
    std::cout << "[DONE] CanonicalOrder\n";
  }

  void TEST_RowSubsets()
  {
    std::cout << "[RUN ] RowSubsets\n";
    spike_table_t s;
    s.add( spike_t( "a4" , 1.0 ) );
    s.add( spike_t( "b5" , 1.0001 ) );
    s.add( spike_t( "c6" , 1.0002 ) );

    std::vector<int> rows;
    rows.push_back( 1 );
    rows.push_back( 0 );
    CHECK( mea::cofiring_events( s , rows ).size() == 1 , "unsorted subset of two electrodes" );

    rows.push_back( 2 );
    CHECK( mea::cofiring_events( s , rows ).size() == 0 , "three electrodes together form a run of three" );

    CHECK( mea::cofiring_events( s , std::vector<int>() ).size() == 0 , "no rows, no events" );
    CHECK( mea::cofiring_events( s , "a4" , "d7" ).size() == 0 , "missing electrode, no events" );
    std::cout << "[DONE] RowSubsets\n";
  }

  void TEST_TiesAreStable()
  {
    std::cout << "[RUN ] TiesAreStable\n";
    spike_table_t s;
    s.add( spike_t( "b5" , 2.0 ) );
    s.add( spike_t( "a4" , 2.0 ) );
    const std::vector<cofiring_event_t> ev = mea::cofiring_events( s , "b5" , "a4" , 0.0005 );
    CHECK( ev.size() == 1 && ev[0].a == 1 && ev[0].b == 0 , "simultaneous spikes form one event" );
    std::cout << "[DONE] TiesAreStable\n";
  }

} // namespace

int main()
{
  std::cout << "=== Cofiring Unit Tests ===\n";
  api_mode();
  TEST_IsolatedPair();
  TEST_RunsOfOtherSizes();
  TEST_CanonicalOrder();
  TEST_RowSubsets();
  TEST_TiesAreStable();
  if ( g_failures == 0 )
    {
      std::cout << "[PASS] All tests passed.\n";
      return 0;
    }
  std::cout << "[FAIL] " << g_failures << " check(s) failed.\n";
  return 1;
}
