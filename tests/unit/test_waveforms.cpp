
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


  series_t ramp( int n , double fs , double t0 = 0 )
  {
    std::vector<double> x( n );
    for (int i=0; i<n; i++) x[i] = i;
    return series_t( x , fs , t0 );
  }

  void TEST_FullLength()
  {
    std::cout << "[RUN ] FullLength\n";
    CHECK( dsptools::waveform_length( 0.003 , 1.0 / 20000 ) == 60 , "3 ms at 20 kHz is 60 samples" );
    CHECK( dsptools::waveform_length( 0.003 , 1.0 / 25000 ) == 74 , "3 ms at 25 kHz is 74 samples" );
    CHECK( dsptools::waveform_length( 0.001 , 0.0003 ) == 2 , "window of 3.3 samples rounds down to an even length" );
    std::cout << "[DONE] FullLength\n";
  }

  void TEST_CentredWindow()
  {
    std::cout << "[RUN ] CentredWindow\n";
    const series_t s = ramp( 1000 , 20000 );
    std::vector<double> t( 1 , 0.025 );
    const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , t );
    CHECK( w.size() == 1 , "one waveform per time" );
    CHECK( w[0].size() == 60 , "interior waveform has the full length" );
    CHECK( w[0].size() == 60 && w[0][0] == 470 , "window starts half a window before the spike" );
    CHECK( w[0].size() == 60 && w[0][30] == 500 , "spike sample sits at the window midpoint" );
    CHECK( w[0].size() == 60 && w[0][59] == 529 , "window end is exclusive" );
    std::cout << "[DONE] CentredWindow\n";
  }

  void TEST_BoundaryWindowsAreShorter()
  {
    std::cout << "[RUN ] BoundaryWindowsAreShorter\n";
    const series_t s = ramp( 1000 , 20000 );
    std::vector<double> t;
    t.push_back( 0.0005 );  // sample 10
    t.push_back( 0.049 );   // sample 980
    t.push_back( 0.0015 );  // sample 30, exactly half a window in
    const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , t );
    CHECK( w.size() == 3 , "one waveform per time, in input order" );
    CHECK( w[0].size() == 40 && w[0][0] == 0 , "start of series truncates the window" );
    CHECK( w[1].size() == 50 && w[1][49] == 999 , "end of series truncates the window" );
    CHECK( w[2].size() == 60 && w[2][0] == 0 , "window touching the start is complete" );
    for (int i=0; i<w.size(); i++)
      CHECK( w[i].size() <= dsptools::waveform_length( 0.003 , s.dt() ) , "never longer than the full length" );
    std::cout << "[DONE] BoundaryWindowsAreShorter\n";
  }

  void TEST_OffsetTimeIndex()
  {
    std::cout << "[RUN ] OffsetTimeIndex\n";
    const series_t s = ramp( 1000 , 20000 , 1.0 );
    std::vector<double> t( 1 , 1.025 );
    const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , t , 0.001 );
    CHECK( w[0].size() == 20 , "1 ms window is 20 samples" );
    CHECK( w[0].size() == 20 && w[0][10] == 500 , "spike index is taken relative to the first sample" );
    std::cout << "[DONE] OffsetTimeIndex\n";
  }

  void TEST_LateTimeStamps()
  {
    std::cout << "[RUN ] LateTimeStamps\n";
    // a stretch of a 20 kHz recording starting past sample 2^24
    const double fs = 20000;
    const int first = 16777200;
    const int n = 400;
    std::vector<double> tt( n ) , x( n );
    for (int i=0; i<n; i++)
      {
	tt[i] = ( first + i ) / fs;
	x[i] = i;
      }
    const series_t s( tt , x );
    std::vector<double> t;
    for (int i=30; i<n-30; i++) t.push_back( tt[i] );
    const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , t );
    int centred = 0;
    for (int i=0; i<w.size(); i++)
      if ( w[i].size() == 60 && w[i][30] == i + 30 ) ++centred;
    CHECK( centred == t.size() , "every window is centred on its own sample late in a recording" );
    std::cout << "[DONE] LateTimeStamps\n";
  }

  void TEST_OffsetEverySample()
  {
    std::cout << "[RUN ] OffsetEverySample\n";
    const series_t s = ramp( 1000 , 20000 , 1.0 );
    int centred = 0;
    for (int i=10; i<990; i++)
      {
	std::vector<double> t( 1 , s.time[i] );
	const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , t , 0.001 );
	if ( w[0].size() == 20 && w[0][10] == i ) ++centred;
      }
    CHECK( centred == 980 , "each sample time maps back to that sample with a non-zero start" );
    std::cout << "[DONE] OffsetEverySample\n";
  }

} // namespace

int main()
{
  std::cout << "=== Waveform Unit Tests ===\n";
  api_mode();
  TEST_FullLength();
  TEST_CentredWindow();
  TEST_BoundaryWindowsAreShorter();
  TEST_OffsetTimeIndex();
  TEST_LateTimeStamps();
  TEST_OffsetEverySample();
  if ( g_failures == 0 )
    {
      std::cout << "[PASS] All tests passed.\n";
      return 0;
    }
  std::cout << "[FAIL] " << g_failures << " check(s) failed.\n";
  return 1;
}
