
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


  void write_u16( std::ofstream & O , unsigned int v )
  {
    const char lo = v & 0xff;
    const char hi = ( v >> 8 ) & 0xff;
    O.write( &lo , 1 );
    O.write( &hi , 1 );
  }

  // 2 channels x 3 frames
  void write_binary( const std::string & f , int extra_bytes = 0 )
  {
    std::ofstream O( f.c_str() , std::ios::out | std::ios::binary );
    write_u16( O , 32768 ); write_u16( O , 32769 );
    write_u16( O , 32767 ); write_u16( O , 32768 + 100 );
    write_u16( O , 0 );     write_u16( O , 65535 );
    for (int i=0; i<extra_bytes; i++) O.put( 0 );
    O.close();
  }

  void TEST_ReadBinary()
  {
    std::cout << "[RUN ] ReadBinary\n";
    write_binary( "test_recording.bin" );

    std::vector<std::string> labels;
    labels.push_back( "a4" );
    labels.push_back( "b5" );

    const recording_t rec = mea::read_binary( "test_recording.bin" , 2 , labels , 10000 , 0.5 );

    CHECK( rec.size() == 2 , "two channels" );
    CHECK( rec.nsamples == 3 , "three samples per channel" );
    CHECK( rec.channels()[0] == "a4" && rec.channels()[1] == "b5" , "channels in file order" );
    CHECK( rec[ "a4" ].data[0] == 0 , "mid-scale is zero" );
    CHECK( rec[ "a4" ].data[1] == -0.5 , "one count below mid-scale" );
    CHECK( rec[ "a4" ].data[2] == -16384 , "zero count" );
    CHECK( rec[ "b5" ].data[0] == 0.5 , "interleaved second channel" );
    CHECK( rec[ "b5" ].data[1] == 50 , "calibration applied" );
    CHECK( rec[ "b5" ].data[2] == 16383.5 , "full-scale count" );
    CHECK( fabs( rec[ "b5" ].time[2] - 0.0002 ) < 1e-15 , "time index i / fs" );
    CHECK( fabs( rec.duration() - 0.0003 ) < 1e-15 , "duration" );

    std::remove( "test_recording.bin" );
    std::cout << "[DONE] ReadBinary\n";
  }

  void TEST_ReadBinaryFromParameters()
  {
    std::cout << "[RUN ] ReadBinaryFromParameters\n";
    write_binary( "test_recording.bin" );

    param_t param;
    param.parse( "bin=test_recording.bin" );
    param.parse( "ch=a4,b5" );
    param.parse( "fs=10000" );
    param.parse( "cal=2" );

    const recording_t rec = mea::read_binary( param );
    CHECK( rec.sample_rate == 10000 , "sample rate from fs" );
    CHECK( rec[ "b5" ].data[1] == 200 , "calibration from cal" );

    param_t bad;
    bad.parse( "bin=test_recording.bin" );
    bad.parse( "ch=a4,b5,c6,d7,e8" );
    bool threw = false;
    try { mea::read_binary( bad ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "byte count not a multiple of the frame size halts" );

    std::remove( "test_recording.bin" );
    std::cout << "[DONE] ReadBinaryFromParameters\n";
  }

  void TEST_ReadBinaryErrors()
  {
    std::cout << "[RUN ] ReadBinaryErrors\n";
    std::vector<std::string> labels( 1 , "a4" );

    bool threw = false;
    try { mea::read_binary( "no_such_file.bin" , 1 , labels , 20000 , 1 ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "missing file halts" );

    write_binary( "test_recording.bin" );
    threw = false;
    try { mea::read_binary( "test_recording.bin" , 2 , labels , 20000 , 1 ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "label count differing from nch halts" );

    write_binary( "test_recording.bin" , 1 );
    labels.push_back( "b5" );
    threw = false;
    try { mea::read_binary( "test_recording.bin" , 2 , labels , 20000 , 1 ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "trailing partial frame halts" );

    std::remove( "test_recording.bin" );
    std::cout << "[DONE] ReadBinaryErrors\n";
  }

  void TEST_Slices()
  {
    std::cout << "[RUN ] Slices\n";
    recording_t rec( 1000 );
    std::vector<double> x( 100 );
    for (int i=0; i<100; i++) x[i] = i;
    rec.add( "a4" , x );

    series_t s = rec.get( "a4" , 0.010 , 0.020 );
    CHECK( s.size() == 10 && s.data[0] == 10 && s.data[9] == 19 , "[start,end) slice" );

    s = rec.get( "a4" , -1 , 5 );
    CHECK( s.size() == 100 , "slice clipped to the recording" );

    s = rec.get( "a4" , 0.095 );
    CHECK( s.size() == 5 && s.data[4] == 99 , "open end runs to the last sample" );

    bool threw = false;
    try { rec.add( "a4" , x ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "duplicate channel halts" );

    threw = false;
    try { rec.add( "b5" , std::vector<double>( 50 , 0 ) ); }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "channel of a different length halts" );

    threw = false;
    try { rec[ "c6" ]; }
    catch ( const std::runtime_error & ) { threw = true; }
    CHECK( threw , "unknown channel halts" );
    std::cout << "[DONE] Slices\n";
  }

  void TEST_FrameCount()
  {
    std::cout << "[RUN ] FrameCount\n";
    const int nch = 60;
    const int nframes = 5000;
    {
      std::ofstream O( "test_recording.bin" , std::ios::out | std::ios::binary );
      for (int r=0; r<nframes; r++)
	for (int c=0; c<nch; c++)
	  write_u16( O , 32768 + c + ( r % 100 ) );
    }

    std::vector<std::string> labels;
    for (int c=0; c<nch; c++) labels.push_back( "ch" + Helper::int2str( c ) );

    const recording_t rec = mea::read_binary( "test_recording.bin" , nch , labels , 20000 , 1 );
    CHECK( rec.size() == nch , "sixty channels" );
    CHECK( rec.nsamples == nframes , "frame count is file size over frame size" );
    CHECK( rec[ "ch0" ].size() == nframes && rec[ "ch59" ].size() == nframes , "every channel has every frame" );
    CHECK( rec[ "ch59" ].data[ nframes - 1 ] == 59 + 99 , "last byte pair goes to the last channel" );
    CHECK( rec[ "ch7" ].data[ 4321 ] == 7 + 21 , "interior sample decoded from its own frame" );
    CHECK( fabs( rec.duration() - 0.25 ) < 1e-12 , "duration from frame count" );

    std::remove( "test_recording.bin" );
    std::cout << "[DONE] FrameCount\n";
  }

} // namespace

int main()
{
  std::cout << "=== Recording Unit Tests ===\n";
  api_mode();
  TEST_ReadBinary();
  TEST_ReadBinaryFromParameters();
  TEST_ReadBinaryErrors();
  TEST_Slices();
  TEST_FrameCount();
  if ( g_failures == 0 )
    {
      std::cout << "[PASS] All tests passed.\n";
      return 0;
    }
  std::cout << "[FAIL] " << g_failures << " check(s) failed.\n";
  return 1;
}
