
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

#include "mea/recording.h"

#include "param.h"
#include "defs/defs.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "miscmath/miscmath.h"

#include <fstream>

extern logger_t logger;


void recording_t::add( const std::string & label , const std::vector<double> & x )
{
  if ( has( label ) )
    Helper::halt( "channel " + label + " specified twice" );

  if ( order.size() != 0 && x.size() != nsamples )
    Helper::halt( "channel " + label + " has a different number of samples" );

  nsamples = x.size();

  data[ label ] = series_t( x , sample_rate );
  order.push_back( label );
}


const series_t & recording_t::operator[]( const std::string & label ) const
{
  std::map<std::string,series_t>::const_iterator ii = data.find( label );
  if ( ii == data.end() )
    Helper::halt( "no signal data for channel " + label );
  return ii->second;
}


series_t recording_t::get( const std::string & label , double start , double end ) const
{
  const series_t & s = (*this)[ label ];

  if ( end < 0 ) end = duration();

  const int n = s.size();

  const int start_i = MiscMath::clip( start * sample_rate , 0 , n - 1 );
  const int end_i   = MiscMath::clip( end * sample_rate , 0 , n );

  series_t r;
  for (int i=start_i; i<end_i; i++)
    {
      r.time.push_back( s.time[i] );
      r.data.push_back( s.data[i] );
    }
  return r;
}


recording_t mea::read_binary( const std::string & f ,
			      const int nch ,
			      const std::vector<std::string> & labels ,
			      const double fs ,
			      const double cal )
{

  const std::string filename = Helper::expand( f );

  if ( ! Helper::fileExists( filename ) )
    Helper::halt( "could not find " + filename );

  if ( nch < 1 )
    Helper::halt( "expecting at least one channel" );

  if ( labels.size() != nch )
    Helper::halt( "expecting " + Helper::int2str( nch ) + " channel labels, but found "
		  + Helper::int2str( (int)labels.size() ) );

  if ( fs <= 0 )
    Helper::halt( "sample rate must be positive" );

  std::ifstream IN1( filename.c_str() , std::ios::in | std::ios::binary );

  std::vector<char> buffer( ( std::istreambuf_iterator<char>( IN1 ) ) ,
			    std::istreambuf_iterator<char>() );

  IN1.close();

  const int bytes_per_frame = 2 * nch;

  if ( buffer.size() % bytes_per_frame )
    Helper::halt( filename + " size is not a multiple of " + Helper::int2str( bytes_per_frame ) + " bytes" );

  const size_t nframes = buffer.size() / bytes_per_frame;

  std::vector<std::vector<double> > d( nch );
  for (int c=0; c<nch; c++) d[c].resize( nframes );

  // little-endian, sample-major
  size_t p = 0;
  for (size_t r=0; r<nframes; r++)
    for (int c=0; c<nch; c++)
      {
	const unsigned int lo = (unsigned char)buffer[ p++ ];
	const unsigned int hi = (unsigned char)buffer[ p++ ];
	const unsigned int v = lo | ( hi << 8 );
	d[c][r] = ( v - 32768.0 ) * cal;
      }

  recording_t rec( fs );

  for (int c=0; c<nch; c++)
    rec.add( labels[c] , d[c] );

  logger << "  read " << nch << " channels, " << nframes << " samples ("
	 << rec.duration() << " seconds) from " << filename << "\n";

  return rec;
}


recording_t mea::read_binary( const param_t & param )
{
  const std::string filename = param.requires( "bin" );

  const std::vector<std::string> labels = param.strvector( "ch" );

  const int nch = param.has( "nch" ) ? param.requires_int( "nch" ) : labels.size();

  const double fs = param.has( "fs" ) ? param.requires_dbl( "fs" ) : defaults::sample_rate;

  const double cal = param.has( "cal" ) ? param.requires_dbl( "cal" ) : defaults::cal;

  return read_binary( filename , nch , labels , fs , cal );
}
