
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

#include "dsp/waveforms.h"

#include "mea/series.h"
#include "helper/helper.h"

#include <cmath>

// guards against 0.0015 / 0.00005 evaluating to 29.999...
static const double EPS = 1e-9;

int dsptools::waveform_length( double window_len , double dt )
{
  if ( dt <= 0 ) Helper::halt( "sampling interval must be positive" );
  if ( window_len <= 0 ) Helper::halt( "waveform window must be positive" );
  return 2 * (int)floor( window_len / ( 2.0 * dt ) + EPS );
}


std::vector<std::vector<double> > dsptools::extract_waveforms( const series_t & s ,
							       const std::vector<double> & times ,
							       double window_len )
{

  const double dt = s.dt();

  const int span = waveform_length( window_len , dt ) / 2;

  const int n = s.size();

  const double t0 = s.time[0];

  std::vector<std::vector<double> > w( times.size() );

  for (int i=0; i<times.size(); i++)
    {
      // nearest sample
      const int x = floor( ( times[i] - t0 ) / dt + 0.5 );

      int start = x - span;
      int stop  = x + span;

      if ( start < 0 ) start = 0;
      if ( stop > n ) stop = n;

      if ( start < stop )
	w[i].assign( s.data.begin() + start , s.data.begin() + stop );
    }

  return w;
}
