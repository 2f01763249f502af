
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

#include "dsp/peaks.h"

#include "mea/series.h"
#include "helper/helper.h"
#include "miscmath/miscmath.h"

#include <cmath>

std::vector<peak_t> dsptools::find_series_peaks( const series_t & s , double amp , double dead_time )
{
  peaks_t peaks;
  peaks.amp = amp;
  peaks.dead_time = dead_time;
  peaks.detect( s );
  return peaks.pk;
}


void peaks_t::detect( const series_t & s )
{

  pk.clear();

  const int n = s.size();

  if ( n == 0 ) return;

  if ( amp <= 0 )
    Helper::halt( "detection threshold multiplier must be positive" );

  if ( dead_time < 0 )
    Helper::halt( "dead time cannot be negative" );

  //
  // robust noise estimate
  //

  noise = MiscMath::mad( s.data ) / 0.6745;

  threshold = - amp * noise;

  //
  // scan excursions below threshold
  //

  bool inside = false;
  int best = -1;

  double last = 0;
  bool have_last = false;

  for (int i=0; i<=n; i++)
    {

      const bool below = i < n && s.data[i] < threshold;

      if ( below )
	{
	  if ( ! inside ) { inside = true; best = i; }
	  else if ( s.data[i] < s.data[ best ] ) best = i;
	  continue;
	}

      if ( ! inside ) continue;

      // end of excursion: accept its minimum unless within the dead time
      inside = false;

      const double t = s.time[ best ];

      if ( have_last && t - last < dead_time ) continue;

      pk.push_back( peak_t( t , s.data[ best ] , threshold ) );

      last = t;
      have_last = true;
    }

}
