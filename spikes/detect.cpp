
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

#include "spikes/detect.h"

#include "param.h"
#include "mea/recording.h"
#include "dsp/iir.h"
#include "dsp/peaks.h"
#include "helper/helper.h"
#include "helper/logger.h"

extern logger_t logger;

void detect_param_t::init( const param_t & param )
{
  if ( param.has( "amp" ) ) amp = param.requires_dbl( "amp" );
  if ( param.has( "dead" ) ) dead_time = param.requires_dbl( "dead" );
  if ( param.has( "filter" ) ) filter = param.yesno( "filter" );
  if ( param.has( "low" ) ) low = param.requires_dbl( "low" );
  if ( param.has( "high" ) ) high = param.requires_dbl( "high" );
}


spike_table_t mea::detect_spikes( const recording_t & rec , const param_t & param )
{
  detect_param_t dp;
  dp.init( param );
  return detect_spikes( rec , dp );
}


spike_table_t mea::detect_spikes( const recording_t & rec , const detect_param_t & dp )
{

  logger << "  detecting spikes at " << dp.amp << " x noise, dead time " << dp.dead_time << "s";
  if ( dp.filter ) logger << ", after filtering " << dp.low << "-" << dp.high << " Hz";
  logger << "\n";

  spike_table_t spikes;

  const std::vector<std::string> & channels = rec.channels();

  for (int c=0; c<channels.size(); c++)
    {

      const series_t & raw = rec[ channels[c] ];

      if ( raw.size() < 2 ) continue;

      const series_t s = dp.filter ? dsptools::bandpass_filter( raw , dp.low , dp.high ) : raw ;

      const std::vector<peak_t> pk = dsptools::find_series_peaks( s , dp.amp , dp.dead_time );

      for (int i=0; i<pk.size(); i++)
	spikes.add( spike_t( channels[c] , pk[i].time , pk[i].amplitude , pk[i].threshold ) );

      logger << "   detected " << pk.size() << " spikes on " << channels[c] << "\n";
    }

  return spikes;
}
