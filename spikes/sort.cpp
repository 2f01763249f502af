
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

#include "spikes/sort.h"
#include "spikes/spikes.h"

#include "param.h"
#include "mea/recording.h"
#include "mea/electrodes.h"
#include "dsp/iir.h"
#include "dsp/waveforms.h"
#include "stats/eigen_ops.h"
#include "stats/pca.h"
#include "stats/dbscan.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <map>

extern logger_t logger;

void subcluster_param_t::init( const param_t & param )
{
  if ( param.has( "low" ) ) low = param.requires_dbl( "low" );
  if ( param.has( "high" ) ) high = param.requires_dbl( "high" );
  if ( param.has( "win" ) ) window_len = param.requires_dbl( "win" );
  if ( param.has( "eps" ) ) eps = param.requires_dbl( "eps" );
  if ( param.has( "minpts" ) ) minpts = param.requires_int( "minpts" );
}


std::vector<int> mea::subcluster( const std::vector<std::vector<double> > & waveforms ,
				  const int full_length ,
				  const subcluster_param_t & sp )
{

  const int n = waveforms.size();

  std::vector<int> labels( n , dbscan_t::NOISE );

  // truncated (boundary) waveforms cannot be embedded
  std::vector<int> idx;
  std::vector<std::vector<double> > w;
  for (int i=0; i<n; i++)
    if ( full_length > 0 && waveforms[i].size() == full_length )
      {
	idx.push_back( i );
	w.push_back( waveforms[i] );
      }

  if ( w.size() < sp.minpts ) return labels;

  pca_t pca( sp.nc );

  const Eigen::MatrixXd scores = pca.fit( eigen_ops::from_rows( w ) );

  dbscan_t dbscan( sp.eps , sp.minpts );

  const dbscan_solution_t sol = dbscan.build( scores );

  for (int i=0; i<idx.size(); i++)
    labels[ idx[i] ] = sol.label[i];

  return labels;
}


void mea::sort_spikes( spike_table_t & spikes , const recording_t & rec , const param_t & param )
{
  subcluster_param_t sp;
  sp.init( param );
  sort_spikes( spikes , rec , sp );
}


void mea::sort_spikes( spike_table_t & spikes , const recording_t & rec , const subcluster_param_t & sp )
{

  logger << "  sub-clustering " << spikes.ngroups() << " electrodes, "
	 << sp.window_len << "s windows, eps = " << sp.eps << ", minpts = " << sp.minpts << "\n";

  std::vector<std::string> tags( spikes.size() );
  for (int r=0; r<spikes.size(); r++) tags[r] = spikes[r].electrode;

  // filtered channels
  std::map<std::string,series_t> filtered;

  const std::vector<std::string> electrodes = spikes.electrodes();

  for (int e=0; e<electrodes.size(); e++)
    {

      const std::string & tag = electrodes[e];

      const std::string ch = mea::base_tag( tag );

      if ( ! rec.has( ch ) )
	Helper::halt( "no signal data for electrode " + tag );

      if ( filtered.find( ch ) == filtered.end() )
	filtered[ ch ] = dsptools::bandpass_filter( rec[ ch ] , sp.low , sp.high );

      const series_t & s = filtered[ ch ];

      const std::vector<int> & g = spikes.group( tag );

      std::vector<double> times( g.size() );
      for (int i=0; i<g.size(); i++) times[i] = spikes[ g[i] ].time;

      const std::vector<std::vector<double> > w = dsptools::extract_waveforms( s , times , sp.window_len );

      const int full = dsptools::waveform_length( sp.window_len , s.dt() );

      const std::vector<int> labels = subcluster( w , full , sp );

      std::set<int> clusters;
      int noise = 0;

      for (int i=0; i<g.size(); i++)
	{
	  tags[ g[i] ] = tag + "." + Helper::int2str( labels[i] );
	  if ( labels[i] == dbscan_t::NOISE ) ++noise;
	  else clusters.insert( labels[i] );
	}

      logger << "   " << tag << " : " << g.size() << " spikes, "
	     << clusters.size() << " clusters, " << noise << " noise\n";
    }

  spikes.relabel( tags );
}
