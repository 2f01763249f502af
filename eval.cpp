
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

#include "eval.h"
#include "cmea.h"

extern logger_t logger;

bool is( const std::string & c , const std::string & s )
{
  return Helper::iequals( c , s );
}


void cmea_eval( const std::string & c , param_t & param )
{

  logger << "\n ..................................................................\n"
	 << " CMD #1: " << Helper::toupper( c ) << "\n";

  if ( param.size() != 0 )
    logger << "   options: " << param.dump( "" , " " ) << "\n";

  if      ( is( c, "DETECT" ) )       proc_detect( param );
  else if ( is( c, "SORT" ) )         proc_sort( param );
  else if ( is( c, "TAG" ) )          proc_tag( param );
  else if ( is( c, "COFIRE" ) )       proc_cofire( param );
  else if ( is( c, "CONDENSE" ) )     proc_condense( param );
  else if ( is( c, "MAP" ) )          proc_map( param );
  else
    Helper::halt( "did not recognize command: " + c );

}


// DETECT : spike detection on a binary recording
void proc_detect( param_t & param )
{
  const recording_t rec = mea::read_binary( param );
  const spike_table_t spikes = mea::detect_spikes( rec , param );
  logger << "  detected " << spikes.size() << " spikes in total\n";
  mea::save_spikes( spikes , param.requires( "out" ) );
}


// SORT : split each electrode into waveform sub-clusters
void proc_sort( param_t & param )
{
  spike_table_t spikes = mea::load_spikes( param.requires( "spikes" ) );
  const recording_t rec = mea::read_binary( param );
  mea::sort_spikes( spikes , rec , param );
  mea::save_spikes( spikes , param.requires( "out" ) );
}


// TAG : flag conductance artifacts
void proc_tag( param_t & param )
{

  spike_table_t spikes = mea::load_spikes( param.requires( "spikes" ) );

  const std::vector<conductance_pair_t> pairs = mea::tag_conductance_spikes( spikes , param );

  std::cout << "E1\tE2\tN\tJITTER\tKEEP\tFLAGGED\n";

  for (int p=0; p<pairs.size(); p++)
    std::cout << pairs[p].e1 << "\t"
	      << pairs[p].e2 << "\t"
	      << pairs[p].events << "\t"
	      << pairs[p].jitter << "\t"
	      << pairs[p].keep << "\t"
	      << pairs[p].flagged.size() << "\n";

  if ( param.has( "out" ) )
    mea::save_spikes( spikes , param.value( "out" ) );
}


// COFIRE : list the cofiring events of one electrode pair
void proc_cofire( param_t & param )
{

  const spike_table_t spikes = mea::load_spikes( param.requires( "spikes" ) );

  const std::string e1 = param.requires( "e1" );
  const std::string e2 = param.requires( "e2" );

  if ( ! spikes.has( e1 ) ) Helper::halt( "no spikes for electrode " + e1 );
  if ( ! spikes.has( e2 ) ) Helper::halt( "no spikes for electrode " + e2 );

  const double sep = param.has( "sep" ) ? param.requires_dbl( "sep" ) : defaults::cofire_sep;

  const std::vector<cofiring_event_t> events = mea::cofiring_events( spikes , e1 , e2 , sep );

  logger << "  " << events.size() << " cofiring events between "
	 << e1 << " and " << e2 << " (" << sep << "s)\n";

  std::cout << "EVENT\tE1\tT1\tA1\tE2\tT2\tA2\tLAG\n";

  for (int i=0; i<events.size(); i++)
    {
      const spike_t & a = spikes[ events[i].a ];
      const spike_t & b = spikes[ events[i].b ];
      std::cout << i + 1 << "\t"
		<< a.electrode << "\t" << a.time << "\t" << a.amplitude << "\t"
		<< b.electrode << "\t" << b.time << "\t" << b.amplitude << "\t"
		<< 1000.0 * ( b.time - a.time ) << "\n";
    }

  double jitter = 0;
  if ( mea::event_jitter( spikes , events , sep , &jitter ) )
    logger << "  jitter " << jitter << " ms\n";
}


// CONDENSE : gather per-channel spike files
void proc_condense( param_t & param )
{
  mea::condense_spikes( param.requires( "dir" ) , param.requires( "out" ) );
}


// MAP : electrode grid positions and spike counts
void proc_map( param_t & param )
{

  const spike_table_t spikes = mea::load_spikes( param.requires( "spikes" ) );

  const double dur = spikes.max_time();

  std::cout << "CH\tX\tY\tN\tRATE\tCOND\n";

  for (int g=0; g<spikes.ngroups(); g++)
    {
      const std::string & tag = spikes.tag( g );
      const std::pair<int,int> xy = mea::coordinates_for_electrode( tag );
      const int n = spikes.group( g ).size();
      std::cout << tag << "\t"
		<< xy.first << "\t"
		<< xy.second << "\t"
		<< n << "\t"
		<< ( dur > 0 ? n / dur : 0 ) << "\t"
		<< spikes.flagged( tag ) << "\n";
    }
}
