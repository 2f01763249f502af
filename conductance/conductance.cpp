
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

#include "conductance/conductance.h"

#include "spikes/spikes.h"
#include "mea/electrodes.h"
#include "param.h"
#include "defs/defs.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"

#include <map>
#include <cmath>

extern logger_t logger;

void conductance_param_t::init( const param_t & param )
{
  if ( param.has( "sep" ) ) sep = param.requires_dbl( "sep" );
  if ( param.has( "min-events" ) ) min_events = param.requires_int( "min-events" );
  if ( param.has( "max-jitter" ) ) max_jitter = param.requires_dbl( "max-jitter" );
  if ( param.has( "keep-frac" ) ) keep_frac = param.requires_dbl( "keep-frac" );

  if ( sep <= 0 ) Helper::halt( "sep must be positive" );
  if ( min_events < 0 ) Helper::halt( "min-events cannot be negative" );
  if ( max_jitter <= 0 ) Helper::halt( "max-jitter must be positive" );
  if ( keep_frac <= 0 || keep_frac > 1 ) Helper::halt( "keep-frac must be in (0,1]" );
}


bool mea::event_jitter( const spike_table_t & spikes ,
			const std::vector<cofiring_event_t> & events ,
			const double sep ,
			double * jitter )
{

  std::vector<double> t;
  for (int i=0; i<events.size(); i++)
    {
      t.push_back( spikes[ events[i].a ].time );
      t.push_back( spikes[ events[i].b ].time );
    }

  // includes negative steps between events
  const std::vector<double> d = MiscMath::diff( t );

  std::vector<double> close;
  for (int i=0; i<d.size(); i++)
    if ( d[i] < sep ) close.push_back( d[i] );

  if ( close.size() < 2 )
    {
      *jitter = 0;
      return false;
    }

  *jitter = 1000.0 * MiscMath::sdev( close );
  return true;
}


bool mea::is_conductance_pair( const spike_table_t & spikes ,
			       const std::vector<cofiring_event_t> & events ,
			       const conductance_param_t & cp ,
			       double * jitter )
{
  double j = 0;
  const bool okay = event_jitter( spikes , events , cp.sep , &j );
  if ( jitter != NULL ) *jitter = j;

  if ( ! okay ) return false;

  return events.size() > cp.min_events && j < cp.max_jitter;
}


std::string mea::choose_keep_electrode( const spike_table_t & spikes ,
					const std::vector<int> & rows ,
					const double keep_frac )
{

  if ( rows.size() == 0 )
    {
      Helper::halt( "no cofiring spikes to choose an electrode from" );
      return "";
    }

  // alphabetical
  std::map<std::string,double> sum;
  std::map<std::string,int> cnt;

  for (int i=0; i<rows.size(); i++)
    {
      const spike_t & s = spikes[ rows[i] ];
      sum[ s.electrode ] += s.amplitude;
      cnt[ s.electrode ]++;
    }

  std::map<std::string,double> amp;
  double mx = 0;

  std::map<std::string,double>::const_iterator ss = sum.begin();
  while ( ss != sum.end() )
    {
      const double a = fabs( ss->second / cnt[ ss->first ] );
      amp[ ss->first ] = a;
      if ( a > mx ) mx = a;
      ++ss;
    }

  std::map<std::string,double>::const_iterator aa = amp.begin();
  while ( aa != amp.end() )
    {
      if ( aa->second > keep_frac * mx ) return aa->first;
      ++aa;
    }

  // all zero amplitudes
  return amp.begin()->first;
}


std::string mea::choose_keep_electrode( const spike_table_t & spikes ,
					const std::vector<cofiring_event_t> & events ,
					const double keep_frac )
{
  std::vector<int> rows;
  for (int i=0; i<events.size(); i++)
    {
      rows.push_back( events[i].a );
      rows.push_back( events[i].b );
    }
  return choose_keep_electrode( spikes , rows , keep_frac );
}


bool mea::analyse_pair( const spike_table_t & spikes ,
			const std::string & e1 ,
			const std::string & e2 ,
			const conductance_param_t & cp ,
			conductance_pair_t * pair )
{

  const std::vector<cofiring_event_t> events = cofiring_events( spikes , e1 , e2 , cp.sep );

  // nothing to test
  if ( events.size() < 2 ) return false;

  double jitter = 0;

  if ( ! is_conductance_pair( spikes , events , cp , &jitter ) ) return false;

  pair->e1 = e1;
  pair->e2 = e2;
  pair->events = events.size();
  pair->jitter = jitter;
  pair->keep = choose_keep_electrode( spikes , events , cp.keep_frac );
  pair->flagged.clear();

  for (int i=0; i<events.size(); i++)
    {
      if ( spikes[ events[i].a ].electrode != pair->keep ) pair->flagged.insert( events[i].a );
      if ( spikes[ events[i].b ].electrode != pair->keep ) pair->flagged.insert( events[i].b );
    }

  return true;
}


std::vector<conductance_pair_t> mea::tag_conductance_spikes( spike_table_t & spikes , const param_t & param )
{
  conductance_param_t cp;
  cp.init( param );
  return tag_conductance_spikes( spikes , cp );
}


std::vector<conductance_pair_t> mea::tag_conductance_spikes( spike_table_t & spikes ,
							     const conductance_param_t & cp )
{

  std::vector<std::string> tags;
  for (int i=0; i<spikes.ngroups(); i++)
    if ( ! mea::is_analog( spikes.tag(i) ) )
      tags.push_back( spikes.tag(i) );

  const int ne = tags.size();

  logger << "  testing " << ne * ( ne - 1 ) / 2 << " electrode pairs for conductance ("
	 << cp.sep << "s separation, > " << cp.min_events << " events, jitter < "
	 << cp.max_jitter << " ms)\n";

  std::vector<conductance_pair_t> pairs;

  for (int i=0; i<ne; i++)
    for (int j=i+1; j<ne; j++)
      {
	conductance_pair_t pair;
	if ( analyse_pair( spikes , tags[i] , tags[j] , cp , &pair ) )
	  {
	    logger << "   " << pair.e1 << " / " << pair.e2 << " : " << pair.events
		   << " cofiring events, jitter " << pair.jitter << " ms, keeping "
		   << pair.keep << "\n";
	    pairs.push_back( pair );
	  }
	else if ( globals::verbose )
	  Helper::debug( tags[i] + " / " + tags[j] + " : not a conductance pair" );
      }

  //
  // single write of all flags
  //

  std::set<int> rows;
  for (int p=0; p<pairs.size(); p++)
    rows.insert( pairs[p].flagged.begin() , pairs[p].flagged.end() );

  spikes.clear_flags();
  spikes.flag( rows );

  logger << "  flagged " << rows.size() << " of " << spikes.size()
	 << " spikes in " << pairs.size() << " conductance pairs\n";

  return pairs;
}
