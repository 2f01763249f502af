
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

#include "conductance/cofiring.h"

#include "spikes/spikes.h"
#include "helper/helper.h"

#include <algorithm>

namespace {

  struct by_time_t {
    by_time_t( const spike_table_t & s ) : s(s) { }
    bool operator()( const int a , const int b ) const { return s[a].time < s[b].time; }
    const spike_table_t & s;
  };

}


std::vector<cofiring_event_t> mea::cofiring_events( const spike_table_t & spikes ,
						    const std::vector<int> & rows ,
						    const double min_sep )
{

  if ( min_sep < 0 )
    Helper::halt( "cofiring separation cannot be negative" );

  std::vector<int> sorted = rows;

  std::stable_sort( sorted.begin() , sorted.end() , by_time_t( spikes ) );

  std::vector<cofiring_event_t> events;

  const int n = sorted.size();

  int start = 0;

  for (int i=1; i<=n; i++)
    {

      // run boundary?
      if ( i < n && spikes[ sorted[i] ].time - spikes[ sorted[i-1] ].time <= min_sep )
	continue;

      if ( i - start == 2 )
	{
	  const int a = sorted[ start ];
	  const int b = sorted[ start + 1 ];

	  const std::string & ea = spikes[a].electrode;
	  const std::string & eb = spikes[b].electrode;

	  if ( ea != eb )
	    events.push_back( ea < eb ? cofiring_event_t( a , b ) : cofiring_event_t( b , a ) );
	}

      start = i;
    }

  return events;
}


std::vector<cofiring_event_t> mea::cofiring_events( const spike_table_t & spikes ,
						    const std::string & e1 ,
						    const std::string & e2 ,
						    const double min_sep )
{
  std::vector<int> rows = spikes.group( e1 );
  const std::vector<int> & g2 = spikes.group( e2 );
  rows.insert( rows.end() , g2.begin() , g2.end() );
  return cofiring_events( spikes , rows , min_sep );
}
