
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

#include "spikes/spikes.h"

#include "helper/helper.h"

#include <algorithm>

static const std::vector<int> empty_group;

namespace {

  struct by_time_t {
    by_time_t( const std::vector<spike_t> & d ) : d(d) { }
    bool operator()( const int a , const int b ) const { return d[a].time < d[b].time; }
    const std::vector<spike_t> & d;
  };

  struct by_key_t {
    by_key_t( const std::map<std::string,double> & k , bool reverse ) : k(k) , reverse(reverse) { }
    bool operator()( const std::string & a , const std::string & b ) const
    {
      const double ka = k.find( a )->second;
      const double kb = k.find( b )->second;
      return reverse ? ka > kb : ka < kb;
    }
    const std::map<std::string,double> & k;
    const bool reverse;
  };

}


spike_table_t::spike_table_t( const std::vector<spike_t> & rows )
{
  data = rows;
  reindex();
}


void spike_table_t::clear()
{
  data.clear();
  groups.clear();
  order.clear();
}


void spike_table_t::add( const spike_t & s )
{
  const int r = data.size();

  data.push_back( s );

  std::map<std::string,std::vector<int> >::iterator gg = groups.find( s.electrode );

  if ( gg == groups.end() )
    {
      groups[ s.electrode ].push_back( r );
      order.push_back( s.electrode );
      return;
    }

  // keep time order within the group (after any equal times)
  std::vector<int> & g = gg->second;
  g.insert( std::upper_bound( g.begin() , g.end() , r , by_time_t( data ) ) , r );
}


void spike_table_t::reindex()
{

  groups.clear();
  order.clear();

  for (int r=0; r<data.size(); r++)
    {
      std::map<std::string,std::vector<int> >::iterator gg = groups.find( data[r].electrode );
      if ( gg == groups.end() )
	{
	  groups[ data[r].electrode ].push_back( r );
	  order.push_back( data[r].electrode );
	}
      else
	gg->second.push_back( r );
    }

  std::map<std::string,std::vector<int> >::iterator gg = groups.begin();
  while ( gg != groups.end() )
    {
      std::stable_sort( gg->second.begin() , gg->second.end() , by_time_t( data ) );
      ++gg;
    }
}


const std::vector<int> & spike_table_t::group( const std::string & tag ) const
{
  std::map<std::string,std::vector<int> >::const_iterator gg = groups.find( tag );
  if ( gg == groups.end() ) return empty_group;
  return gg->second;
}


const std::vector<int> & spike_table_t::group( const int pos ) const
{
  if ( pos < 0 || pos >= order.size() ) return empty_group;
  return group( order[ pos ] );
}


const std::string & spike_table_t::tag( const int pos ) const
{
  if ( pos < 0 || pos >= order.size() )
    Helper::halt( "no electrode group at position " + Helper::int2str( pos ) );
  return order[ pos ];
}


std::vector<spike_t> spike_table_t::spikes( const std::string & tag ) const
{
  const std::vector<int> & g = group( tag );
  std::vector<spike_t> s( g.size() );
  for (int i=0; i<g.size(); i++) s[i] = data[ g[i] ];
  return s;
}


std::vector<std::string> spike_table_t::electrodes() const
{
  std::vector<std::string> e;
  std::map<std::string,std::vector<int> >::const_iterator gg = groups.begin();
  while ( gg != groups.end() )
    {
      e.push_back( gg->first );
      ++gg;
    }
  return e;
}


double spike_table_t::max_time() const
{
  double mx = 0;
  for (int r=0; r<data.size(); r++)
    if ( r == 0 || data[r].time > mx ) mx = data[r].time;
  return mx;
}


void spike_table_t::sort( const group_key_t & key , const bool reverse )
{
  std::map<std::string,double> k;
  for (int i=0; i<order.size(); i++)
    k[ order[i] ] = key( spikes( order[i] ) );

  std::stable_sort( order.begin() , order.end() , by_key_t( k , reverse ) );
}


void spike_table_t::relabel( const std::vector<std::string> & tags )
{
  if ( tags.size() != data.size() )
    Helper::halt( "internal error: expecting " + Helper::int2str( (int)data.size() ) + " electrode tags" );

  for (int r=0; r<data.size(); r++)
    data[r].electrode = tags[r];

  reindex();
}


void spike_table_t::clear_flags()
{
  for (int r=0; r<data.size(); r++)
    data[r].conductance = false;
}


void spike_table_t::flag( const std::set<int> & rows )
{
  std::set<int>::const_iterator rr = rows.begin();
  while ( rr != rows.end() )
    {
      if ( *rr < 0 || *rr >= data.size() )
	Helper::halt( "internal error: bad spike row " + Helper::int2str( *rr ) );
      data[ *rr ].conductance = true;
      ++rr;
    }
}


int spike_table_t::flagged() const
{
  int n = 0;
  for (int r=0; r<data.size(); r++)
    if ( data[r].conductance ) ++n;
  return n;
}


int spike_table_t::flagged( const std::string & tag ) const
{
  const std::vector<int> & g = group( tag );
  int n = 0;
  for (int i=0; i<g.size(); i++)
    if ( data[ g[i] ].conductance ) ++n;
  return n;
}
