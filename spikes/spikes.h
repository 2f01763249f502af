
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

#ifndef __CMEA_SPIKES_H__
#define __CMEA_SPIKES_H__

#include <string>
#include <vector>
#include <map>
#include <set>
#include <functional>

//
// One detected spike: a row of the spike table
//

struct spike_t {

  spike_t() : time(0) , amplitude(0) , threshold(0) , conductance(false) { }

  spike_t( const std::string & electrode ,
	   double time ,
	   double amplitude = 0 ,
	   double threshold = 0 ,
	   bool conductance = false )
    : electrode( electrode ) , time( time ) , amplitude( amplitude ) ,
      threshold( threshold ) , conductance( conductance ) { }

  std::string electrode;

  double time;

  double amplitude;

  double threshold;

  // flagged as a conductance artifact
  bool conductance;

};


//
// Ordered spike rows, grouped by electrode tag; groups are kept in order
// of first appearance (or as last set by sort()), and each group lists
// its row indices in time order
//

struct spike_table_t {

  typedef std::function<double( const std::vector<spike_t> & )> group_key_t;

  spike_table_t() { }

  spike_table_t( const std::vector<spike_t> & rows );

  void add( const spike_t & s );

  void clear();

  // rows

  int size() const { return data.size(); }

  const spike_t & operator[]( const int r ) const { return data[r]; }

  const std::vector<spike_t> & rows() const { return data; }

  // groups

  int ngroups() const { return order.size(); }

  bool has( const std::string & tag ) const { return groups.find( tag ) != groups.end(); }

  // row indices, in time order (empty if no such group)
  const std::vector<int> & group( const std::string & tag ) const;

  const std::vector<int> & group( const int pos ) const;

  const std::string & tag( const int pos ) const;

  // tags in current group order
  const std::vector<std::string> & keys() const { return order; }

  std::vector<spike_t> spikes( const std::string & tag ) const;

  // distinct electrode tags, alphabetical
  std::vector<std::string> electrodes() const;

  double max_time() const;

  // reorder groups by a derived key over each group's spikes (reverse:
  // largest key first); ties keep their order
  void sort( const group_key_t & key = group_size , const bool reverse = true );

  static double group_size( const std::vector<spike_t> & g ) { return g.size(); }

  // new electrode tag for every row, then rebuild groups
  void relabel( const std::vector<std::string> & tags );

  // flags

  void clear_flags();

  void flag( const std::set<int> & rows );

  int flagged() const;

  int flagged( const std::string & tag ) const;

private:

  void reindex();

  std::vector<spike_t> data;

  std::map<std::string,std::vector<int> > groups;

  std::vector<std::string> order;

};

#endif
