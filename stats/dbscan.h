
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

#ifndef __CMEA_DBSCAN_H__
#define __CMEA_DBSCAN_H__

#include "Eigen/Dense"
#include <vector>

// solution
struct dbscan_solution_t {

  // number of clusters found (labels 0 .. k-1)
  int k;

  // per observation: cluster label, or -1 for noise
  std::vector<int> label;

  // per observation: core point?
  std::vector<bool> core;

};


//
// Density-based clustering (DBSCAN), Euclidean distance; clusters are
// labelled in order of their first core point
//

struct dbscan_t {

  dbscan_t( const double eps , const int minpts ) : eps( eps ) , minpts( minpts ) { }

  // rows = observations
  dbscan_solution_t build( const Eigen::MatrixXd & X );

  // neighbourhood radius (inclusive)
  double eps;

  // minimum neighbourhood size for a core point, counting the point itself
  int minpts;

  static const int NOISE = -1;

private:

  double dist2( const Eigen::MatrixXd & X , const int i , const int j ) const;

};

#endif
