
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

#include "stats/dbscan.h"
#include "helper/helper.h"

const int dbscan_t::NOISE;

double dbscan_t::dist2( const Eigen::MatrixXd & X , const int i , const int j ) const
{
  return ( X.row(i) - X.row(j) ).squaredNorm();
}


dbscan_solution_t dbscan_t::build( const Eigen::MatrixXd & X )
{

  if ( eps <= 0 )
    Helper::halt( "DBSCAN radius must be positive" );

  if ( minpts < 1 )
    Helper::halt( "DBSCAN minimum points must be at least 1" );

  const int n = X.rows();

  const double eps2 = eps * eps;

  //
  // neighbourhoods (each point includes itself)
  //

  std::vector<std::vector<int> > nbr( n );

  for (int i=0; i<n; i++)
    for (int j=0; j<n; j++)
      if ( dist2( X , i , j ) <= eps2 )
	nbr[i].push_back( j );

  dbscan_solution_t sol;
  sol.k = 0;
  sol.label.resize( n , NOISE );
  sol.core.resize( n , false );

  for (int i=0; i<n; i++)
    sol.core[i] = nbr[i].size() >= minpts;

  //
  // grow clusters from each unlabelled core point, in index order
  //

  for (int i=0; i<n; i++)
    {
      if ( sol.label[i] != NOISE || ! sol.core[i] ) continue;

      const int k = sol.k++;

      std::vector<int> stack;
      int p = i;

      while ( 1 )
	{
	  if ( sol.label[p] == NOISE )
	    {
	      sol.label[p] = k;
	      if ( sol.core[p] )
		for (int j=0; j<nbr[p].size(); j++)
		  if ( sol.label[ nbr[p][j] ] == NOISE )
		    stack.push_back( nbr[p][j] );
	    }

	  if ( stack.size() == 0 ) break;
	  p = stack.back();
	  stack.pop_back();
	}
    }

  return sol;
}
