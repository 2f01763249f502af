
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

#include "stats/pca.h"
#include "stats/eigen_ops.h"

#include <cmath>

Eigen::MatrixXd pca_t::fit( const Eigen::MatrixXd & X0 )
{

  Eigen::MatrixXd X = X0;

  eigen_ops::center( X );

  const int nr = X.rows();
  const int ncol = X.cols();

  if ( nr == 0 || ncol == 0 )
    return Eigen::MatrixXd( nr , 0 );

  int k = nc;
  if ( k > nr ) k = nr;
  if ( k > ncol ) k = ncol;

  Eigen::BDCSVD<Eigen::MatrixXd> svd( X , Eigen::ComputeThinU | Eigen::ComputeThinV );

  U = svd.matrixU();
  V = svd.matrixV();
  W = svd.singularValues();

  //
  // deterministic signs: the largest |u| in each column of U is positive
  //

  for (int j=0; j<U.cols(); j++)
    {
      int imax = 0;
      for (int i=1; i<nr; i++)
	if ( fabs( U(i,j) ) > fabs( U(imax,j) ) ) imax = i;

      if ( U(imax,j) < 0 )
	{
	  U.col(j) *= -1;
	  V.col(j) *= -1;
	}
    }

  // variance explained
  const double tot = W.squaredNorm();
  explained.clear();
  for (int j=0; j<k; j++)
    explained.push_back( tot > 0 ? W[j] * W[j] / tot : 0 );

  U.conservativeResize( Eigen::NoChange , k );
  V.conservativeResize( Eigen::NoChange , k );
  W.conservativeResize( k );

  return U * W.asDiagonal();
}
