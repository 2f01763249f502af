
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

#include "stats/eigen_ops.h"
#include "helper/helper.h"

Eigen::MatrixXd eigen_ops::from_rows( const std::vector<std::vector<double> > & x )
{
  const int nr = x.size();
  const int nc = nr == 0 ? 0 : x[0].size();

  Eigen::MatrixXd m( nr , nc );

  for (int r=0; r<nr; r++)
    {
      if ( x[r].size() != nc )
	Helper::halt( "internal error: rows of unequal length" );
      for (int c=0; c<nc; c++)
	m( r , c ) = x[r][c];
    }

  return m;
}


Eigen::RowVectorXd eigen_ops::center( Eigen::Ref<Eigen::MatrixXd> M )
{
  if ( M.rows() == 0 ) return Eigen::RowVectorXd::Zero( M.cols() );

  const Eigen::RowVectorXd means = M.colwise().mean();

  M.rowwise() -= means;

  return means;
}
