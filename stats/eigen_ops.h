
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

#ifndef __CMEA_EIGEN_OPS_H__
#define __CMEA_EIGEN_OPS_H__

#include "Eigen/Dense"
#include <vector>

namespace eigen_ops {

  // subtract column means in place; returns the means
  Eigen::RowVectorXd center( Eigen::Ref<Eigen::MatrixXd> M );

  // rows of equal length into a matrix (halts on ragged input)
  Eigen::MatrixXd from_rows( const std::vector<std::vector<double> > & x );

}

#endif
