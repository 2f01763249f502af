
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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>

std::vector<double> MiscMath::diff( const std::vector<double> & x )
{
  std::vector<double> d;
  if ( x.size() < 2 ) return d;
  const int n = x.size();
  d.resize( n - 1 );
  for (int i=1; i<n; i++) d[i-1] = x[i] - x[i-1];
  return d;
}

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  double s = 0;
  for (int i=0;i<n;i++) s += x[i];
  return s/(double)n;
}

double MiscMath::variance( const std::vector<double> & x )
{
  return variance( x , mean(x) );
}

double MiscMath::variance( const std::vector<double> & x , double m )
{
  const int n = x.size();
  if ( n < 2 ) return 0;
  double ss = 0;
  for (int i=0;i<n;i++)
    {
      const double t = x[i] - m;
      ss += t*t;
    }
  return ss/(double)(n-1);
}

double MiscMath::sdev( const std::vector<double> & x )
{
  return sqrt( variance(x) );
}

double MiscMath::sdev( const std::vector<double> & x , double m )
{
  return sqrt( variance(x,m) );
}


double MiscMath::kth_smallest_preserve( const std::vector<double> & x , int k )
{
  std::vector<double> y = x;
  std::nth_element( y.begin() , y.begin() + k , y.end() );
  return y[k];
}


double MiscMath::median( const std::vector<double> & x , const bool also_upper )
{

  const int n = x.size();

  const bool is_odd = n % 2;

  if ( n == 0 ) Helper::halt( "internal problem, taking median of 0 elements");
  if ( n == 1 ) return x[0];

  if ( is_odd )
    return MiscMath::kth_smallest_preserve( x , ( n - 1 ) / 2 );

  const double lower_median = MiscMath::kth_smallest_preserve( x , n / 2 - 1 );

  if ( ! also_upper ) return lower_median;

  const double upper_median = MiscMath::kth_smallest_preserve( x , n / 2 );

  return ( lower_median + upper_median ) / 2.0 ;

}


double MiscMath::mad( const std::vector<double> & x )
{
  const double m = median( x , true );
  const int n = x.size();
  std::vector<double> d( n );
  for (int i=0; i<n; i++) d[i] = fabs( x[i] - m );
  return median( d , true );
}
