
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

#include "dsp/iir.h"

#include "mea/series.h"
#include "helper/helper.h"

#include "Eigen/Dense"

#include <algorithm>

typedef std::complex<double> dcomp;


// expand roots into (real) polynomial coefficients, highest power first

static std::vector<double> poly( const std::vector<dcomp> & r )
{
  std::vector<dcomp> c( 1 , dcomp( 1 , 0 ) );

  for (int i=0; i<r.size(); i++)
    {
      std::vector<dcomp> d( c.size() + 1 , dcomp( 0 , 0 ) );
      for (int j=0; j<c.size(); j++)
	{
	  d[j]   += c[j];
	  d[j+1] -= c[j] * r[i];
	}
      c = d;
    }

  std::vector<double> p( c.size() );
  for (int i=0; i<c.size(); i++) p[i] = c[i].real();
  return p;
}


void dsptools::butterworth( iir_type_t type , int order ,
			    double w1 , double w2 ,
			    std::vector<double> * b ,
			    std::vector<double> * a )
{

  if ( order < 1 )
    Helper::halt( "Butterworth order must be positive" );

  //
  // analog low-pass prototype: no zeros, poles on the unit circle
  //

  std::vector<dcomp> z;
  std::vector<dcomp> p;
  double k = 1;

  for (int i=0; i<order; i++)
    {
      const double m = - order + 1 + 2 * i;
      p.push_back( - std::exp( dcomp( 0 , M_PI * m / ( 2.0 * order ) ) ) );
    }

  //
  // pre-warp edges (bilinear transform at fs = 2)
  //

  const double fs = 2.0;
  const double wa1 = 2.0 * fs * tan( M_PI * w1 / fs );
  const double wa2 = 2.0 * fs * tan( M_PI * w2 / fs );

  const int degree = p.size() - z.size();

  if ( type == BUTTERWORTH_LOWPASS )
    {
      for (int i=0; i<z.size(); i++) z[i] *= wa1;
      for (int i=0; i<p.size(); i++) p[i] *= wa1;
      k *= pow( wa1 , degree );
    }
  else if ( type == BUTTERWORTH_HIGHPASS )
    {
      dcomp nz( 1 , 0 ) , np( 1 , 0 );
      for (int i=0; i<z.size(); i++) nz *= -z[i];
      for (int i=0; i<p.size(); i++) np *= -p[i];
      k *= ( nz / np ).real();

      for (int i=0; i<z.size(); i++) z[i] = wa1 / z[i];
      for (int i=0; i<p.size(); i++) p[i] = wa1 / p[i];

      // zeros at the origin
      for (int i=0; i<degree; i++) z.push_back( dcomp( 0 , 0 ) );
    }
  else if ( type == BUTTERWORTH_BANDPASS )
    {
      const double bw = wa2 - wa1;
      const double wo = sqrt( wa1 * wa2 );

      std::vector<dcomp> zb , pb;

      for (int i=0; i<z.size(); i++)
	zb.push_back( z[i] * bw / 2.0 + std::sqrt( ( z[i] * bw / 2.0 ) * ( z[i] * bw / 2.0 ) - wo * wo ) );
      for (int i=0; i<z.size(); i++)
	zb.push_back( z[i] * bw / 2.0 - std::sqrt( ( z[i] * bw / 2.0 ) * ( z[i] * bw / 2.0 ) - wo * wo ) );

      for (int i=0; i<p.size(); i++)
	pb.push_back( p[i] * bw / 2.0 + std::sqrt( ( p[i] * bw / 2.0 ) * ( p[i] * bw / 2.0 ) - wo * wo ) );
      for (int i=0; i<p.size(); i++)
	pb.push_back( p[i] * bw / 2.0 - std::sqrt( ( p[i] * bw / 2.0 ) * ( p[i] * bw / 2.0 ) - wo * wo ) );

      for (int i=0; i<degree; i++) zb.push_back( dcomp( 0 , 0 ) );

      z = zb;
      p = pb;
      k *= pow( bw , degree );
    }

  //
  // bilinear transform
  //

  const double fs2 = 2.0 * fs;

  const int degree2 = p.size() - z.size();

  dcomp nz( 1 , 0 ) , np( 1 , 0 );
  for (int i=0; i<z.size(); i++) nz *= fs2 - z[i];
  for (int i=0; i<p.size(); i++) np *= fs2 - p[i];
  k *= ( nz / np ).real();

  for (int i=0; i<z.size(); i++) z[i] = ( fs2 + z[i] ) / ( fs2 - z[i] );
  for (int i=0; i<p.size(); i++) p[i] = ( fs2 + p[i] ) / ( fs2 - p[i] );

  // zeros at Nyquist
  for (int i=0; i<degree2; i++) z.push_back( dcomp( -1 , 0 ) );

  *b = poly( z );
  for (int i=0; i<b->size(); i++) (*b)[i] *= k;

  *a = poly( p );

}


void iir_t::init( iir_type_t type , int order , double fs , double f1 , double f2 )
{

  //                               p1  p2  p3
  // type == BUTTERWORTH_    order sr  f1 (f2)

  const double nyquist = fs / 2.0;

  if ( f1 <= 0 || f1 >= nyquist )
    Helper::halt( "filter edge " + Helper::dbl2str( f1 ) + " Hz must be between 0 and the Nyquist frequency ("
		  + Helper::dbl2str( nyquist ) + " Hz)" );

  if ( type == BUTTERWORTH_BANDPASS )
    {
      if ( f2 <= 0 || f2 >= nyquist )
	Helper::halt( "filter edge " + Helper::dbl2str( f2 ) + " Hz must be between 0 and the Nyquist frequency ("
		      + Helper::dbl2str( nyquist ) + " Hz)" );

      if ( f1 >= f2 )
	Helper::halt( "band-pass requires lower edge < upper edge" );
    }

  dsptools::butterworth( type , order , f1 / nyquist , f2 / nyquist , &b , &a );

  // normalize so that a[0] == 1
  const double a0 = a[0];
  for (int i=0; i<a.size(); i++) a[i] /= a0;
  for (int i=0; i<b.size(); i++) b[i] /= a0;

  // equal lengths
  if ( b.size() < a.size() ) b.resize( a.size() , 0 );
  if ( a.size() < b.size() ) a.resize( b.size() , 0 );
}


std::vector<double> iir_t::apply( const std::vector<double> & x ) const
{
  std::vector<double> zi( a.size() - 1 , 0 );
  return apply( x , zi );
}


std::vector<double> iir_t::apply( const std::vector<double> & x , const std::vector<double> & zi ) const
{
  const int n = x.size();
  const int m = a.size() - 1;

  if ( zi.size() != m )
    Helper::halt( "internal error: bad initial state for IIR filter" );

  std::vector<double> z = zi;
  std::vector<double> y( n , 0 );

  for (int i=0; i<n; i++)
    {
      const double xi = x[i];
      const double yi = b[0] * xi + ( m > 0 ? z[0] : 0 );

      for (int j=0; j<m-1; j++)
	z[j] = b[j+1] * xi + z[j+1] - a[j+1] * yi;

      if ( m > 0 )
	z[m-1] = b[m] * xi - a[m] * yi;

      y[i] = yi;
    }

  return y;
}


std::vector<double> iir_t::steady_state() const
{

  // solve (I - A') zi = b[1:] - a[1:] b[0], A = companion matrix of a

  const int m = a.size() - 1;

  if ( m < 1 ) return std::vector<double>();

  Eigen::MatrixXd IminusA = Eigen::MatrixXd::Identity( m , m );
  Eigen::VectorXd B( m );

  for (int j=0; j<m; j++)
    {
      IminusA( j , 0 ) += a[j+1];
      B[j] = b[j+1] - a[j+1] * b[0];
    }

  for (int i=1; i<m; i++)
    IminusA( i-1 , i ) -= 1.0;

  Eigen::VectorXd zi = IminusA.colPivHouseholderQr().solve( B );

  std::vector<double> r( m );
  for (int j=0; j<m; j++) r[j] = zi[j];
  return r;
}


std::vector<double> iir_t::filtfilt( const std::vector<double> & x ) const
{

  const int n = x.size();

  if ( n < 2 )
    {
      Helper::halt( "cannot filter a series with fewer than 2 samples" );
      return x;
    }

  // short series: shrink the reflected extension to fit
  int edge = padlen();
  if ( edge > n - 1 ) edge = n - 1;

  //
  // odd extension at both ends
  //

  std::vector<double> ext( n + 2 * edge );

  for (int i=0; i<edge; i++)
    ext[i] = 2 * x[0] - x[ edge - i ];

  for (int i=0; i<n; i++)
    ext[ edge + i ] = x[i];

  for (int i=0; i<edge; i++)
    ext[ edge + n + i ] = 2 * x[ n - 1 ] - x[ n - 2 - i ];

  const std::vector<double> zi = steady_state();

  //
  // forward pass
  //

  std::vector<double> z0( zi.size() );
  for (int j=0; j<zi.size(); j++) z0[j] = zi[j] * ext[0];

  std::vector<double> y = apply( ext , z0 );

  //
  // backward pass
  //

  std::reverse( y.begin() , y.end() );

  for (int j=0; j<zi.size(); j++) z0[j] = zi[j] * y[0];

  y = apply( y , z0 );

  std::reverse( y.begin() , y.end() );

  return std::vector<double>( y.begin() + edge , y.begin() + edge + n );
}


series_t dsptools::bandpass_filter( const series_t & s , double low , double high )
{

  const double dt = s.dt();

  if ( dt <= 0 )
    {
      Helper::halt( "series time index must be increasing" );
      return s;
    }

  const double fs = 1.0 / dt;

  iir_t iir;

  if ( low < defaults::lowpass_only_below )
    iir.init( BUTTERWORTH_LOWPASS , 2 , fs , high );
  else if ( high > defaults::highpass_only_above )
    iir.init( BUTTERWORTH_HIGHPASS , 2 , fs , low );
  else
    iir.init( BUTTERWORTH_BANDPASS , 2 , fs , low , high );

  series_t filtered;
  filtered.time = s.time;
  filtered.data = iir.filtfilt( s.data );
  return filtered;
}
