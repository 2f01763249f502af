
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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <iomanip>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include <cctype>

#include "dirent.h"
#include <sys/stat.h>

extern logger_t logger;


std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( (unsigned char)s[i] );
  return j;
}

std::string Helper::tolower( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::tolower( (unsigned char)s[i] );
  return j;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}


bool Helper::file_extension( const std::string & f, const std::string & ext , bool with_period )
{
  if ( with_period )
    {
      int l = ext.size() + 1;
      if ( f.size() < l ) return false;
      const std::string s = f.substr( f.size() - l );
      return Helper::iequals( s , "." + ext );
    }
  else
    {
      int l = ext.size() ;
      if ( f.size() < l ) return false;
      const std::string s = f.substr( f.size() - l );
      return Helper::iequals( s , ext );
    }
}


void Helper::halt( const std::string & msg )
{

  // some other code handles the exit, e.g. API / test mode
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // do not kill the process?
  if ( ! globals::bail_on_fail ) return;

  // switch logger off , i.e. as we don't want close-out msg
  logger.off();

  // generic bail function (not using logger)
  std::cerr << "error : " << msg << "\n";

  std::exit(1);
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

void Helper::debug( const std::string & msg )
{
  std::cerr << "debug : " << msg << "\n";
}


std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(long n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::int2str(uint64_t n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}


bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}


std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::char_split( item , s , empty );
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty );
  if ( s.size() == 2 ) return Helper::char_split( item , s[0] , s[1] , empty );
  if ( s.size() == 3 ) return Helper::char_split( item , s[0] , s[1] , s[2] , empty );
  Helper::halt("silly internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}


std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{

  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if (empty) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 || s[j] == c3 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if (empty) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}


bool Helper::fileExists( const std::string & f )
{

  FILE *file;

  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }

  return false;
}


std::vector<std::string> Helper::folder_files( const std::string & f )
{
  std::vector<std::string> files;

  std::string folder = Helper::expand( f );
  if ( folder.size() == 0 ) folder = ".";
  if ( folder[ folder.size() - 1 ] != '/' ) folder += "/";

  DIR * dir;
  struct dirent *ent;

  if ( (dir = opendir ( folder.c_str() ) ) == NULL )
    {
      Helper::halt( "could not open folder " + folder );
      return files;
    }

  while ((ent = readdir (dir)) != NULL)
    {
      std::string fname = ent->d_name;
      if ( fname.size() == 0 || fname[0] == '.' ) continue;

      struct stat sb;
      if ( stat( ( folder + fname ).c_str() , &sb ) != 0 ) continue;
      if ( ! S_ISREG( sb.st_mode ) ) continue;

      files.push_back( fname );
    }

  closedir (dir);

  std::sort( files.begin() , files.end() );

  return files;
}


bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if ( ::tolower( (unsigned char)a[i] ) != ::tolower( (unsigned char)b[i] ) )
      return false;
  return true;
}


bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false; // empty == NO
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}


std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  // The characters in the stream are read one-by-one using a std::streambuf.
  // That is faster than reading them one-by-one using the std::istream.
  // Code that uses streambuf this way must be guarded by a sentry object.

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {

      int c = sb->sbumpc();

      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;

	default:
	  t += (char)c;
	}
    }
}
