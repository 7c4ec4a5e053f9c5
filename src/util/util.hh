/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef UTIL_HH
#define UTIL_HH

#include <string>
#include <cstring>
#include <vector>

template <typename T> void zero( T & x ) { memset( &x, 0, sizeof( x ) ); }

std::string join( const std::vector< std::string > & items, const std::string & separator = " " );

/* lowercase hexadecimal rendering of arbitrary bytes */
std::string hexlify( const std::string & bytes );

#endif /* UTIL_HH */
