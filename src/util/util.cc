/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <numeric>
#include <cstdint>

#include "util.hh"

using namespace std;

string join( const vector< string > & items, const string & separator )
{
    if ( items.empty() ) {
        return string();
    }

    return accumulate( items.begin() + 1, items.end(),
                       items.front(),
                       [&]( const string & a, const string & b )
                       { return a + separator + b; } );
}

string hexlify( const string & bytes )
{
    static const char digits[] = "0123456789abcdef";

    string ret;
    ret.reserve( 2 * bytes.size() );

    for ( const auto & ch : bytes ) {
        const uint8_t byte = ch;
        ret.push_back( digits[ byte >> 4 ] );
        ret.push_back( digits[ byte & 0x0f ] );
    }

    return ret;
}
