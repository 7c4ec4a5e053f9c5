/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <ctime>
#include <cstdio>

#include "timestamp.hh"
#include "exception.hh"

using namespace std;

uint64_t raw_timestamp( void )
{
    timespec ts;
    SystemCall( "clock_gettime", clock_gettime( CLOCK_REALTIME, &ts ) );

    uint64_t millis = ts.tv_nsec / 1000000;
    millis += uint64_t( ts.tv_sec ) * 1000;

    return millis;
}

string timestamp_seconds( const uint64_t millis )
{
    char fraction[ 8 ];
    snprintf( fraction, sizeof( fraction ), ".%03u", static_cast<unsigned int>( millis % 1000 ) );
    return to_string( millis / 1000 ) + fraction;
}
