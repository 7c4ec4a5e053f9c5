/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "console_sink.hh"
#include "timestamp.hh"

using namespace std;

ConsoleSink::ConsoleSink( ostream & output )
    : output_( output )
{}

void ConsoleSink::write( const DNSEvent & event )
{
    output_ << timestamp_seconds( event.timestamp_ms() ) << " " << event.str() << endl;

    if ( not output_ ) {
        throw runtime_error( "console sink: output stream failed" );
    }
}
