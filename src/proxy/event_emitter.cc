/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "event_emitter.hh"
#include "exception.hh"

using namespace std;

EventEmitter::EventEmitter( unique_ptr< EventSink > && sink )
    : mutex_(),
      sink_( move( sink ) ),
      emitted_( 0 ),
      sink_failures_( 0 )
{
    if ( not sink_ ) {
        throw runtime_error( "EventEmitter: no sink" );
    }
}

void EventEmitter::emit( const DNSEvent & event ) noexcept
{
    try {
        unique_lock<mutex> ul( mutex_ );
        sink_->write( event );
        emitted_++;
    } catch ( const exception & e ) {
        sink_failures_++;

        try {
            print_warning( "dropped " + event.type_name() + " event", e );
        } catch ( const exception & ) {
            /* nothing left to report it with */
        }
    }
}
