/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <thread>
#include <memory>

#include "dns_listener.hh"
#include "dns_message.hh"
#include "dns_event.hh"
#include "poller.hh"
#include "socketpair.hh"
#include "exception.hh"

using namespace std;
using namespace PollerShortNames;

DNSListener::DNSListener( const UpstreamForwarder & forwarder, EventEmitter & emitter )
    : mutex_(),
      in_flight_changed_(),
      in_flight_( 0 ),
      state_( State::Bound ),
      stop_pipe_( make_pipe() ),
      forwarder_( forwarder ),
      emitter_( emitter )
{}

bool DNSListener::relay( const DNSQuery & query, string & reply )
{
    emitter_.emit( DNSEvent::received( query ) );

    unique_ptr< DNSMessage > request;
    try {
        request.reset( new DNSMessage( query.payload ) );
        emitter_.emit( DNSEvent::request( query, *request ) );
    } catch ( const dns_decode_error & e ) {
        /* malformed input is dropped silently */
        emitter_.emit( DNSEvent::invalid_request( query, e.what() ) );
        return false;
    }

    string upstream_reply;
    try {
        upstream_reply = forwarder_.forward( query.payload, query.protocol );
    } catch ( const exception & e ) {
        emitter_.emit( DNSEvent::invalid_request( query, e.what() ) );
        return false;
    }

    try {
        const DNSMessage decoded( upstream_reply );
        emitter_.emit( decoded.truncated()
                       ? DNSEvent::truncated_reply( query, decoded, *request )
                       : DNSEvent::reply( query, decoded, *request ) );
    } catch ( const dns_decode_error & e ) {
        emitter_.emit( DNSEvent::invalid_request( query, string( "upstream reply: " ) + e.what() ) );
        return false;
    }

    reply = move( upstream_reply );
    return true;
}

void DNSListener::replied( const DNSQuery & query, const string & reply )
{
    emitter_.emit( DNSEvent::sent( query, reply ) );
}

void DNSListener::spawn( const function<void(void)> & handler )
{
    {
        unique_lock<mutex> ul( mutex_ );
        in_flight_++;
    }

    try {
        /* start a new thread to handle request/reply */
        thread newthread( [this, handler] () {
                try {
                    handler();
                } catch ( const exception & e ) {
                    print_warning( protocol_name( protocol() ) + " request", e );
                }

                finished();
            } );

        /* don't wait around for the reply */
        newthread.detach();
    } catch ( const system_error & ) {
        finished();
        throw;
    }
}

void DNSListener::finished( void )
{
    /* notify while holding the lock: once it is released, drain() may
       return and the listener may be gone */
    unique_lock<mutex> ul( mutex_ );
    in_flight_--;
    in_flight_changed_.notify_all();
}

void DNSListener::serve( void )
{
    {
        unique_lock<mutex> ul( mutex_ );
        if ( state_ != State::Bound ) {
            throw runtime_error( "DNSListener: serve() called twice" );
        }
        state_ = State::Serving;
    }

    Poller poller;

    poller.add_action( Poller::Action( listening_socket(), Direction::In,
                                       [&] () -> Result {
                                           try {
                                               handle_ready();
                                           } catch ( const exception & e ) {
                                               /* e.g. EMFILE from accept: keep serving */
                                               print_warning( protocol_name( protocol() ) + " listener", e );
                                           }
                                           return ResultType::Continue;
                                       } ) );

    poller.add_action( Poller::Action( stop_pipe_.first, Direction::In,
                                       [&] () -> Result { return ResultType::Exit; } ) );

    while ( true ) {
        if ( poller.poll( -1 ).result == Poller::Result::Type::Exit ) {
            break;
        }
    }

    unique_lock<mutex> ul( mutex_ );
    state_ = State::Stopped;
}

void DNSListener::stop( void )
{
    stop_pipe_.second.write( "x" );
}

void DNSListener::drain( void )
{
    unique_lock<mutex> ul( mutex_ );
    in_flight_changed_.wait( ul, [&] () { return in_flight_ == 0; } );
}

DNSListener::State DNSListener::state( void )
{
    unique_lock<mutex> ul( mutex_ );
    return state_;
}

unsigned int DNSListener::in_flight( void )
{
    unique_lock<mutex> ul( mutex_ );
    return in_flight_;
}
