/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <cerrno>
#include <limits>

#include "upstream_forwarder.hh"
#include "dns_message.hh"
#include "socket.hh"
#include "poller.hh"
#include "timed_io.hh"
#include "int16.hh"
#include "exception.hh"

using namespace std;
using namespace PollerShortNames;

const uint64_t UpstreamForwarder::DEFAULT_TIMEOUT_MS;

upstream_error::upstream_error( const Reason s_reason, const string & s_what )
    : runtime_error( "upstream " + reason_name( s_reason ) + ": " + s_what ),
      reason_( s_reason )
{}

string upstream_error::reason_name( const Reason reason )
{
    switch ( reason ) {
    case Reason::Unreachable: return "unreachable";
    case Reason::Timeout: return "timeout";
    case Reason::MalformedReply: return "malformed reply";
    }

    return "error";
}

/* the DNS id is the first two bytes of a message */
static uint16_t message_id( const string & message )
{
    return Integer16( message.substr( 0, 2 ) );
}

UpstreamForwarder::UpstreamForwarder( const UpstreamTarget & target,
                                      const uint64_t timeout_ms )
    : target_( target ),
      timeout_ms_( timeout_ms )
{
    if ( timeout_ms_ == 0 ) {
        throw runtime_error( "upstream timeout must be positive" );
    }
}

string UpstreamForwarder::forward( const string & query, const Protocol protocol ) const
{
    if ( query.size() < 2 or query.size() > numeric_limits<uint16_t>::max() ) {
        throw runtime_error( "cannot forward a query of " + to_string( query.size() ) + " bytes" );
    }

    try {
        return protocol == Protocol::UDP ? forward_udp( query ) : forward_tcp( query );
    } catch ( const timeout_error & ) {
        throw upstream_error( upstream_error::Reason::Timeout,
                              target_.str() + " after " + to_string( timeout_ms_ ) + " ms" );
    } catch ( const unix_error & e ) {
        const int error = e.code().value();
        if ( error == EAGAIN or error == EWOULDBLOCK or error == EINPROGRESS or error == ETIMEDOUT ) {
            throw upstream_error( upstream_error::Reason::Timeout,
                                  target_.str() + ": " + e.what() );
        }

        throw upstream_error( upstream_error::Reason::Unreachable,
                              target_.str() + ": " + e.what() );
    }
}

string UpstreamForwarder::forward_udp( const string & query ) const
{
    const Deadline deadline( timeout_ms_ );

    UDPSocket upstream;
    upstream.connect( target_.address() );
    upstream.send( query );

    const uint16_t query_id = message_id( query );
    string reply;

    Poller poller;
    poller.add_action( Poller::Action( upstream, Direction::In,
                                       [&] () -> Result {
                                           /* a refused port surfaces here as ECONNREFUSED */
                                           string datagram = upstream.read();

                                           if ( datagram.size() < DNSMessage::HEADER_SIZE ) {
                                               throw upstream_error( upstream_error::Reason::MalformedReply,
                                                                     target_.str() + " sent a datagram of "
                                                                     + to_string( datagram.size() ) + " bytes" );
                                           }

                                           if ( message_id( datagram ) != query_id ) {
                                               /* stray or late reply to someone else: keep waiting */
                                               return ResultType::Continue;
                                           }

                                           reply = move( datagram );
                                           return ResultType::Exit;
                                       } ) );

    while ( reply.empty() ) {
        const auto result = poller.poll( deadline.remaining_ms() );
        if ( result.result == Poller::Result::Type::Timeout ) {
            throw timeout_error( "upstream " + target_.str() );
        } else if ( result.result == Poller::Result::Type::Exit and reply.empty() ) {
            throw upstream_error( upstream_error::Reason::MalformedReply,
                                  target_.str() + " closed without replying" );
        }
    }

    return reply;
}

string UpstreamForwarder::forward_tcp( const string & query ) const
{
    const Deadline deadline( timeout_ms_ );

    TCPSocket upstream;
    if ( timeout_ms_ > 0 ) {
        upstream.set_send_timeout( timeout_ms_ );
    }
    upstream.connect( target_.address() );

    upstream.send( static_cast<string>( Integer16( query.size() ) ) + query );

    const string length_prefix = read_exactly( upstream, 2, deadline, "upstream reply length" );
    if ( length_prefix.size() != 2 ) {
        throw upstream_error( upstream_error::Reason::MalformedReply,
                              target_.str() + " closed the connection before replying" );
    }

    const uint16_t reply_length = Integer16( length_prefix );
    if ( reply_length == 0 ) {
        throw upstream_error( upstream_error::Reason::MalformedReply,
                              target_.str() + " sent an empty reply" );
    }

    string reply = read_exactly( upstream, reply_length, deadline, "upstream reply" );
    if ( reply.size() != reply_length ) {
        throw upstream_error( upstream_error::Reason::MalformedReply,
                              target_.str() + " sent " + to_string( reply.size() ) + " of "
                              + to_string( reply_length ) + " announced bytes" );
    }

    return reply;
}
