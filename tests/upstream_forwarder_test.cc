/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <arpa/nameser.h>
#include <stdexcept>

#include <gtest/gtest.h>

#include "upstream_forwarder.hh"
#include "fake_upstream.hh"
#include "int16.hh"

using namespace std;

namespace {

/* the reason forward() failed with, or fail the test if it did not */
upstream_error::Reason failure_reason( const UpstreamForwarder & forwarder,
                                       const string & query, const Protocol protocol )
{
    try {
        forwarder.forward( query, protocol );
    } catch ( const upstream_error & e ) {
        return e.reason();
    }

    throw runtime_error( "forward() succeeded" );
}

const string example_query = make_query( 0x5151, "example.com", ns_t_a );

}

TEST( UpstreamForwarderTest, RelaysOverUDP )
{
    FakeUpstream upstream( answer_with( { ns_t_a, ns_t_a } ) );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ) );

    EXPECT_EQ( make_reply( example_query, { ns_t_a, ns_t_a } ),
               forwarder.forward( example_query, Protocol::UDP ) );
    EXPECT_EQ( 1u, upstream.queries_seen() );
}

TEST( UpstreamForwarderTest, RelaysOverTCP )
{
    FakeUpstream upstream( answer_with( { ns_t_a } ) );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ) );

    EXPECT_EQ( make_reply( example_query, { ns_t_a } ),
               forwarder.forward( example_query, Protocol::TCP ) );
}

TEST( UpstreamForwarderTest, PassesQueryThroughUnmodified )
{
    string seen;
    FakeUpstream upstream( [&seen] ( const string & query, const Protocol ) {
            seen = query;
            return make_reply( query, {} );
        } );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ) );

    forwarder.forward( example_query, Protocol::TCP );
    EXPECT_EQ( example_query, seen );
}

TEST( UpstreamForwarderTest, RejectsUnforwardableQueries )
{
    const UpstreamForwarder forwarder( UpstreamTarget( "127.0.0.1:" + to_string( unused_port() ) ) );

    EXPECT_THROW( forwarder.forward( "x", Protocol::UDP ), runtime_error );
    EXPECT_THROW( forwarder.forward( string( 70000, 'x' ), Protocol::TCP ), runtime_error );
}

TEST( UpstreamForwarderTest, RequiresATimeout )
{
    EXPECT_THROW( UpstreamForwarder( UpstreamTarget( "127.0.0.1:53" ), 0 ), runtime_error );
    EXPECT_EQ( 1u, UpstreamForwarder( UpstreamTarget( "127.0.0.1:53" ), 1 ).timeout_ms() );
}

TEST( UpstreamForwarderTest, SilentUpstreamTimesOut )
{
    /* bound, but nobody reads or accepts */
    UDPSocket silent_udp;
    silent_udp.bind( Address( "127.0.0.1", uint16_t( 0 ) ) );
    TCPSocket silent_tcp;
    silent_tcp.bind( silent_udp.local_address() );
    silent_tcp.listen();

    const UpstreamForwarder forwarder( UpstreamTarget( silent_udp.local_address().str() ), 100 );

    EXPECT_EQ( upstream_error::Reason::Timeout, failure_reason( forwarder, example_query, Protocol::UDP ) );
    EXPECT_EQ( upstream_error::Reason::Timeout, failure_reason( forwarder, example_query, Protocol::TCP ) );
}

TEST( UpstreamForwarderTest, RefusedConnectionIsUnreachable )
{
    const UpstreamForwarder forwarder( UpstreamTarget( "127.0.0.1:" + to_string( unused_port() ) ), 1000 );

    EXPECT_EQ( upstream_error::Reason::Unreachable, failure_reason( forwarder, example_query, Protocol::UDP ) );
    EXPECT_EQ( upstream_error::Reason::Unreachable, failure_reason( forwarder, example_query, Protocol::TCP ) );
}

TEST( UpstreamForwarderTest, ShortDatagramIsMalformed )
{
    FakeUpstream upstream( [] ( const string &, const Protocol ) { return string( "abc" ); } );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ), 1000 );

    EXPECT_EQ( upstream_error::Reason::MalformedReply,
               failure_reason( forwarder, example_query, Protocol::UDP ) );
}

TEST( UpstreamForwarderTest, ReplyWithAnotherIdIsIgnored )
{
    FakeUpstream upstream( [] ( const string &, const Protocol ) {
            return make_reply( make_query( 0x0001, "example.com", ns_t_a ), { ns_t_a } );
        } );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ), 200 );

    EXPECT_EQ( upstream_error::Reason::Timeout, failure_reason( forwarder, example_query, Protocol::UDP ) );
}

TEST( UpstreamForwarderTest, BrokenTCPFramingIsMalformed )
{
    FakeUpstream upstream( [] ( const string &, const Protocol ) { return string(); } );
    upstream.set_tcp_framing( false );
    const UpstreamForwarder forwarder( UpstreamTarget( upstream.target() ), 1000 );

    /* hangs up without a word */
    EXPECT_EQ( upstream_error::Reason::MalformedReply,
               failure_reason( forwarder, example_query, Protocol::TCP ) );

    /* announces 100 bytes, sends 5 */
    upstream.set_responder( [] ( const string &, const Protocol ) {
            return static_cast<string>( Integer16( 100 ) ) + "short";
        } );
    EXPECT_EQ( upstream_error::Reason::MalformedReply,
               failure_reason( forwarder, example_query, Protocol::TCP ) );

    /* announces nothing at all */
    upstream.set_responder( [] ( const string &, const Protocol ) { return string( 2, '\0' ); } );
    EXPECT_EQ( upstream_error::Reason::MalformedReply,
               failure_reason( forwarder, example_query, Protocol::TCP ) );
}

TEST( UpstreamForwarderTest, ErrorTextNamesTheReason )
{
    const upstream_error error( upstream_error::Reason::Timeout, "127.0.0.1:53 after 5000 ms" );
    EXPECT_STREQ( "upstream timeout: 127.0.0.1:53 after 5000 ms", error.what() );
    EXPECT_EQ( "malformed reply", upstream_error::reason_name( upstream_error::Reason::MalformedReply ) );
    EXPECT_EQ( "unreachable", upstream_error::reason_name( upstream_error::Reason::Unreachable ) );
}
