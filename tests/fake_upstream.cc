/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>
#include <stdexcept>

#include "fake_upstream.hh"
#include "poller.hh"
#include "timed_io.hh"
#include "socketpair.hh"
#include "int16.hh"
#include "exception.hh"

using namespace std;
using namespace PollerShortNames;

static const size_t HEADER_LENGTH = 12;

static string u16( const uint16_t value )
{
    return static_cast<string>( Integer16( value ) );
}

static string u32( const uint32_t value )
{
    return u16( value >> 16 ) + u16( value & 0xffff );
}

/* query as the resolver library builds it, with our id and RD set */
string make_query( const uint16_t id, const string & name, const uint16_t type )
{
    unsigned char buffer[ NS_PACKETSZ ];
    const int length = res_mkquery( ns_o_query, name.c_str(), ns_c_in, type,
                                    nullptr, 0, nullptr, buffer, sizeof( buffer ) );
    if ( length < 0 ) {
        throw runtime_error( "res_mkquery: cannot encode \"" + name + "\"" );
    }

    string query( reinterpret_cast<const char *>( buffer ), length );
    query.replace( 0, 2, u16( id ) );
    query[ 2 ] |= 0x01;
    return query;
}

string make_reply( const string & query,
                   const vector< uint16_t > & answer_types,
                   const unsigned int rcode,
                   const bool truncated )
{
    if ( query.size() < HEADER_LENGTH ) {
        throw runtime_error( "make_reply: query too short" );
    }

    const uint8_t flags_high = 0x80 /* QR */ | ( truncated ? 0x02 : 0 ) | ( query[ 2 ] & 0x01 ) /* RD */;
    const uint8_t flags_low = 0x80 /* RA */ | ( rcode & 0x0f );

    string reply = query.substr( 0, 2 );
    reply.push_back( static_cast<char>( flags_high ) );
    reply.push_back( static_cast<char>( flags_low ) );
    reply += query.substr( 4, 2 ) /* question count */
        + u16( answer_types.size() ) + u16( 0 ) + u16( 0 );

    /* the question, as asked */
    reply += query.substr( HEADER_LENGTH );

    for ( const auto & type : answer_types ) {
        string rdata;
        if ( type == 28 ) { /* AAAA */
            rdata = string( 15, '\0' ) + "\x01";
        } else {
            rdata = string( "\x7f\x00\x00\x01", 4 );
        }

        reply += string( "\xc0\x0c", 2 ) /* pointer to the question name */
            + u16( type ) + u16( 1 ) + u32( 300 )
            + u16( rdata.size() ) + rdata;
    }

    return reply;
}

string make_bare_reply( const uint16_t id, const unsigned int rcode )
{
    string reply = u16( id );
    reply.push_back( static_cast<char>( 0x81 ) );
    reply.push_back( static_cast<char>( 0x80 | ( rcode & 0x0f ) ) );
    return reply + u16( 0 ) + u16( 0 ) + u16( 0 ) + u16( 0 );
}

FakeUpstream::Responder answer_with( const vector< uint16_t > & answer_types,
                                     const unsigned int rcode,
                                     const bool truncated )
{
    return [answer_types, rcode, truncated] ( const string & query, const Protocol ) {
        return make_reply( query, answer_types, rcode, truncated );
    };
}

uint16_t unused_port( void )
{
    UDPSocket probe;
    probe.bind( Address( "127.0.0.1", uint16_t( 0 ) ) );
    return probe.local_address().port();
}

FakeUpstream::FakeUpstream( const Responder & responder )
    : mutex_(),
      responder_( responder ),
      udp_(),
      tcp_(),
      stop_pipe_( make_pipe() ),
      queries_( 0 ),
      tcp_framing_( true ),
      thread_()
{
    udp_.bind( Address( "127.0.0.1", uint16_t( 0 ) ) );

    tcp_.set_reuseaddr();
    tcp_.bind( Address( "127.0.0.1", udp_.local_address().port() ) );
    tcp_.listen();

    thread_ = thread( &FakeUpstream::serve, this );
}

FakeUpstream::~FakeUpstream()
{
    try {
        stop_pipe_.second.write( "x" );
    } catch ( const exception & e ) {
        print_exception( e );
    }

    thread_.join();
}

void FakeUpstream::set_responder( const Responder & responder )
{
    unique_lock<mutex> ul( mutex_ );
    responder_ = responder;
}

string FakeUpstream::respond( const string & query, const Protocol protocol )
{
    Responder responder;
    {
        unique_lock<mutex> ul( mutex_ );
        responder = responder_;
    }

    queries_++;
    return responder( query, protocol );
}

void FakeUpstream::handle_tcp( TCPSocket & client )
{
    const Deadline deadline( 2000 );

    const string length_prefix = read_exactly( client, 2, deadline, "fake upstream: length" );
    if ( length_prefix.size() != 2 ) {
        return;
    }

    const uint16_t length = Integer16( length_prefix );
    const string query = read_exactly( client, length, deadline, "fake upstream: query" );
    if ( query.size() != length ) {
        return;
    }

    const string reply = respond( query, Protocol::TCP );
    if ( reply.empty() ) {
        return;
    }

    client.write( tcp_framing_ ? static_cast<string>( Integer16( reply.size() ) ) + reply : reply );
}

void FakeUpstream::serve( void )
{
    Poller poller;

    poller.add_action( Poller::Action( udp_, Direction::In,
                                       [&] () -> Result {
                                           try {
                                               const auto datagram = udp_.recvfrom();
                                               const string reply = respond( datagram.second, Protocol::UDP );
                                               if ( not reply.empty() ) {
                                                   udp_.sendto( datagram.first, reply );
                                               }
                                           } catch ( const exception & e ) {
                                               print_warning( "fake upstream (udp)", e );
                                           }
                                           return ResultType::Continue;
                                       } ) );

    poller.add_action( Poller::Action( tcp_, Direction::In,
                                       [&] () -> Result {
                                           try {
                                               TCPSocket client = tcp_.accept();
                                               handle_tcp( client );
                                           } catch ( const exception & e ) {
                                               print_warning( "fake upstream (tcp)", e );
                                           }
                                           return ResultType::Continue;
                                       } ) );

    poller.add_action( Poller::Action( stop_pipe_.first, Direction::In,
                                       [&] () -> Result { return ResultType::Exit; } ) );

    try {
        while ( poller.poll( -1 ).result != Poller::Result::Type::Exit ) {}
    } catch ( const exception & e ) {
        print_exception( e );
    }
}

string udp_exchange( UDPSocket & client, const string & query, const uint64_t wait_ms )
{
    client.send( query );

    string reply;
    Poller poller;
    poller.add_action( Poller::Action( client, Direction::In,
                                       [&] () -> Result {
                                           reply = client.read();
                                           return ResultType::Exit;
                                       } ) );

    const Deadline deadline( wait_ms );
    while ( reply.empty() and not deadline.expired() ) {
        if ( poller.poll( deadline.remaining_ms() ).result == Poller::Result::Type::Timeout ) {
            break;
        }
    }

    return reply;
}

string read_until_close( TCPSocket & client, const uint64_t wait_ms )
{
    string ret;
    Poller poller;
    poller.add_action( Poller::Action( client, Direction::In,
                                       [&] () -> Result {
                                           ret.append( client.read() );
                                           return ResultType::Continue;
                                       } ) );

    const Deadline deadline( wait_ms );
    while ( not client.eof() ) {
        if ( poller.poll( deadline.remaining_ms() ).result != Poller::Result::Type::Success ) {
            break;
        }
    }

    return ret;
}
