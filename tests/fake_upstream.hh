/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef FAKE_UPSTREAM_HH
#define FAKE_UPSTREAM_HH

#include <string>
#include <vector>
#include <functional>
#include <thread>
#include <mutex>
#include <atomic>
#include <utility>
#include <cstdint>

#include "socket.hh"
#include "dns_query.hh"

/* DNS messages for the tests: queries from libresolv, replies and
   broken messages by hand */

/* standard query (RD set) with one question of class IN */
std::string make_query( const uint16_t id, const std::string & name, const uint16_t type );

/* reply to `query`: same id and question, one IN record per answer type */
std::string make_reply( const std::string & query,
                        const std::vector< uint16_t > & answer_types,
                        const unsigned int rcode = 0,
                        const bool truncated = false );

/* reply header with no question and no records */
std::string make_bare_reply( const uint16_t id, const unsigned int rcode );

/* DNS resolver on 127.0.0.1, UDP and TCP on one ephemeral port, answering
   from a test-supplied function on its own thread */

class FakeUpstream
{
public:
    /* an empty reply means: say nothing (UDP) or hang up (TCP) */
    typedef std::function<std::string( const std::string & query, const Protocol protocol )> Responder;

private:
    std::mutex mutex_;
    Responder responder_;

    UDPSocket udp_;
    TCPSocket tcp_;
    std::pair< FileDescriptor, FileDescriptor > stop_pipe_;

    std::atomic< unsigned int > queries_;
    std::atomic< bool > tcp_framing_;

    std::thread thread_;

    std::string respond( const std::string & query, const Protocol protocol );
    void handle_tcp( TCPSocket & client );
    void serve( void );

public:
    FakeUpstream( const Responder & responder );
    ~FakeUpstream();

    void set_responder( const Responder & responder );

    /* off: TCP replies go out exactly as the responder returns them */
    void set_tcp_framing( const bool framed ) { tcp_framing_ = framed; }

    uint16_t port( void ) const { return udp_.local_address().port(); }
    std::string target( void ) const { return "127.0.0.1:" + std::to_string( port() ); }

    unsigned int queries_seen( void ) const { return queries_; }

    FakeUpstream( const FakeUpstream & other ) = delete;
    FakeUpstream & operator=( const FakeUpstream & other ) = delete;
};

/* answers every query NOERROR with records of these types */
FakeUpstream::Responder answer_with( const std::vector< uint16_t > & answer_types,
                                     const unsigned int rcode = 0,
                                     const bool truncated = false );

/* a local port nothing listens on (at the time of the call) */
uint16_t unused_port( void );

/* client side */

/* send one datagram on a connected socket and wait for one back;
   empty if nothing arrives in time */
std::string udp_exchange( UDPSocket & client, const std::string & query, const uint64_t wait_ms );

/* everything the peer sends until it closes, or until the wait runs out */
std::string read_until_close( TCPSocket & client, const uint64_t wait_ms );

#endif /* FAKE_UPSTREAM_HH */
