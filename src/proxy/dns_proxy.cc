/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <iostream>
#include <functional>

#include "dns_proxy.hh"
#include "socket.hh"
#include "exception.hh"

using namespace std;

static UDPSocket make_bound_udp_socket( const Address & listen_address )
{
    UDPSocket sock;
    sock.bind( listen_address );
    return sock;
}

static TCPSocket make_bound_tcp_socket( const Address & listen_address )
{
    TCPSocket sock;
    sock.set_reuseaddr();
    sock.bind( listen_address );
    return sock;
}

static void serve_until_stopped( DNSListener & listener )
{
    try {
        listener.serve();
    } catch ( const exception & e ) {
        print_exception( e );
    }
}

ProxyHandle::ProxyHandle( const ProxyConfig & config, unique_ptr< EventSink > && sink )
    : forwarder_( UpstreamTarget( config.upstream_dns ), config.timeout_ms ),
      emitter_( move( sink ) ),
      udp_listener_( make_bound_udp_socket( config.listen_address() ), forwarder_, emitter_ ),
      /* same port as UDP, which matters when the configured port is 0 */
      tcp_listener_( make_bound_tcp_socket( Address( config.listen_address().ip(),
                                                     udp_listener_.local_address().port() ) ),
                     forwarder_, emitter_, config.client_timeout_ms ),
      udp_thread_(),
      tcp_thread_(),
      stopped_( false )
{
    udp_thread_ = thread( serve_until_stopped, ref( udp_listener_ ) );

    try {
        tcp_thread_ = thread( serve_until_stopped, ref( tcp_listener_ ) );
    } catch ( const exception & ) {
        udp_listener_.stop();
        udp_thread_.join();
        throw;
    }
}

void ProxyHandle::stop( void )
{
    if ( stopped_ ) {
        return;
    }

    udp_listener_.stop();
    tcp_listener_.stop();

    udp_thread_.join();
    tcp_thread_.join();

    /* handlers still hold references to the forwarder and emitter */
    udp_listener_.drain();
    tcp_listener_.drain();

    stopped_ = true;
}

ProxyHandle::~ProxyHandle()
{
    try {
        stop();
    } catch ( const exception & e ) { /* don't throw from destructor */
        print_exception( e );
    }
}

DNSProxy::DNSProxy()
    : mutex_(),
      handle_()
{}

ProxyHandle & DNSProxy::launch( const ProxyConfig & config, unique_ptr< EventSink > && sink )
{
    cerr << "Starting the DNS proxy, port=" << config.port
         << ", upstream_dns=" << config.upstream_dns << endl;

    handle_.reset( new ProxyHandle( config, move( sink ) ) );
    return *handle_;
}

ProxyHandle & DNSProxy::start( const ProxyConfig & config )
{
    unique_lock<mutex> ul( mutex_ );

    /* already running: nothing to do */
    if ( handle_ ) {
        return *handle_;
    }

    config.validate();
    return launch( config, make_event_sink( config ) );
}

ProxyHandle & DNSProxy::start( const ProxyConfig & config, unique_ptr< EventSink > && sink )
{
    unique_lock<mutex> ul( mutex_ );

    if ( handle_ ) {
        return *handle_;
    }

    config.validate();
    return launch( config, move( sink ) );
}

void DNSProxy::stop( void )
{
    unique_lock<mutex> ul( mutex_ );

    if ( handle_ ) {
        handle_->stop();
        handle_.reset();
    }
}

bool DNSProxy::running( void )
{
    unique_lock<mutex> ul( mutex_ );
    return static_cast<bool>( handle_ );
}
