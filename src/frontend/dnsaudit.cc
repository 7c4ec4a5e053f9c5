/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <getopt.h>
#include <csignal>
#include <iostream>

#include "dns_proxy.hh"
#include "signalfd.hh"
#include "poller.hh"
#include "ezio.hh"
#include "exception.hh"

using namespace std;
using namespace PollerShortNames;

void usage_error( const string & program_name )
{
    cerr << "Usage: " << program_name << " --port=PORT --upstream-dns=HOST[:PORT] [OPTION]..." << endl;
    cerr << endl;
    cerr << "Options = --address=ADDRESS (default: all interfaces)" << endl;
    cerr << "          --timeout-ms=MILLISECONDS --client-timeout-ms=MILLISECONDS" << endl;
    cerr << "          --format=FORMAT --output=FILENAME" << endl;
    cerr << "          --index=INDEX --source=SOURCE --sourcetype=SOURCETYPE" << endl;
    cerr << endl;
    cerr << "          FORMAT = text | stash | protobuf (stash and protobuf need --output)" << endl;
    cerr << "          --client-timeout-ms=0 waits for TCP clients forever" << endl << endl;

    throw runtime_error( "invalid arguments" );
}

static uint64_t non_negative( const string & name, const char * value )
{
    const long int ret = myatoi( value );
    if ( ret < 0 ) {
        throw runtime_error( name + " must not be negative" );
    }
    return ret;
}

int main( int argc, char *argv[] )
{
    try {
        if ( argc <= 0 ) {
            /* really crazy user */
            throw runtime_error( "missing argv[ 0 ]: argc <= 0" );
        }

        const option command_line_options[] = {
            { "port",              required_argument, nullptr, 'p' },
            { "address",           required_argument, nullptr, 'a' },
            { "upstream-dns",      required_argument, nullptr, 'u' },
            { "timeout-ms",        required_argument, nullptr, 't' },
            { "client-timeout-ms", required_argument, nullptr, 'c' },
            { "format",            required_argument, nullptr, 'f' },
            { "output",            required_argument, nullptr, 'o' },
            { "index",             required_argument, nullptr, 'i' },
            { "source",            required_argument, nullptr, 's' },
            { "sourcetype",        required_argument, nullptr, 'y' },
            { 0,                                   0, nullptr, 0 }
        };

        ProxyConfig config;

        while ( true ) {
            const int opt = getopt_long( argc, argv, "p:a:u:o:", command_line_options, nullptr );
            if ( opt == -1 ) { /* end of options */
                break;
            }

            switch ( opt ) {
            case 'p':
                config.port = ProxyConfig::parse_port( optarg );
                break;
            case 'a':
                config.address = optarg;
                break;
            case 'u':
                config.upstream_dns = optarg;
                break;
            case 't':
                config.timeout_ms = non_negative( "--timeout-ms", optarg );
                break;
            case 'c':
                config.client_timeout_ms = non_negative( "--client-timeout-ms", optarg );
                break;
            case 'f':
                config.output_format = ProxyConfig::parse_output_format( optarg );
                break;
            case 'o':
                config.output = optarg;
                break;
            case 'i':
                config.index = optarg;
                break;
            case 's':
                config.source = optarg;
                break;
            case 'y':
                config.sourcetype = optarg;
                break;
            case '?':
                usage_error( argv[ 0 ] );
                break;
            default:
                throw runtime_error( "getopt_long: unexpected return value " + to_string( opt ) );
            }
        }

        if ( optind != argc or config.port < 0 or config.upstream_dns.empty() ) {
            usage_error( argv[ 0 ] );
        }

        /* block the signals before any thread starts, so only the signalfd sees them */
        const SignalMask signals( { SIGHUP, SIGTERM, SIGQUIT, SIGINT } );
        signals.set_as_mask();
        SignalFD signal_fd( signals );

        /* a peer that hangs up mid-reply fails that send(), not the process */
        const SignalMask ignored( { SIGPIPE } );
        ignored.set_as_mask();

        DNSProxy proxy;
        ProxyHandle & handle = proxy.start( config );

        cerr << "Serving DNS on port " << handle.port() << " (udp and tcp), forwarding to "
             << handle.forwarder().target().str() << endl;

        /* we get signal -> main screen turn on */
        Poller poller;
        poller.add_action( Poller::Action( signal_fd.fd(), Direction::In,
                                           [&] () -> Result {
                                               const signalfd_siginfo sig = signal_fd.read_signal();
                                               cerr << "Stopping on signal " << sig.ssi_signo << endl;
                                               return ResultType::Exit;
                                           } ) );

        while ( poller.poll( -1 ).result != Poller::Result::Type::Exit ) {}

        const unsigned int dropped = handle.emitter().sink_failures();
        proxy.stop();

        if ( dropped ) {
            cerr << "Warning: " << dropped << " audit events could not be recorded" << endl;
        }

        return EXIT_SUCCESS;
    } catch ( const exception & e ) {
        print_exception( e );
        return EXIT_FAILURE;
    }
}
