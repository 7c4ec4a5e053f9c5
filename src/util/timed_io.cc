/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <algorithm>
#include <limits>

#include "timed_io.hh"
#include "poller.hh"
#include "exception.hh"

using namespace std;
using namespace std::chrono;
using namespace PollerShortNames;

Deadline::Deadline( const uint64_t timeout_ms )
    : bounded_( timeout_ms > 0 ),
      expiry_( steady_clock::now() + milliseconds( timeout_ms ) )
{}

int Deadline::remaining_ms( void ) const
{
    if ( not bounded_ ) {
        return -1;
    }

    const auto now = steady_clock::now();
    if ( now >= expiry_ ) {
        return 0;
    }

    /* round up so we never wake a hair early and spin */
    const auto left = duration_cast<milliseconds>( expiry_ - now ).count() + 1;
    return static_cast<int>( min<decltype( left )>( left, numeric_limits<int>::max() ) );
}

bool Deadline::expired( void ) const
{
    return bounded_ and steady_clock::now() >= expiry_;
}

string read_exactly( FileDescriptor & fd, const size_t length,
                     const Deadline & deadline, const string & what )
{
    string ret;

    if ( length == 0 ) {
        return ret;
    }

    Poller poller;
    poller.add_action( Poller::Action( fd, Direction::In,
                                       [&] () -> Result {
                                           ret.append( fd.read( length - ret.size() ) );
                                           return ( ret.size() == length or fd.eof() )
                                               ? ResultType::Exit : ResultType::Continue;
                                       } ) );

    while ( ret.size() < length and not fd.eof() ) {
        const auto result = poller.poll( deadline.remaining_ms() );
        if ( result.result == Poller::Result::Type::Timeout ) {
            throw timeout_error( what + " (" + to_string( ret.size() ) + " of "
                                 + to_string( length ) + " bytes)" );
        } else if ( result.result == Poller::Result::Type::Exit ) {
            break;
        }
    }

    return ret;
}
