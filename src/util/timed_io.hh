/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TIMED_IO_HH
#define TIMED_IO_HH

#include <chrono>
#include <string>
#include <cstdint>

#include "file_descriptor.hh"

/* point in time after which a blocking operation gives up.
   a timeout of zero means no deadline */

class Deadline
{
private:
    bool bounded_;
    std::chrono::steady_clock::time_point expiry_;

public:
    Deadline( const uint64_t timeout_ms );

    /* milliseconds left, suitable for Poller::poll() (-1 = forever) */
    int remaining_ms( void ) const;

    bool expired( void ) const;
};

/* read until `length` bytes have arrived or the peer closes the stream;
   throws timeout_error if the deadline passes first */
std::string read_exactly( FileDescriptor & fd, const size_t length,
                          const Deadline & deadline, const std::string & what );

#endif /* TIMED_IO_HH */
