/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SOCKETPAIR_HH
#define SOCKETPAIR_HH

#include <utility>
#include <sys/socket.h>

#include "file_descriptor.hh"
#include "exception.hh"

/* connected pair of datagram sockets, used to wake a poller from another thread */
inline std::pair<FileDescriptor, FileDescriptor> make_pipe( void )
{
    int pipe[ 2 ];
    SystemCall( "socketpair", socketpair( AF_UNIX, SOCK_DGRAM, 0, pipe ) );
    return std::make_pair( FileDescriptor( pipe[ 0 ] ), FileDescriptor( pipe[ 1 ] ) );
}

#endif /* SOCKETPAIR_HH */
