/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef SIGNALFD_HH
#define SIGNALFD_HH

#include <sys/signalfd.h>
#include <initializer_list>

#include "file_descriptor.hh"

/* wrapper class for Unix signal masks */

class SignalMask
{
private:
    sigset_t mask_;

public:
    SignalMask( const std::initializer_list< int > signals );
    const sigset_t & mask( void ) const { return mask_; }

    /* block these signals in the calling thread and the threads it starts */
    void set_as_mask( void ) const;
};

/* wrapper class for signal file descriptor */

class SignalFD
{
private:
    FileDescriptor fd_;

public:
    SignalFD( const SignalMask & signals );

    FileDescriptor & fd( void ) { return fd_; }
    signalfd_siginfo read_signal( void ); /* read one signal */
};

#endif /* SIGNALFD_HH */
