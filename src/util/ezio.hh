/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef EZIO_HH
#define EZIO_HH

#include <string>

long int myatoi( const std::string & str, const int base = 10 );

#endif /* EZIO_HH */
