/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef TIMESTAMP_HH
#define TIMESTAMP_HH

#include <cstdint>
#include <string>

/* milliseconds since the Unix epoch */
uint64_t raw_timestamp( void );

/* "seconds.millis" rendering of a raw timestamp */
std::string timestamp_seconds( const uint64_t millis );

#endif /* TIMESTAMP_HH */
