/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef INT16_HH
#define INT16_HH

/* 16-bit integer in network byte order, as used for the
   length prefix of DNS messages carried over TCP */

#include <endian.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <stdexcept>

class Integer16 {
private:
    uint16_t contents_ = 0;

public:
    Integer16( void ) {}

    Integer16( const uint16_t contents ) : contents_( contents ) {}

    /* Construct integer from network-byte-order string */
    Integer16( const std::string & contents )
    {
        if ( contents.size() != sizeof( uint16_t ) ) {
            throw std::runtime_error( "int16 constructor: size mismatch" );
        }

        uint16_t network_order;
        memcpy( &network_order, contents.data(), sizeof( network_order ) );
        contents_ = be16toh( network_order );
    }

    /* Produce network-byte-order representation of integer */
    operator std::string () const
    {
        const uint16_t network_order = htobe16( contents_ );
        return std::string( reinterpret_cast<const char *>( &network_order ), sizeof( network_order ) );
    }

    /* access underlying contents */
    operator const uint16_t & () const { return contents_; }
};

#endif
