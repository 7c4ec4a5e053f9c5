/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef INT32_HH
#define INT32_HH

/* Helper class to represent a 32-bit integer that
   will be transmitted in network byte order */

#include <endian.h>
#include <cstdint>
#include <cstring>
#include <string>
#include <stdexcept>

class Integer32 {
private:
    uint32_t contents_ = 0;

public:
    Integer32( void ) {}

    Integer32( const uint32_t contents ) : contents_( contents ) {}

    /* Construct integer from network-byte-order string */
    Integer32( const std::string & contents )
    {
        if ( contents.size() != sizeof( uint32_t ) ) {
            throw std::runtime_error( "int32 constructor: size mismatch" );
        }

        uint32_t network_order;
        memcpy( &network_order, contents.data(), sizeof( network_order ) );
        contents_ = be32toh( network_order );
    }

    /* Produce network-byte-order representation of integer */
    operator std::string () const
    {
        const uint32_t network_order = htobe32( contents_ );
        return std::string( reinterpret_cast<const char *>( &network_order ), sizeof( network_order ) );
    }

    /* access underlying contents */
    operator const uint32_t & () const { return contents_; }
};

#endif
