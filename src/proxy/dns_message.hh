/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#ifndef DNS_MESSAGE_HH
#define DNS_MESSAGE_HH

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

class dns_decode_error : public std::runtime_error
{
public:
    dns_decode_error( const std::string & s_what )
        : runtime_error( "DNS decode: " + s_what )
    {}
};

/* read-only view of a DNS message: header, first question and the
   types of the answer records. Decoding goes through libresolv. */

class DNSMessage
{
private:
    uint16_t id_;
    unsigned int opcode_, rcode_;
    bool is_response_, truncated_;

    bool has_question_;
    std::string query_name_;
    uint16_t query_type_;

    std::vector< uint16_t > answer_types_;

public:
    /* throws dns_decode_error */
    DNSMessage( const std::string & wire );

    uint16_t id( void ) const { return id_; }
    unsigned int opcode( void ) const { return opcode_; }
    unsigned int rcode( void ) const { return rcode_; }
    bool is_response( void ) const { return is_response_; }
    bool truncated( void ) const { return truncated_; }

    bool has_question( void ) const { return has_question_; }

    /* fully qualified, e.g. "example.com." */
    const std::string & query_name( void ) const { return query_name_; }
    uint16_t query_type( void ) const { return query_type_; }

    const std::vector< uint16_t > & answer_types( void ) const { return answer_types_; }
    std::vector< std::string > answer_type_names( void ) const;

    /* mnemonic for an RR type ("A", "AAAA", ...) or "TYPE<n>" */
    static std::string type_name( const uint16_t type );

    static const size_t HEADER_SIZE = 12;
};

#endif /* DNS_MESSAGE_HH */
