/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <arpa/nameser.h>

#include <gtest/gtest.h>

#include "dns_message.hh"
#include "fake_upstream.hh"

using namespace std;

TEST( DNSMessageTest, DecodesQuery )
{
    const DNSMessage message( make_query( 0x1234, "example.com", ns_t_a ) );

    EXPECT_EQ( 0x1234, message.id() );
    EXPECT_EQ( 0u, message.opcode() );
    EXPECT_FALSE( message.is_response() );
    EXPECT_FALSE( message.truncated() );
    ASSERT_TRUE( message.has_question() );
    EXPECT_EQ( "example.com.", message.query_name() );
    EXPECT_EQ( ns_t_a, message.query_type() );
    EXPECT_TRUE( message.answer_types().empty() );
}

TEST( DNSMessageTest, DecodesReplyRecords )
{
    const string query = make_query( 7, "www.example.org", ns_t_aaaa );
    const DNSMessage message( make_reply( query, { ns_t_cname, ns_t_aaaa } ) );

    EXPECT_EQ( 7, message.id() );
    EXPECT_TRUE( message.is_response() );
    EXPECT_EQ( 0u, message.rcode() );
    EXPECT_EQ( "www.example.org.", message.query_name() );
    EXPECT_EQ( "AAAA", DNSMessage::type_name( message.query_type() ) );
    EXPECT_EQ( ( vector< string > { "CNAME", "AAAA" } ), message.answer_type_names() );
}

TEST( DNSMessageTest, ReadsTruncationAndResponseCode )
{
    const string query = make_query( 9, "missing.example", ns_t_a );

    EXPECT_TRUE( DNSMessage( make_reply( query, {}, 0, true ) ).truncated() );
    EXPECT_EQ( 3u, DNSMessage( make_reply( query, {}, 3 ) ).rcode() );
}

TEST( DNSMessageTest, RootNameIsADot )
{
    const DNSMessage message( make_query( 1, ".", ns_t_ns ) );
    EXPECT_EQ( ".", message.query_name() );
}

TEST( DNSMessageTest, MessageWithoutQuestion )
{
    const DNSMessage message( make_bare_reply( 42, 2 ) );
    EXPECT_FALSE( message.has_question() );
    EXPECT_EQ( 2u, message.rcode() );
}

TEST( DNSMessageTest, RejectsShortInput )
{
    EXPECT_THROW( DNSMessage( "" ), dns_decode_error );
    EXPECT_THROW( DNSMessage( "\x01\x02garbage" ), dns_decode_error );
}

TEST( DNSMessageTest, RejectsSectionsPastTheEnd )
{
    /* header promises a question that is not there */
    string header( 12, '\0' );
    header[ 5 ] = 1;
    EXPECT_THROW( DNSMessage{ header }, dns_decode_error );

    /* question cut off in the middle of its name */
    const string query = make_query( 3, "example.com", ns_t_a );
    EXPECT_THROW( DNSMessage( query.substr( 0, 16 ) ), dns_decode_error );
}

TEST( DNSMessageTest, TypeNames )
{
    EXPECT_EQ( "A", DNSMessage::type_name( ns_t_a ) );
    EXPECT_EQ( "MX", DNSMessage::type_name( ns_t_mx ) );
    EXPECT_EQ( "TXT", DNSMessage::type_name( ns_t_txt ) );
    EXPECT_EQ( "HTTPS", DNSMessage::type_name( 65 ) );
    EXPECT_EQ( "TYPE65280", DNSMessage::type_name( 65280 ) );
}
