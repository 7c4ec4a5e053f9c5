/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include <gtest/gtest.h>

#include "upstream_target.hh"

using namespace std;

TEST( UpstreamTargetTest, PortDefaultsTo53 )
{
    const UpstreamTarget target( "127.0.0.1" );
    EXPECT_EQ( "127.0.0.1", target.host() );
    EXPECT_EQ( 53, target.port() );
    EXPECT_EQ( "127.0.0.1:53", target.str() );
    EXPECT_EQ( Address( "127.0.0.1", uint16_t( 53 ) ), target.address() );
}

TEST( UpstreamTargetTest, ExplicitPort )
{
    const UpstreamTarget target( "10.1.2.3:5353" );
    EXPECT_EQ( "10.1.2.3", target.host() );
    EXPECT_EQ( 5353, target.port() );
    EXPECT_EQ( 5353, target.address().port() );
}

TEST( UpstreamTargetTest, TrailingColonMeansDefaultPort )
{
    EXPECT_EQ( 53, UpstreamTarget( "127.0.0.1:" ).port() );
}

TEST( UpstreamTargetTest, RejectsBadTargets )
{
    EXPECT_THROW( UpstreamTarget( "" ), runtime_error );
    EXPECT_THROW( UpstreamTarget( ":53" ), runtime_error );
    EXPECT_THROW( UpstreamTarget( "127.0.0.1:0" ), runtime_error );
    EXPECT_THROW( UpstreamTarget( "127.0.0.1:65536" ), runtime_error );
    EXPECT_THROW( UpstreamTarget( "127.0.0.1:dns" ), runtime_error );
}
