/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <stdexcept>

#include "dns_event.hh"
#include "timestamp.hh"
#include "util.hh"

using namespace std;

typedef DNSAuditProtobufs::DNSEvent Record;

static Record::Type to_record_type( const DNSEvent::Type type )
{
    switch ( type ) {
    case DNSEvent::Type::Received: return Record::RECEIVED;
    case DNSEvent::Type::Sent: return Record::SENT;
    case DNSEvent::Type::Request: return Record::REQUEST;
    case DNSEvent::Type::Reply: return Record::REPLY;
    case DNSEvent::Type::TruncatedReply: return Record::TRUNCATED_REPLY;
    case DNSEvent::Type::InvalidRequest: return Record::INVALID_REQUEST;
    }

    throw runtime_error( "DNSEvent: unknown event type" );
}

/* the detail each kind of event must carry */
static Record::DetailCase expected_detail( const DNSEvent::Type type )
{
    switch ( type ) {
    case DNSEvent::Type::Received:
    case DNSEvent::Type::Sent:
        return Record::kPayload;
    case DNSEvent::Type::Request:
        return Record::kQuestion;
    case DNSEvent::Type::Reply:
    case DNSEvent::Type::TruncatedReply:
        return Record::kAnswer;
    case DNSEvent::Type::InvalidRequest:
        return Record::kError;
    }

    return Record::DETAIL_NOT_SET;
}

DNSEvent::DNSEvent( const Type type, const DNSQuery & query )
    : record_()
{
    record_.set_type( to_record_type( type ) );
    record_.set_client_address( query.client.ip() );
    record_.set_client_port( query.client.port() );
    record_.set_protocol( query.protocol == Protocol::UDP ? Record::UDP : Record::TCP );
    record_.set_timestamp_ms( raw_timestamp() );
}

DNSEvent::DNSEvent( const Record & record )
    : record_( record )
{
    if ( not record_.IsInitialized() ) {
        throw runtime_error( "DNSEvent: incomplete record" );
    }

    if ( record_.detail_case() != expected_detail( type() ) ) {
        throw runtime_error( "DNSEvent: " + type_name() + " record carries the wrong detail" );
    }
}

DNSEvent DNSEvent::received( const DNSQuery & query )
{
    DNSEvent event( Type::Received, query );
    auto payload = event.record_.mutable_payload();
    payload->set_length( query.payload.size() );
    payload->set_hex_data( hexlify( query.payload ) );
    return event;
}

DNSEvent DNSEvent::sent( const DNSQuery & query, const string & reply )
{
    DNSEvent event( Type::Sent, query );
    auto payload = event.record_.mutable_payload();
    payload->set_length( reply.size() );
    payload->set_hex_data( hexlify( reply ) );
    return event;
}

DNSEvent DNSEvent::request( const DNSQuery & query, const DNSMessage & request )
{
    if ( not request.has_question() ) {
        throw dns_decode_error( "request has no question" );
    }

    DNSEvent event( Type::Request, query );
    auto question = event.record_.mutable_question();
    question->set_query_name( request.query_name() );
    question->set_response_type( DNSMessage::type_name( request.query_type() ) );
    return event;
}

DNSEvent DNSEvent::answer( const Type type, const DNSQuery & query,
                           const DNSMessage & reply, const DNSMessage & request )
{
    /* some servers leave the question out of error replies */
    const DNSMessage & asked = reply.has_question() ? reply : request;

    DNSEvent event( type, query );
    auto answer = event.record_.mutable_answer();
    answer->set_query_name( asked.query_name() );
    answer->set_response_type( DNSMessage::type_name( asked.query_type() ) );

    if ( reply.rcode() == 0 ) { /* NOERROR */
        auto records = answer->mutable_response_records();
        for ( const auto & name : reply.answer_type_names() ) {
            records->add_type( name );
        }
    } else {
        answer->set_response_code( reply.rcode() );
    }

    return event;
}

DNSEvent DNSEvent::reply( const DNSQuery & query, const DNSMessage & reply, const DNSMessage & request )
{
    return answer( Type::Reply, query, reply, request );
}

DNSEvent DNSEvent::truncated_reply( const DNSQuery & query, const DNSMessage & reply, const DNSMessage & request )
{
    return answer( Type::TruncatedReply, query, reply, request );
}

DNSEvent DNSEvent::invalid_request( const DNSQuery & query, const string & error )
{
    DNSEvent event( Type::InvalidRequest, query );
    event.record_.set_error( error );
    return event;
}

DNSEvent::Type DNSEvent::type( void ) const
{
    switch ( record_.type() ) {
    case Record::RECEIVED: return Type::Received;
    case Record::SENT: return Type::Sent;
    case Record::REQUEST: return Type::Request;
    case Record::REPLY: return Type::Reply;
    case Record::TRUNCATED_REPLY: return Type::TruncatedReply;
    case Record::INVALID_REQUEST: return Type::InvalidRequest;
    }

    throw runtime_error( "DNSEvent: unknown record type " + to_string( record_.type() ) );
}

Protocol DNSEvent::protocol( void ) const
{
    return record_.protocol() == Record::UDP ? Protocol::UDP : Protocol::TCP;
}

string DNSEvent::type_name( const Type type )
{
    switch ( type ) {
    case Type::Received: return "received";
    case Type::Sent: return "sent";
    case Type::Request: return "request";
    case Type::Reply: return "reply";
    case Type::TruncatedReply: return "truncated_reply";
    case Type::InvalidRequest: return "invalid_request";
    }

    return "unknown";
}

string DNSEvent::type_name( void ) const
{
    return type_name( type() );
}

DNSEvent::FieldList DNSEvent::fields( void ) const
{
    FieldList ret = {
        { "type", type_name() },
        { "client_address", client_address() },
        { "client_port", to_string( client_port() ) },
        { "protocol", protocol_name( protocol() ) }
    };

    switch ( record_.detail_case() ) {
    case Record::kPayload:
        ret.emplace_back( "length", to_string( record_.payload().length() ) );
        ret.emplace_back( "data", record_.payload().hex_data() );
        break;

    case Record::kQuestion:
        ret.emplace_back( "query_name", record_.question().query_name() );
        ret.emplace_back( "response_type", record_.question().response_type() );
        break;

    case Record::kAnswer: {
        const auto & answer = record_.answer();
        ret.emplace_back( "query_name", answer.query_name() );
        ret.emplace_back( "response_type", answer.response_type() );

        if ( answer.has_response_code() ) {
            ret.emplace_back( "response_code", to_string( answer.response_code() ) );
        } else {
            const auto & types = answer.response_records().type();
            ret.emplace_back( "response_records", join( vector< string >( types.begin(), types.end() ), "," ) );
        }
        break;
    }

    case Record::kError:
        ret.emplace_back( "error", record_.error() );
        break;

    case Record::DETAIL_NOT_SET:
        break;
    }

    return ret;
}

/* quote values that would otherwise not survive a split on spaces */
static string text_value( const string & value )
{
    if ( not value.empty() and value.find_first_of( " \t\n\"=" ) == string::npos ) {
        return value;
    }

    string ret = "\"";
    for ( const auto & ch : value ) {
        if ( ch == '"' or ch == '\\' ) {
            ret.push_back( '\\' );
        }
        ret.push_back( ch == '\n' ? ' ' : ch );
    }
    ret.push_back( '"' );

    return ret;
}

string DNSEvent::str( void ) const
{
    vector< string > pairs;
    for ( const auto & field : fields() ) {
        pairs.push_back( field.first + "=" + text_value( field.second ) );
    }

    return join( pairs );
}
