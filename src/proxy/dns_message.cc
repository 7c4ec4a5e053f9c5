/* -*-mode:c++; tab-width: 4; indent-tabs-mode: nil; c-basic-offset: 4 -*- */

#include <arpa/nameser.h>
#include <cerrno>
#include <cstring>
#include <map>

#include "dns_message.hh"

using namespace std;

const size_t DNSMessage::HEADER_SIZE;

static string parse_failure( const string & attempt )
{
    return attempt + ": " + strerror( errno );
}

static string fully_qualified( const string & name )
{
    if ( name.empty() or name == "." ) {
        return ".";
    }

    return name.back() == '.' ? name : name + ".";
}

DNSMessage::DNSMessage( const string & wire )
    : id_(), opcode_(), rcode_(), is_response_(), truncated_(),
      has_question_( false ), query_name_(), query_type_(),
      answer_types_()
{
    if ( wire.size() < HEADER_SIZE ) {
        throw dns_decode_error( "message of " + to_string( wire.size() )
                                + " bytes is shorter than a header" );
    }

    ns_msg handle;
    errno = 0;
    if ( ns_initparse( reinterpret_cast<const unsigned char *>( wire.data() ),
                       wire.size(), &handle ) < 0 ) {
        throw dns_decode_error( parse_failure( "ns_initparse" ) );
    }

    id_ = ns_msg_id( handle );
    opcode_ = ns_msg_getflag( handle, ns_f_opcode );
    rcode_ = ns_msg_getflag( handle, ns_f_rcode );
    is_response_ = ns_msg_getflag( handle, ns_f_qr );
    truncated_ = ns_msg_getflag( handle, ns_f_tc );

    if ( ns_msg_count( handle, ns_s_qd ) > 0 ) {
        ns_rr question;
        if ( ns_parserr( &handle, ns_s_qd, 0, &question ) < 0 ) {
            throw dns_decode_error( parse_failure( "question" ) );
        }

        has_question_ = true;
        query_name_ = fully_qualified( ns_rr_name( question ) );
        query_type_ = ns_rr_type( question );
    }

    const int answer_count = ns_msg_count( handle, ns_s_an );
    for ( int i = 0; i < answer_count; i++ ) {
        ns_rr answer;
        if ( ns_parserr( &handle, ns_s_an, i, &answer ) < 0 ) {
            throw dns_decode_error( parse_failure( "answer " + to_string( i ) ) );
        }

        answer_types_.push_back( ns_rr_type( answer ) );
    }
}

vector< string > DNSMessage::answer_type_names( void ) const
{
    vector< string > ret;
    for ( const auto & type : answer_types_ ) {
        ret.push_back( type_name( type ) );
    }
    return ret;
}

string DNSMessage::type_name( const uint16_t type )
{
    static const map< uint16_t, string > names = {
        { ns_t_a, "A" }, { ns_t_ns, "NS" }, { ns_t_md, "MD" }, { ns_t_mf, "MF" },
        { ns_t_cname, "CNAME" }, { ns_t_soa, "SOA" }, { ns_t_mb, "MB" },
        { ns_t_mg, "MG" }, { ns_t_mr, "MR" }, { ns_t_null, "NULL" },
        { ns_t_wks, "WKS" }, { ns_t_ptr, "PTR" }, { ns_t_hinfo, "HINFO" },
        { ns_t_minfo, "MINFO" }, { ns_t_mx, "MX" }, { ns_t_txt, "TXT" },
        { ns_t_rp, "RP" }, { ns_t_afsdb, "AFSDB" }, { ns_t_x25, "X25" },
        { ns_t_isdn, "ISDN" }, { ns_t_rt, "RT" }, { ns_t_nsap, "NSAP" },
        { ns_t_sig, "SIG" }, { ns_t_key, "KEY" }, { ns_t_px, "PX" },
        { ns_t_gpos, "GPOS" }, { ns_t_aaaa, "AAAA" }, { ns_t_loc, "LOC" },
        { ns_t_nxt, "NXT" }, { ns_t_srv, "SRV" }, { ns_t_naptr, "NAPTR" },
        { ns_t_kx, "KX" }, { ns_t_cert, "CERT" }, { ns_t_a6, "A6" },
        { ns_t_dname, "DNAME" }, { ns_t_opt, "OPT" }, { ns_t_apl, "APL" },
        { ns_t_ds, "DS" }, { ns_t_sshfp, "SSHFP" }, { ns_t_ipseckey, "IPSECKEY" },
        { ns_t_rrsig, "RRSIG" }, { ns_t_nsec, "NSEC" }, { ns_t_dnskey, "DNSKEY" },
        { ns_t_dhcid, "DHCID" }, { ns_t_nsec3, "NSEC3" }, { ns_t_nsec3param, "NSEC3PARAM" },
        { ns_t_tlsa, "TLSA" }, { ns_t_hip, "HIP" }, { 59, "CDS" }, { 60, "CDNSKEY" },
        { 61, "OPENPGPKEY" }, { 64, "SVCB" }, { 65, "HTTPS" }, { ns_t_spf, "SPF" },
        { ns_t_tkey, "TKEY" }, { ns_t_tsig, "TSIG" }, { ns_t_ixfr, "IXFR" },
        { ns_t_axfr, "AXFR" }, { ns_t_mailb, "MAILB" }, { ns_t_maila, "MAILA" },
        { ns_t_any, "ANY" }, { 256, "URI" }, { 257, "CAA" }
    };

    const auto it = names.find( type );
    if ( it == names.end() ) {
        return "TYPE" + to_string( type );
    }

    return it->second;
}
