/**
 * ICMP / ICMPv6 echo codec.
 *
 * Pure byte manipulation, no sockets: the prober hands every received
 * datagram to classify_reply() and only acts on the verdict.
 */

#include "cjitter/icmp.hpp"
#include "cjitter/ip.hpp"
#include "cjitter/util.hpp"

#include <cstddef>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace cjitter {

// ============================================================================
// Helpers
// ============================================================================
static IcmpHeader read_icmp_header(const uint8_t* p) {
    IcmpHeader hdr{};
    std::memcpy(&hdr, p, sizeof(hdr));
    return hdr;
}

static bool same_request(const IcmpHeader& hdr,
                         uint16_t id,
                         uint16_t seq,
                         bool match_id)
{
    if (ntohs(hdr.seq) != seq)
        return false;
    return !match_id || ntohs(hdr.id) == id;
}


// ============================================================================
// Build Echo Request
// ============================================================================
std::vector<uint8_t> build_echo_request(bool ipv6,
                                        uint16_t id,
                                        uint16_t seq,
                                        uint64_t timestamp)
{
    std::vector<uint8_t> packet(sizeof(IcmpHeader) + kEchoPayloadSize, 0);

    IcmpHeader hdr{};
    hdr.type     = ipv6 ? kIcmp6EchoRequest : kIcmpEchoRequest;
    hdr.code     = 0;
    hdr.checksum = 0;
    hdr.id       = htons(id);
    hdr.seq      = htons(seq);
    std::memcpy(packet.data(), &hdr, sizeof(hdr));

    // Timestamp, then the same incrementing filler ping(8) uses
    uint8_t* payload = packet.data() + sizeof(IcmpHeader);
    std::memcpy(payload, &timestamp, sizeof(timestamp));
    for (size_t i = sizeof(timestamp); i < kEchoPayloadSize; ++i)
        payload[i] = static_cast<uint8_t>(i);

    if (!ipv6) {
        uint16_t sum = checksum16(packet.data(), packet.size());
        std::memcpy(packet.data() + offsetof(IcmpHeader, checksum), &sum, sizeof(sum));
    }

    return packet;
}


// ============================================================================
// Classify received datagram
// ============================================================================
static ReplyKind classify_v4(const uint8_t* icmp, size_t len,
                             uint16_t id, uint16_t seq, bool match_id)
{
    if (len < sizeof(IcmpHeader))
        return ReplyKind::Unrelated;

    IcmpHeader hdr = read_icmp_header(icmp);

    if (hdr.type == kIcmpEchoReply) {
        return same_request(hdr, id, seq, match_id) ? ReplyKind::EchoReply
                                                    : ReplyKind::Unrelated;
    }

    if (hdr.type != kIcmpDestUnreachable && hdr.type != kIcmpTimeExceeded)
        return ReplyKind::Unrelated;

    // Error messages quote the offending IPv4 header + first 8 bytes
    const uint8_t* quoted = icmp + sizeof(IcmpHeader);
    size_t left = len - sizeof(IcmpHeader);
    if (left < sizeof(IpHeader))
        return ReplyKind::Unrelated;

    IpHeader inner{};
    std::memcpy(&inner, quoted, sizeof(inner));
    size_t ihl = static_cast<size_t>(inner.ver_ihl & 0x0F) * 4;
    if (inner.protocol != IPPROTO_ICMP || ihl < sizeof(IpHeader) ||
        left < ihl + sizeof(IcmpHeader))
        return ReplyKind::Unrelated;

    IcmpHeader orig = read_icmp_header(quoted + ihl);
    if (orig.type != kIcmpEchoRequest || !same_request(orig, id, seq, match_id))
        return ReplyKind::Unrelated;

    return ReplyKind::Unreachable;
}


static ReplyKind classify_v6(const uint8_t* icmp, size_t len,
                             uint16_t id, uint16_t seq, bool match_id)
{
    if (len < sizeof(IcmpHeader))
        return ReplyKind::Unrelated;

    IcmpHeader hdr = read_icmp_header(icmp);

    if (hdr.type == kIcmp6EchoReply) {
        return same_request(hdr, id, seq, match_id) ? ReplyKind::EchoReply
                                                    : ReplyKind::Unrelated;
    }

    if (hdr.type != kIcmp6DestUnreachable && hdr.type != kIcmp6TimeExceeded)
        return ReplyKind::Unrelated;

    // 4 unused bytes after type/code/checksum, then the invoking packet
    const uint8_t* quoted = icmp + sizeof(IcmpHeader);
    size_t left = len - sizeof(IcmpHeader);
    if (left < sizeof(Ip6Header) + sizeof(IcmpHeader))
        return ReplyKind::Unrelated;

    Ip6Header inner{};
    std::memcpy(&inner, quoted, sizeof(inner));
    if (inner.next_header != IPPROTO_ICMPV6)
        return ReplyKind::Unrelated;

    IcmpHeader orig = read_icmp_header(quoted + sizeof(Ip6Header));
    if (orig.type != kIcmp6EchoRequest || !same_request(orig, id, seq, match_id))
        return ReplyKind::Unrelated;

    return ReplyKind::Unreachable;
}


ReplyKind classify_reply(const uint8_t* buf,
                         size_t len,
                         bool ipv6,
                         bool has_ip_header,
                         uint16_t id,
                         uint16_t seq,
                         bool match_id)
{
    if (!buf)
        return ReplyKind::Unrelated;

    if (ipv6)
        return classify_v6(buf, len, id, seq, match_id);

    if (!has_ip_header)
        return classify_v4(buf, len, id, seq, match_id);

    // Raw IPv4 sockets: skip the outer IP header first
    if (len < sizeof(IpHeader))
        return ReplyKind::Unrelated;

    IpHeader outer{};
    std::memcpy(&outer, buf, sizeof(outer));
    size_t ihl = static_cast<size_t>(outer.ver_ihl & 0x0F) * 4;
    if ((outer.ver_ihl >> 4) != 4 || ihl < sizeof(IpHeader) || len < ihl)
        return ReplyKind::Unrelated;

    return classify_v4(buf + ihl, len - ihl, id, seq, match_id);
}

} // namespace cjitter
