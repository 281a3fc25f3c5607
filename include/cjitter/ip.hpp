#pragma once
#include <cstdint>

/**
 * IPv4 header as delivered in front of every datagram read from a raw
 * IPPROTO_ICMP socket, and quoted inside ICMP error messages.
 *
 * Note: This struct must remain packed to match wire format.
 */
#pragma pack(push, 1)
struct IpHeader {
    uint8_t  ver_ihl;   // Version (4 bits) + IHL in 32-bit words (4 bits)
    uint8_t  tos;
    uint16_t tot_len;
    uint16_t id;
    uint16_t frag_off;
    uint8_t  ttl;
    uint8_t  protocol;  // 1 = ICMP
    uint16_t check;
    uint32_t saddr;
    uint32_t daddr;
};

/**
 * Fixed IPv6 header. Raw ICMPv6 sockets never deliver it in front of a
 * message, but ICMPv6 error messages quote the offending packet with it.
 */
struct Ip6Header {
    uint32_t ver_tc_flow;   // Version (4), traffic class (8), flow label (20)
    uint16_t payload_len;
    uint8_t  next_header;   // 58 = ICMPv6
    uint8_t  hop_limit;
    uint8_t  saddr[16];
    uint8_t  daddr[16];
};
#pragma pack(pop)

static_assert(sizeof(IpHeader) == 20, "IpHeader must match the wire format");
static_assert(sizeof(Ip6Header) == 40, "Ip6Header must match the wire format");
