/*
 * Valheim Server Manager — RCON wire codec (header)
 * Frame: int32 LE size | int32 LE id | int32 LE type | body | 0x00 0x00
 * (size excludes itself). No I/O here.
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vsm { namespace rcon {

constexpr std::int32_t kTypeAuth          = 3;
constexpr std::int32_t kTypeAuthResponse  = 2;
constexpr std::int32_t kTypeExecCommand   = 2; // same value as AUTH_RESPONSE, told apart by direction
constexpr std::int32_t kTypeResponseValue = 0;

constexpr std::size_t  kSizeFieldBytes  = 4;
constexpr std::int32_t kMinPacketSize   = 10;   // id + type + two terminators
constexpr std::size_t  kMaxBodySize     = 4096;
constexpr std::int32_t kAuthFailureId   = -1;

using Bytes = std::vector<std::uint8_t>;

struct Packet {
    std::int32_t id{0};
    std::int32_t type{0};
    std::string  body;
};

inline bool operator==(const Packet& a, const Packet& b) {
    return a.id == b.id && a.type == b.type && a.body == b.body;
}

/* Throws Error(InvalidBody) if body is longer than kMaxBodySize or holds a NUL. */
Bytes encodePacket(std::int32_t id, std::int32_t type, const std::string& body);

/*
 * Decodes the frame at the start of data. Throws Error(BufferTooSmall) when
 * fewer than 4 bytes or fewer than 4 + size bytes are present, and
 * Error(InvalidPacketSize) when the declared size is below kMinPacketSize.
 */
Packet decodePacket(const std::uint8_t* data, std::size_t len);
Packet decodePacket(const Bytes& buf);

/* True iff len >= 4 and len >= 4 + declared size. Consumes nothing. */
bool hasCompletePacket(const std::uint8_t* data, std::size_t len);
bool hasCompletePacket(const Bytes& buf);

/* Bytes occupied by the frame at the start of buf (4 + declared size). */
std::size_t frameSize(const std::uint8_t* data, std::size_t len);

inline Bytes makeAuthPacket(std::int32_t id, const std::string& password) {
    return encodePacket(id, kTypeAuth, password);
}

inline Bytes makeCommandPacket(std::int32_t id, const std::string& command) {
    return encodePacket(id, kTypeExecCommand, command);
}

inline bool isAuthFailure(const Packet& p) { return p.id == kAuthFailureId; }

}} // namespace vsm::rcon
