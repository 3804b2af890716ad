/*
 * Valheim Server Manager — RCON wire codec (implementation)
 * (c) 2025 ValheimServerManager contributors
 */
#include "include/RconProtocol.hpp"
#include "include/Errors.hpp"

#include <algorithm>

namespace vsm { namespace rcon {

static inline void putI32LE(std::uint8_t* p, std::int32_t v) {
    const auto u = static_cast<std::uint32_t>(v);
    p[0] = static_cast<std::uint8_t>(u & 0xFFu);
    p[1] = static_cast<std::uint8_t>((u >> 8) & 0xFFu);
    p[2] = static_cast<std::uint8_t>((u >> 16) & 0xFFu);
    p[3] = static_cast<std::uint8_t>((u >> 24) & 0xFFu);
}

static inline std::int32_t getI32LE(const std::uint8_t* p) {
    const std::uint32_t u = static_cast<std::uint32_t>(p[0])
                          | (static_cast<std::uint32_t>(p[1]) << 8)
                          | (static_cast<std::uint32_t>(p[2]) << 16)
                          | (static_cast<std::uint32_t>(p[3]) << 24);
    return static_cast<std::int32_t>(u);
}

Bytes encodePacket(std::int32_t id, std::int32_t type, const std::string& body) {
    if (body.size() > kMaxBodySize) {
        throw Error(ErrorCode::InvalidBody,
                    "rcon body too long: " + std::to_string(body.size()) + " > " +
                    std::to_string(kMaxBodySize));
    }
    if (body.find('\0') != std::string::npos) {
        throw Error(ErrorCode::InvalidBody, "rcon body contains a NUL byte");
    }

    const auto size = static_cast<std::int32_t>(4 + 4 + body.size() + 2);
    Bytes out(kSizeFieldBytes + static_cast<std::size_t>(size), 0);
    putI32LE(out.data(), size);
    putI32LE(out.data() + 4, id);
    putI32LE(out.data() + 8, type);
    std::copy(body.begin(), body.end(), out.begin() + 12);
    // the two trailing terminators are already zero
    return out;
}

Packet decodePacket(const std::uint8_t* data, std::size_t len) {
    if (len < kSizeFieldBytes) {
        throw Error(ErrorCode::BufferTooSmall,
                    "rcon buffer too small for size field: " + std::to_string(len));
    }
    const std::int32_t size = getI32LE(data);
    if (size < kMinPacketSize) {
        throw Error(ErrorCode::InvalidPacketSize, "rcon invalid packet size: " + std::to_string(size));
    }
    const std::size_t need = kSizeFieldBytes + static_cast<std::size_t>(size);
    if (len < need) {
        throw Error(ErrorCode::BufferTooSmall,
                    "rcon buffer too small: expected " + std::to_string(need) +
                    " bytes, got " + std::to_string(len));
    }

    Packet p;
    p.id   = getI32LE(data + 4);
    p.type = getI32LE(data + 8);
    const std::size_t bodyEnd = need - 2;
    p.body.assign(reinterpret_cast<const char*>(data + 12), bodyEnd - 12);
    return p;
}

Packet decodePacket(const Bytes& buf) {
    return decodePacket(buf.data(), buf.size());
}

bool hasCompletePacket(const std::uint8_t* data, std::size_t len) {
    if (len < kSizeFieldBytes) return false;
    const std::int64_t need = static_cast<std::int64_t>(kSizeFieldBytes) + getI32LE(data);
    return static_cast<std::int64_t>(len) >= need;
}

bool hasCompletePacket(const Bytes& buf) {
    return hasCompletePacket(buf.data(), buf.size());
}

std::size_t frameSize(const std::uint8_t* data, std::size_t len) {
    if (len < kSizeFieldBytes) {
        throw Error(ErrorCode::BufferTooSmall, "rcon buffer too small for size field");
    }
    const std::int32_t size = getI32LE(data);
    if (size < kMinPacketSize) {
        throw Error(ErrorCode::InvalidPacketSize, "rcon invalid packet size: " + std::to_string(size));
    }
    return kSizeFieldBytes + static_cast<std::size_t>(size);
}

}} // namespace vsm::rcon
