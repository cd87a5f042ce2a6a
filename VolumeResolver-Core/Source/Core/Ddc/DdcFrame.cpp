#include "Core/Ddc/DdcFrame.hpp"

namespace Ddc {

uint8_t Checksum(uint8_t seed, const uint8_t* data, size_t count) {
    uint8_t v = seed;
    for (size_t i = 0; i < count; ++i) v ^= data[i];
    return v;
}

GetVcpRequest BuildGetVcpRequest(uint8_t vcp) {
    GetVcpRequest r{ kHostAddress, 0x82, kGetVcpOpcode, vcp, 0 };
    r[4] = Checksum(kWriteAddress, r.data(), 4);
    return r;
}

SetVcpRequest BuildSetVcpRequest(uint8_t vcp, uint16_t value) {
    SetVcpRequest r{
        kHostAddress, 0x84, kSetVcpOpcode, vcp,
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value & 0xFF),
        0
    };
    r[6] = Checksum(kWriteAddress, r.data(), 6);
    return r;
}

std::vector<uint8_t> BuildServicePacket(const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> p;
    p.reserve(payload.size() + 3);
    p.push_back(static_cast<uint8_t>(0x80 | (payload.size() + 1)));
    p.push_back(static_cast<uint8_t>(payload.size()));
    p.insert(p.end(), payload.begin(), payload.end());

    const uint8_t chip = static_cast<uint8_t>(kServiceChipAddress << 1);
    const uint8_t seed = payload.size() == 1 ? chip : static_cast<uint8_t>(chip ^ kHostAddress);
    p.push_back(Checksum(seed, p.data(), p.size()));
    return p;
}

bool ValidateReply(const uint8_t* reply, size_t len) {
    if (!reply || len < kGetVcpReplyLength) return false;
    if (reply[2] != kGetVcpReplyOpcode) return false;
    if (reply[3] != 0x00) return false;   // flag di errore
    return Checksum(kReplySeed, reply, kGetVcpReplyLength - 1) == reply[kGetVcpReplyLength - 1];
}

std::optional<RawDeviceVolume> ParseGetVcpReply(const uint8_t* reply, size_t len) {
    if (!ValidateReply(reply, len)) return std::nullopt;

    RawDeviceVolume v;
    v.max = static_cast<uint16_t>((reply[6] << 8) | reply[7]);
    v.current = static_cast<uint16_t>((reply[8] << 8) | reply[9]);
    if (v.max == 0) return std::nullopt;
    return v;
}

} // namespace Ddc
