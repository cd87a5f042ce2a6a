#pragma once
#include <array>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <optional>
#include "Core/VolumeTypes.hpp"

// Framing VESA MCCS (DDC/CI) per Get/Set VCP.
// Indirizzi I2C: scrittura 0x6E, lettura 0x6F, sub-address 0x51.
namespace Ddc {

    constexpr uint8_t kWriteAddress = 0x6E;
    constexpr uint8_t kReadAddress = 0x6F;
    constexpr uint8_t kHostAddress = 0x51;        // source / sub-address
    constexpr uint8_t kReplySeed = 0x50;          // seed checksum della risposta
    constexpr uint8_t kServiceChipAddress = 0x37; // 0x37 << 1 == 0x6E
    constexpr uint8_t kVcpAudioVolume = 0x62;

    constexpr uint8_t kGetVcpOpcode = 0x01;
    constexpr uint8_t kGetVcpReplyOpcode = 0x02;
    constexpr uint8_t kSetVcpOpcode = 0x03;
    constexpr size_t  kGetVcpReplyLength = 11;

    using GetVcpRequest = std::array<uint8_t, 5>;   // 51 82 01 vcp chk
    using SetVcpRequest = std::array<uint8_t, 7>;   // 51 84 03 vcp hi lo chk
    using Reply = std::array<uint8_t, kGetVcpReplyLength>;

    // XOR di seed con data[0..count)
    uint8_t Checksum(uint8_t seed, const uint8_t* data, size_t count);

    GetVcpRequest BuildGetVcpRequest(uint8_t vcp);
    SetVcpRequest BuildSetVcpRequest(uint8_t vcp, uint16_t value);

    // Pacchetto per il servizio per-display (0x51 viaggia come data address):
    // [0x80 | (n+1), n, payload..., chk]
    // seed = 0x6E per payload di 1 byte, 0x6E ^ 0x51 altrimenti
    std::vector<uint8_t> BuildServicePacket(const std::vector<uint8_t>& payload);

    // Opcode 0x02, result 0x00, checksum 0x50 ^ bytes[0..9] == bytes[10]
    bool ValidateReply(const uint8_t* reply, size_t len);

    // Risposta valida -> (current, max). max == 0 viene scartato.
    std::optional<RawDeviceVolume> ParseGetVcpReply(const uint8_t* reply, size_t len);

    inline std::optional<RawDeviceVolume> ParseGetVcpReply(const Reply& r) {
        return ParseGetVcpReply(r.data(), r.size());
    }

} // namespace Ddc
