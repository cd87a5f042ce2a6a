#include "Core/Ddc/DdcTransport.hpp"
#include "Core/Log.hpp"
#include <algorithm>

DdcVolumeTransport::DdcVolumeTransport(RetryPolicy readPolicy, RetryPolicy writePolicy, Sleeper sleeper)
    : m_readPolicy(readPolicy), m_writePolicy(writePolicy), m_sleep(std::move(sleeper)) {
}

bool DdcVolumeTransport::isSupported() {
    return readVolume().has_value();
}

std::optional<RawDeviceVolume> DdcVolumeTransport::readVolume() {
    std::optional<RawDeviceVolume> out;
    RunWithRetry(m_readPolicy, m_sleep, [&](int attempt) {
        Ddc::Reply reply{};
        if (!exchangeGetVcp(Ddc::kVcpAudioVolume, reply, attempt)) return false;
        // risposta scartata = "nessun dato", mai zero
        out = Ddc::ParseGetVcpReply(reply);
        return out.has_value();
    });
    if (!out) LOGF("[DDC] {}: get VCP 0x62 fallita dopo {} tentativi", name(), m_readPolicy.maxAttempts);
    return out;
}

bool DdcVolumeTransport::writeVolume(uint16_t current, uint16_t max) {
    const uint16_t value = std::min(current, max);
    const bool ok = RunWithRetry(m_writePolicy, m_sleep, [&](int) {
        bool wrote = false;
        for (int i = 0; i < kWriteCycles; ++i) {
            pause(kWriteGap);
            if (sendSetVcp(Ddc::kVcpAudioVolume, value)) wrote = true;
        }
        return wrote;
    });
    if (!ok) LOGF("[DDC] {}: set VCP 0x62={} fallita", name(), value);
    return ok;
}
