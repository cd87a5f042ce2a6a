#pragma once
#include <cstdint>
#include <optional>
#include "Core/VolumeTypes.hpp"
#include "Core/Ddc/DdcFrame.hpp"
#include "Core/Ddc/RetryPolicy.hpp"

// Trasporto DDC/CI verso un singolo display (VCP 0x62).
// Nessuna eccezione: fallimenti = nullopt / false.
class DdcTransport {
public:
    virtual ~DdcTransport() = default;

    virtual const char* name() const = 0;

    // true se almeno una lettura va a buon fine
    virtual bool isSupported() = 0;

    // (current, max) da una risposta validata, altrimenti nullopt
    virtual std::optional<RawDeviceVolume> readVolume() = 0;

    // Set VCP; current viene limitato a max
    virtual bool writeVolume(uint16_t current, uint16_t max) = 0;
};

// Logica comune: framing, validazione, retry e doppia scrittura.
// Le sottoclassi forniscono solo la singola transazione I2C.
class DdcVolumeTransport : public DdcTransport {
public:
    DdcVolumeTransport(RetryPolicy readPolicy, RetryPolicy writePolicy, Sleeper sleeper = DefaultSleeper());

    bool isSupported() override;
    std::optional<RawDeviceVolume> readVolume() override;
    bool writeVolume(uint16_t current, uint16_t max) override;

    static constexpr int kWriteCycles = 2;                        // molti pannelli perdono la prima
    static constexpr std::chrono::milliseconds kWriteGap{ 10 };

protected:
    // Una singola richiesta Get VCP + lettura della risposta (11 byte)
    virtual bool exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int attempt) = 0;

    // Un singolo invio Set VCP (nessuna risposta)
    virtual bool sendSetVcp(uint8_t vcp, uint16_t value) = 0;

    void pause(std::chrono::milliseconds d) const { if (m_sleep) m_sleep(d); }

private:
    RetryPolicy m_readPolicy;
    RetryPolicy m_writePolicy;
    Sleeper m_sleep;
};
