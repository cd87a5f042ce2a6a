#pragma once
#include <memory>
#include <CoreGraphics/CoreGraphics.h>
#include <IOKit/IOKitLib.h>
#include <IOKit/i2c/IOI2CInterface.h>
#include "Core/Ddc/DdcTransport.hpp"

// DDC/CI via bus I2C del framebuffer (IOFB*/IOI2C*), Mac Intel.
// Prende possesso del riferimento al framebuffer.
class IntelI2CTransport : public DdcVolumeTransport {
public:
    // nullptr se il display non ha un framebuffer raggiungibile
    static std::unique_ptr<IntelI2CTransport> Create(CGDirectDisplayID displayId);

    explicit IntelI2CTransport(io_service_t framebuffer, Sleeper sleeper = DefaultSleeper());
    ~IntelI2CTransport() override;

    IntelI2CTransport(const IntelI2CTransport&) = delete;
    IntelI2CTransport& operator=(const IntelI2CTransport&) = delete;

    const char* name() const override { return "intel-i2c"; }

    static constexpr int kReadRetries = 3;   // per tipo di transazione (e per le scritture)

protected:
    bool exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int attempt) override;
    bool sendSetVcp(uint8_t vcp, uint16_t value) override;

private:
    // Prova tutti i bus del framebuffer, il primo che risponde vince
    bool send(IOI2CRequest& request) const;

    io_service_t m_framebuffer = 0;
};
