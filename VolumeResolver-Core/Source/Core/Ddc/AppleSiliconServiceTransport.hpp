#pragma once
#include <memory>
#include <CoreGraphics/CoreGraphics.h>
#include "Core/Ddc/DdcTransport.hpp"
#include "Core/Display/PrivateDisplayApi.hpp"

// DDC/CI tramite il servizio IOAVService per-display (Apple Silicon).
// Tutte le chiamate passano dalla tabella PrivateDisplayApi.
class AppleSiliconServiceTransport : public DdcVolumeTransport {
public:
    // nullptr se i simboli mancano o il display non ha un servizio AV
    static std::unique_ptr<AppleSiliconServiceTransport> Create(CGDirectDisplayID displayId);

    AppleSiliconServiceTransport(const PrivateDisplayApi& api, CFTypeRef service, Sleeper sleeper = DefaultSleeper());
    ~AppleSiliconServiceTransport() override;

    AppleSiliconServiceTransport(const AppleSiliconServiceTransport&) = delete;
    AppleSiliconServiceTransport& operator=(const AppleSiliconServiceTransport&) = delete;

    const char* name() const override { return "av-service"; }

    static constexpr std::chrono::milliseconds kReplySettle{ 50 };

protected:
    bool exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int attempt) override;
    bool sendSetVcp(uint8_t vcp, uint16_t value) override;

private:
    bool writePacket(std::vector<uint8_t> packet);

    const PrivateDisplayApi& m_api;
    CFTypeRef m_service = nullptr;
};
