#include "Core/Ddc/AppleSiliconServiceTransport.hpp"
#include "Core/Ddc/ServiceLookup.hpp"
#include "Core/Display/DisplayServiceResolver.hpp"
#include "Core/Log.hpp"

namespace {
RetryPolicy servicePolicy() { return RetryPolicy{ 4, std::chrono::milliseconds(20), false }; }

CFTypeRef createService(const PrivateDisplayApi& api, CGDirectDisplayID displayId) {
    return OpenFirstService<io_service_t, CFTypeRef>({
        [displayId] { return DisplayServiceResolver::ServicePortForDisplay(displayId); },
        // la porta CGS non sempre espone IOAVService: riprova con il matching per proprietà
        [displayId] { return DisplayServiceResolver::ServicePortByDisplayProperties(displayId); },
    }, [&api, displayId](io_service_t port) {
        CFTypeRef svc = api.avCreateWithService(kCFAllocatorDefault, port);
        IOObjectRelease(port);
        if (!svc) LOGF("[DDC] display {}: porta {} senza IOAVService", displayId, port);
        return svc;
    });
}
}

std::unique_ptr<AppleSiliconServiceTransport> AppleSiliconServiceTransport::Create(CGDirectDisplayID displayId) {
    const auto& api = PrivateDisplayApi::Get();
    if (!api.hasAVService()) return nullptr;

    CFTypeRef svc = createService(api, displayId);
    if (!svc) {
        LOGF("[DDC] IOAVService non disponibile per il display {}", displayId);
        return nullptr;
    }
    return std::make_unique<AppleSiliconServiceTransport>(api, svc);
}

AppleSiliconServiceTransport::AppleSiliconServiceTransport(const PrivateDisplayApi& api, CFTypeRef service, Sleeper sleeper)
    : DdcVolumeTransport(servicePolicy(), servicePolicy(), std::move(sleeper)), m_api(api), m_service(service) {
}

AppleSiliconServiceTransport::~AppleSiliconServiceTransport() {
    if (m_service) { CFRelease(m_service); m_service = nullptr; }
}

bool AppleSiliconServiceTransport::writePacket(std::vector<uint8_t> packet) {
    return m_api.avWriteI2C(m_service, Ddc::kServiceChipAddress, Ddc::kHostAddress,
        packet.data(), static_cast<uint32_t>(packet.size())) == kIOReturnSuccess;
}

bool AppleSiliconServiceTransport::exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int) {
    if (!writePacket(Ddc::BuildServicePacket({ vcp }))) return false;

    pause(kReplySettle);
    reply.fill(0);
    return m_api.avReadI2C(m_service, Ddc::kServiceChipAddress, 0,
        reply.data(), static_cast<uint32_t>(reply.size())) == kIOReturnSuccess;
}

bool AppleSiliconServiceTransport::sendSetVcp(uint8_t vcp, uint16_t value) {
    return writePacket(Ddc::BuildServicePacket({
        vcp,
        static_cast<uint8_t>(value >> 8),
        static_cast<uint8_t>(value & 0xFF) }));
}
