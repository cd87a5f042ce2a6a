#include "Core/Ddc/IntelI2CTransport.hpp"
#include "Core/Display/DisplayServiceResolver.hpp"
#include <cstring>

namespace {
// 2 tipi di risposta x 3 tentativi, 10 ms prima di ogni tentativo
RetryPolicy readPolicy() { return RetryPolicy{ IntelI2CTransport::kReadRetries * 2, std::chrono::milliseconds(10), true }; }
RetryPolicy writePolicy() { return RetryPolicy{ IntelI2CTransport::kReadRetries, std::chrono::milliseconds(10), false }; }

// IODisplayConnect -> framebuffer padre (il CGS restituisce già il framebuffer)
io_service_t framebufferFor(io_service_t service) {
    if (!IOObjectConformsTo(service, "IODisplayConnect")) return service;
    io_registry_entry_t parent = 0;
    const kern_return_t kr = IORegistryEntryGetParentEntry(service, kIOServicePlane, &parent);
    IOObjectRelease(service);
    return kr == KERN_SUCCESS ? parent : 0;
}
}

std::unique_ptr<IntelI2CTransport> IntelI2CTransport::Create(CGDirectDisplayID displayId) {
    io_service_t svc = DisplayServiceResolver::ServicePortForDisplay(displayId);
    if (!svc) return nullptr;
    io_service_t fb = framebufferFor(svc);
    if (!fb) return nullptr;
    return std::make_unique<IntelI2CTransport>(fb);
}

IntelI2CTransport::IntelI2CTransport(io_service_t framebuffer, Sleeper sleeper)
    : DdcVolumeTransport(readPolicy(), writePolicy(), std::move(sleeper)), m_framebuffer(framebuffer) {
}

IntelI2CTransport::~IntelI2CTransport() {
    if (m_framebuffer) { IOObjectRelease(m_framebuffer); m_framebuffer = 0; }
}

bool IntelI2CTransport::send(IOI2CRequest& request) const {
    if (!m_framebuffer) return false;

    IOItemCount busCount = 0;
    if (IOFBGetI2CInterfaceCount(m_framebuffer, &busCount) != kIOReturnSuccess) return false;

    for (IOItemCount bus = 0; bus < busCount; ++bus) {
        io_service_t iface = 0;
        if (IOFBCopyI2CInterfaceForBus(m_framebuffer, bus, &iface) != kIOReturnSuccess) continue;

        IOI2CConnectRef connect = nullptr;
        bool ok = false;
        if (IOI2CInterfaceOpen(iface, kNilOptions, &connect) == kIOReturnSuccess && connect) {
            ok = IOI2CSendRequest(connect, kNilOptions, &request) == kIOReturnSuccess
                && request.result == kIOReturnSuccess;
            IOI2CInterfaceClose(connect, kNilOptions);
        }
        IOObjectRelease(iface);
        if (ok) return true;
    }
    return false;
}

bool IntelI2CTransport::exchangeGetVcp(uint8_t vcp, Ddc::Reply& reply, int attempt) {
    Ddc::GetVcpRequest data = Ddc::BuildGetVcpRequest(vcp);
    reply.fill(0);

    // prima il tipo DDC/CI, poi la transazione semplice
    const IOOptionBits replyType = attempt < kReadRetries
        ? kIOI2CDDCciReplyTransactionType
        : kIOI2CSimpleTransactionType;

    IOI2CRequest request;
    std::memset(&request, 0, sizeof(request));
    request.commFlags = 0;
    request.sendAddress = Ddc::kWriteAddress;
    request.sendTransactionType = kIOI2CSimpleTransactionType;
    request.sendBuffer = reinterpret_cast<vm_address_t>(data.data());
    request.sendBytes = static_cast<UInt32>(data.size());
    request.minReplyDelay = 10;
    request.replyAddress = Ddc::kReadAddress;
    request.replySubAddress = Ddc::kHostAddress;
    request.replyTransactionType = replyType;
    request.replyBuffer = reinterpret_cast<vm_address_t>(reply.data());
    request.replyBytes = static_cast<UInt32>(reply.size());

    return send(request);
}

bool IntelI2CTransport::sendSetVcp(uint8_t vcp, uint16_t value) {
    Ddc::SetVcpRequest data = Ddc::BuildSetVcpRequest(vcp, value);

    IOI2CRequest request;
    std::memset(&request, 0, sizeof(request));
    request.commFlags = 0;
    request.sendAddress = Ddc::kWriteAddress;
    request.sendTransactionType = kIOI2CSimpleTransactionType;
    request.sendBuffer = reinterpret_cast<vm_address_t>(data.data());
    request.sendBytes = static_cast<UInt32>(data.size());
    request.replyTransactionType = kIOI2CNoTransactionType;
    request.replyBytes = 0;

    return send(request);
}
