#pragma once
#include <cstdint>
#include <CoreFoundation/CoreFoundation.h>
#include <IOKit/IOKitLib.h>
#include <CoreGraphics/CoreGraphics.h>

// Simboli privati (IOAVService*, CGSServiceForDisplayNumber) risolti a runtime.
// Nessun call site li chiama direttamente: passano da questa tabella.
struct PrivateDisplayApi {
    using IOAVServiceCreateWithServiceFn = CFTypeRef(*)(CFAllocatorRef, io_service_t);
    using IOAVServiceReadI2CFn = IOReturn(*)(CFTypeRef, uint32_t chip, uint32_t offset, void* buf, uint32_t size);
    using IOAVServiceWriteI2CFn = IOReturn(*)(CFTypeRef, uint32_t chip, uint32_t dataAddress, void* buf, uint32_t size);
    using CGSServiceForDisplayNumberFn = void(*)(CGDirectDisplayID, io_service_t*);

    IOAVServiceCreateWithServiceFn avCreateWithService = nullptr;
    IOAVServiceReadI2CFn avReadI2C = nullptr;
    IOAVServiceWriteI2CFn avWriteI2C = nullptr;
    CGSServiceForDisplayNumberFn cgsServiceForDisplay = nullptr;

    // true se il percorso IOAVService è utilizzabile
    bool hasAVService() const { return avCreateWithService && avReadI2C && avWriteI2C; }
    bool hasCGSService() const { return cgsServiceForDisplay != nullptr; }

    // Simboli risolti una volta sola (thread-safe)
    static const PrivateDisplayApi& Get();

private:
    static PrivateDisplayApi Load();
};
