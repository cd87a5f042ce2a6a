#include "Core/Display/DisplayServiceResolver.hpp"
#include "Core/Display/PrivateDisplayApi.hpp"
#include "Core/Log.hpp"

#include <IOKit/graphics/IOGraphicsLib.h>
#include <regex>
#include <string>

namespace {

uint32_t readUInt32(CFDictionaryRef dict, CFStringRef key) {
    auto num = static_cast<CFNumberRef>(CFDictionaryGetValue(dict, key));
    if (!num || CFGetTypeID(num) != CFNumberGetTypeID()) return 0;
    uint32_t v = 0;
    CFNumberGetValue(num, kCFNumberSInt32Type, &v);
    return v;
}

std::string readString(CFDictionaryRef dict, CFStringRef key) {
    auto str = static_cast<CFStringRef>(CFDictionaryGetValue(dict, key));
    if (!str || CFGetTypeID(str) != CFStringGetTypeID()) return {};
    char buf[1024] = {};
    if (!CFStringGetCString(str, buf, sizeof(buf), kCFStringEncodingUTF8)) return {};
    return buf;
}

// "…/display0/AppleDisplay@2" -> 2 ; -1 se non presente
long locationUnit(const std::string& location) {
    static const std::regex re("@([0-9]+)[^@]+$");
    std::smatch m;
    if (!std::regex_search(location, m, re)) return -1;
    try { return std::stol(m[1].str()); }
    catch (const std::exception&) { return -1; }
}

bool matches(io_service_t service, uint32_t vendor, uint32_t product, uint32_t serial, uint32_t unit) {
    CFDictionaryRef dict = IODisplayCreateInfoDictionary(service, kIODisplayOnlyPreferredName);
    if (!dict) return false;

    bool ok = readUInt32(dict, CFSTR(kDisplayVendorID)) == vendor
        && readUInt32(dict, CFSTR(kDisplayProductID)) == product;

    if (ok) {
        // seriale confrontato solo se entrambi noti
        const uint32_t svcSerial = readUInt32(dict, CFSTR(kDisplaySerialNumber));
        if (serial != 0 && svcSerial != 0 && svcSerial != serial) ok = false;
    }

    if (ok) {
        const long u = locationUnit(readString(dict, CFSTR(kIODisplayLocationKey)));
        if (u >= 0 && static_cast<uint32_t>(u) != unit) ok = false;
    }

    CFRelease(dict);
    return ok;
}

} // namespace

namespace DisplayServiceResolver {

io_service_t ServicePortByDisplayProperties(CGDirectDisplayID displayId) {
    const uint32_t vendor = CGDisplayVendorNumber(displayId);
    const uint32_t product = CGDisplayModelNumber(displayId);
    const uint32_t serial = CGDisplaySerialNumber(displayId);
    const uint32_t unit = CGDisplayUnitNumber(displayId);

    io_iterator_t it = 0;
    if (IOServiceGetMatchingServices(MACH_PORT_NULL, IOServiceMatching("IODisplayConnect"), &it) != KERN_SUCCESS)
        return 0;

    io_service_t found = 0;
    while (io_service_t svc = IOIteratorNext(it)) {
        if (matches(svc, vendor, product, serial, unit)) { found = svc; break; }
        IOObjectRelease(svc);
    }
    IOObjectRelease(it);
    return found;
}

io_service_t ServicePortForDisplay(CGDirectDisplayID displayId) {
    if (displayId == 0) return 0;

    const auto& api = PrivateDisplayApi::Get();
    if (api.hasCGSService()) {
        io_service_t svc = 0;
        api.cgsServiceForDisplay(displayId, &svc);
        if (svc != 0) {
            IOObjectRetain(svc); // uniforma l'ownership con il percorso per proprietà
            return svc;
        }
    }

    io_service_t svc = ServicePortByDisplayProperties(displayId);
    if (!svc) LOGF("[DDC] nessun servizio hardware per il display {}", displayId);
    return svc;
}

} // namespace DisplayServiceResolver
