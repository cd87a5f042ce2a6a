#pragma once
#include <IOKit/IOKitLib.h>
#include <CoreGraphics/CoreGraphics.h>

// Risolve il servizio hardware (framebuffer / IODisplayConnect) di un display.
// Il chiamante possiede il riferimento ritornato (IOObjectRelease). 0 = non trovato.
namespace DisplayServiceResolver {

    io_service_t ServicePortForDisplay(CGDirectDisplayID displayId);

    // Solo matching per proprietà (vendor/product/serial/unit), senza simboli privati
    io_service_t ServicePortByDisplayProperties(CGDirectDisplayID displayId);

} // namespace DisplayServiceResolver
