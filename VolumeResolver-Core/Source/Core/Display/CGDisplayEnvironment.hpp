#pragma once
#include <mutex>
#include <CoreGraphics/CoreGraphics.h>
#include "Core/Display/DisplayEnvironment.hpp"

// DisplayEnvironment su CoreGraphics
class CGDisplayEnvironment : public DisplayEnvironment {
public:
    CGDisplayEnvironment();
    ~CGDisplayEnvironment() override;

    CGDisplayEnvironment(const CGDisplayEnvironment&) = delete;
    CGDisplayEnvironment& operator=(const CGDisplayEnvironment&) = delete;

    bool isBuiltin(DisplayId id) const override;
    std::optional<DisplayId> displayUnderPointer() const override;
    std::vector<DisplayId> activeDisplays() const override;
    void setReconfigurationHandler(std::function<void()> handler) override;

private:
    static void OnReconfigure(CGDirectDisplayID display, CGDisplayChangeSummaryFlags flags, void* self);

    std::mutex m_mx;
    std::function<void()> m_handler;
};
