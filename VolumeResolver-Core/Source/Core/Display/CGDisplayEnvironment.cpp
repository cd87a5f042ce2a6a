#include "Core/Display/CGDisplayEnvironment.hpp"

CGDisplayEnvironment::CGDisplayEnvironment() {
    CGDisplayRegisterReconfigurationCallback(&CGDisplayEnvironment::OnReconfigure, this);
}

CGDisplayEnvironment::~CGDisplayEnvironment() {
    CGDisplayRemoveReconfigurationCallback(&CGDisplayEnvironment::OnReconfigure, this);
}

bool CGDisplayEnvironment::isBuiltin(DisplayId id) const {
    return id != 0 && CGDisplayIsBuiltin(id) != 0;
}

std::optional<DisplayId> CGDisplayEnvironment::displayUnderPointer() const {
    CGEventRef ev = CGEventCreate(nullptr);
    if (!ev) return std::nullopt;
    const CGPoint p = CGEventGetLocation(ev);
    CFRelease(ev);

    CGDirectDisplayID id = 0;
    uint32_t count = 0;
    if (CGGetDisplaysWithPoint(p, 1, &id, &count) != kCGErrorSuccess || count == 0) return std::nullopt;
    return id;
}

std::vector<DisplayId> CGDisplayEnvironment::activeDisplays() const {
    uint32_t count = 0;
    if (CGGetActiveDisplayList(0, nullptr, &count) != kCGErrorSuccess || count == 0) return {};

    std::vector<CGDirectDisplayID> ids(count);
    if (CGGetActiveDisplayList(count, ids.data(), &count) != kCGErrorSuccess) return {};
    ids.resize(count);
    return std::vector<DisplayId>(ids.begin(), ids.end());
}

void CGDisplayEnvironment::setReconfigurationHandler(std::function<void()> handler) {
    std::lock_guard<std::mutex> lk(m_mx);
    m_handler = std::move(handler);
}

void CGDisplayEnvironment::OnReconfigure(CGDirectDisplayID, CGDisplayChangeSummaryFlags flags, void* self) {
    // una notifica "begin" precede ogni cambio: aspettiamo quella finale
    if (flags & kCGDisplayBeginConfigurationFlag) return;

    auto* env = static_cast<CGDisplayEnvironment*>(self);
    std::function<void()> h;
    {
        std::lock_guard<std::mutex> lk(env->m_mx);
        h = env->m_handler;
    }
    if (h) h();
}
