#include "Core/Display/PrivateDisplayApi.hpp"
#include "Core/Log.hpp"
#include <dlfcn.h>

template <typename Fn>
static Fn resolve(const char* symbol) {
    return reinterpret_cast<Fn>(dlsym(RTLD_DEFAULT, symbol));
}

PrivateDisplayApi PrivateDisplayApi::Load() {
    PrivateDisplayApi api;
    api.avCreateWithService = resolve<IOAVServiceCreateWithServiceFn>("IOAVServiceCreateWithService");
    api.avReadI2C = resolve<IOAVServiceReadI2CFn>("IOAVServiceReadI2C");
    api.avWriteI2C = resolve<IOAVServiceWriteI2CFn>("IOAVServiceWriteI2C");
    api.cgsServiceForDisplay = resolve<CGSServiceForDisplayNumberFn>("CGSServiceForDisplayNumber");

    LOGF("[DDC] simboli privati: IOAVService={} CGSServiceForDisplayNumber={}",
        api.hasAVService() ? "ok" : "assente",
        api.hasCGSService() ? "ok" : "assente");
    return api;
}

const PrivateDisplayApi& PrivateDisplayApi::Get() {
    static const PrivateDisplayApi api = Load();
    return api;
}
