#include "Core/Audio/ScriptRunner.hpp"
#include "Core/System/ProcessUtils.hpp"
#include "Core/Log.hpp"

bool OsaScriptRunner::run(const std::string& script, std::string* output) {
    // AppleScript multi-riga: un -e per riga
    std::vector<std::string> args;
    size_t start = 0;
    while (start <= script.size()) {
        size_t nl = script.find('\n', start);
        if (nl == std::string::npos) nl = script.size();
        if (nl > start) {
            args.push_back("-e");
            args.push_back(script.substr(start, nl - start));
        }
        start = nl + 1;
    }
    if (args.empty()) return false;

    if (!ProcUtils::RunProcessCapture(m_binary, args, output)) {
        LOGF("[OSA] script fallito: {}", script);
        return false;
    }
    return true;
}
