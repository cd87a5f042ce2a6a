#pragma once
#include <string>
#include <vector>

namespace ProcUtils {
    // Avvia un eseguibile (path assoluto) e attende la fine.
    // Se out != nullptr raccoglie lo stdout. true se exit code == 0.
    bool RunProcessCapture(const std::string& path, const std::vector<std::string>& args, std::string* out);

    // "  42\n" -> "42"
    std::string Trim(const std::string& s);
}
