#pragma once
#include <string>

// Esecuzione sincrona di uno script di sistema (AppleScript su macOS)
class ScriptRunner {
public:
    virtual ~ScriptRunner() = default;

    // true se lo script termina con successo; output = stdout se richiesto
    virtual bool run(const std::string& script, std::string* output) = 0;
};

// /usr/bin/osascript -e <script>
class OsaScriptRunner : public ScriptRunner {
public:
    explicit OsaScriptRunner(std::string binary = "/usr/bin/osascript") : m_binary(std::move(binary)) {}

    bool run(const std::string& script, std::string* output) override;

private:
    std::string m_binary;
};
