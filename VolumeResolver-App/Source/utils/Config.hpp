#pragma once
#include <string>
#include "Core/VolumeTypes.hpp"

// Endpoint REST locale
struct ApiConfig {
    std::string host = "127.0.0.1";
    int  port = 8766;
    bool cors = true;
};

struct AppConfig {
    // quale target controllano le operazioni di volume
    TargetMode target = TargetMode::Builtin;

    ApiConfig api;
};
