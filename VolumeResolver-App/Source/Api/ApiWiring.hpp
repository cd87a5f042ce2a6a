#pragma once
#include "Api/ApiServer.hpp"

class MainApp;

namespace ApiWiring {
    // Collega le route REST alle operazioni dell'app
    ApiServer::Callbacks MakeCallbacks(MainApp& app);
}
