#pragma once
#include <string>
#include "Core/VolumeTypes.hpp"

// Classifica il device di uscita dal nome (match case-insensitive per famiglie note).
// Senza match, un device Bluetooth diventa "cuffie" generiche.
DeviceCategory ClassifyOutputDevice(const std::string& deviceName, bool isBluetooth);

// Nome del simbolo icona per la categoria (nullptr per None)
const char* SymbolForCategory(DeviceCategory c);
