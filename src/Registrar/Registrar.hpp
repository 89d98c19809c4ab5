#pragma once

#include "Registrar/API/Core.hpp"

#include "Registrar/Registry/Discovery.hpp"
#include "Registrar/Registry/Module.hpp"
#include "Registrar/Registry/ModuleHandle.hpp"
#include "Registrar/Registry/ModuleRegistry.hpp"
#include "Registrar/Registry/Registration.hpp"
#include "Registrar/Registry/Security.hpp"

#include "Registrar/Journal/Archivist.hpp"
