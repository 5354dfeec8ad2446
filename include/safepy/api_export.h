#pragma once

// This header includes the CMake-generated export header
// and provides the SAFEPY_API macro

#include "safepy/safepy_export.h"

#ifndef SAFEPY_API
    #define SAFEPY_API SAFEPY_EXPORT
#endif
