#pragma once

// Umbrella header: document values, JSON Pointer, JSON Patch and the
// nlohmann::json conversion layer.

#include "value.h"
#include "error.h"
#include "pointer.h"
#include "operation.h"
#include "patch.h"
#include "json_interop.h"
#include "serialization.h"
