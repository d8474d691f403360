#pragma once
// Public interface of the codejail library

#include "external_copy/value.h"
#include "isolate/generic/error.h"
#include "lib/logging.h"
#include "module/agent_text.h"
#include "module/capability_handle.h"
#include "module/sandbox_options.h"
#include "module/sandbox_result.h"
#include "module/sandbox_service.h"

#define CODEJAIL_VERSION_MAJOR 1
#define CODEJAIL_VERSION_MINOR 0
#define CODEJAIL_VERSION_PATCH 0
