#pragma once
#include <v8-platform.h>

namespace codejail {
// codejail::Runnable serves the same role as v8::Task. Instances are queued by host threads and
// run on the thread which owns the isolate lock, so an alias avoids an adapter type.
using Runnable = v8::Task;
} // namespace codejail
