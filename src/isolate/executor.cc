#include "executor.h"
#include "environment.h"

namespace codejail {

thread_local IsolateEnvironment* Executor::current_environment = nullptr;

/**
 * Scope ctor
 */
Executor::Scope::Scope(IsolateEnvironment& env) : last{current_environment} {
	current_environment = &env;
}

Executor::Scope::~Scope() {
	current_environment = last;
}

/**
 * Lock implementation
 */
Executor::Lock::Lock(IsolateEnvironment& env) :
	scope{env},
	locker{env.GetIsolate()},
	isolate_scope{env.GetIsolate()},
	handle_scope{env.GetIsolate()} {}

} // namespace codejail
