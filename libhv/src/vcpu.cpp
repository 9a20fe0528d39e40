#include <iostream>

#include <hv/vcpu.hpp>

namespace hv {

namespace {

constexpr bool logRunState = false;

Result<> rejectRun(VcpuId id, RunState state) {
	if(logRunState)
		std::cout << "hv: vCPU " << id << " cannot run while " << runStateName(state)
				<< std::endl;
	return makeError(ErrorKind::illegalState, id, "run");
}

} // anonymous namespace

const char *runStateName(RunState state) {
	switch(state) {
	case RunState::created: return "created";
	case RunState::runnable: return "runnable";
	case RunState::running: return "running";
	case RunState::exited: return "exited";
	case RunState::stopped: return "stopped";
	}
	return "unknown";
}

void RunStateTracker::markRunnable() {
	auto expected = RunState::created;
	state_.compare_exchange_strong(expected, RunState::runnable, std::memory_order_acq_rel);
}

Result<> RunStateTracker::enterRun() {
	auto current = state_.load(std::memory_order_acquire);
	if(stopRequested() && current != RunState::running) {
		state_.store(RunState::stopped, std::memory_order_release);
		return rejectRun(id_, RunState::stopped);
	}
	while(true) {
		if(current == RunState::running || current == RunState::stopped)
			return rejectRun(id_, current);
		if(state_.compare_exchange_weak(current, RunState::running, std::memory_order_acq_rel))
			return {};
	}
}

RunState RunStateTracker::leaveRun(bool exited) {
	RunState next;
	if(stopRequested())
		next = RunState::stopped;
	else if(exited)
		next = RunState::exited;
	else
		next = RunState::runnable;
	state_.store(next, std::memory_order_release);
	return next;
}

Result<> RunStateTracker::checkNotRunning(const char *operation) const {
	if(load() == RunState::running)
		return makeError(ErrorKind::illegalState, id_, operation);
	return {};
}

} // namespace hv
