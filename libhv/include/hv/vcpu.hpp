#pragma once

#include <stdint.h>
#include <atomic>
#include <span>

#include <hv/error.hpp>
#include <hv/exit.hpp>
#include <hv/registers.hpp>
#include <hv/snapshot.hpp>
#include <hv/types.hpp>

namespace hv {

enum class RunState {
	created,
	runnable,
	running,
	exited,
	stopped
};

const char *runStateName(RunState state);

// One virtual CPU. Created by Vm::createVcpu() and destroyed before its VM.
//
// A Vcpu is driven by one execution context at a time; the library only
// rejects a run() that overlaps another run(). setImmediateExit() and
// requestStop() are the exceptions: they may be called from any context.
struct Vcpu {
	virtual ~Vcpu() = default;

	virtual VcpuId id() const = 0;

	virtual RunState state() const = 0;

	// Enters the guest and blocks until it exits. The returned reason must be
	// handled by the caller before the next run(); there is no auto-resume.
	virtual Result<VcpuExit> run() = 0;

	// Supplies the data of a pending IoIn or MmioRead exit.
	virtual Result<> completeRead(std::span<const uint8_t> data) = 0;

	virtual Result<GeneralRegs> getRegs() = 0;
	virtual Result<> setRegs(const GeneralRegs &regs) = 0;

	virtual Result<SpecialRegs> getSregs() = 0;
	virtual Result<> setSregs(const SpecialRegs &sregs) = 0;

	virtual Result<FpuRegs> getFpu() = 0;
	virtual Result<> setFpu(const FpuRegs &fpu) = 0;

	virtual Result<DebugRegs> getDebugRegs() = 0;
	virtual Result<> setDebugRegs(const DebugRegs &regs) = 0;

	// Makes the next run() exit with InterruptWindowOpen as soon as the
	// guest can accept an interrupt.
	virtual Result<> requestInterruptWindow() = 0;

	virtual bool readyForInterrupt() = 0;

	virtual Result<> injectNmi() = 0;

	// While set, the in-progress or next run() returns ImmediateExit promptly.
	// The flag stays set until it is cleared.
	virtual void setImmediateExit(bool exit) = 0;

	// Cancels the in-progress run() and moves the vCPU to RunState::stopped.
	virtual void requestStop() = 0;

	// Enables single-step and breakpoint exits.
	virtual Result<> debugAttach() = 0;
	virtual Result<> debugDetach() = 0;

	virtual Result<VcpuSnapshot> snapshot() = 0;
	virtual Result<> checkRestore(const VcpuSnapshot &snapshot) const = 0;
	virtual Result<> restore(const VcpuSnapshot &snapshot) = 0;
};

// Implements the run state machine for backends:
// created -> runnable <-> running -> exited, running -> stopped.
struct RunStateTracker {
	explicit RunStateTracker(VcpuId id)
	: id_{id} { }

	RunState load() const {
		return state_.load(std::memory_order_acquire);
	}

	void markRunnable();

	// Fails with illegalState if the vCPU is running or stopped.
	Result<> enterRun();

	// Leaves the running state after an exit (or a failed native call).
	// Returns the new state.
	RunState leaveRun(bool exited);

	// Fails with illegalState while the vCPU is running.
	Result<> checkNotRunning(const char *operation) const;

	void requestStop() {
		stopRequested_.store(true, std::memory_order_release);
	}

	bool stopRequested() const {
		return stopRequested_.load(std::memory_order_acquire);
	}

private:
	VcpuId id_;
	std::atomic<RunState> state_{RunState::created};
	std::atomic<bool> stopRequested_{false};
};

} // namespace hv
