#pragma once

#include <stdint.h>
#include <atomic>
#include <bitset>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include <hv/hypervisor.hpp>
#include <hv/irq.hpp>
#include <hv/memory.hpp>
#include <hv/sim.hpp>
#include <hv/vcpu.hpp>
#include <hv/vm.hpp>

namespace hv::sim {

// Native exit codes of the software backend. Guest programs can produce
// them directly through actions::RawExit.
enum NativeExit : uint32_t {
	nativeExitIo = 1,
	nativeExitMmio = 2,
	nativeExitHlt = 3,
	nativeExitShutdown = 4,
	nativeExitIrqWindowOpen = 5,
	nativeExitDebug = 6,
	nativeExitIntr = 7,
	nativeExitFailEntry = 8,
	nativeExitInternalError = 9,
	nativeExitSystemEvent = 10
};

// Decodes the native codes that carry no payload.
VcpuExit decodeNativeExit(uint32_t code);

// Vectors of the software interrupt controllers.
constexpr uint8_t picPrimaryBase = 0x20;
constexpr uint8_t picSecondaryBase = 0x28;
constexpr uint8_t ioapicBase = 0x30;
constexpr uint8_t nmiVector = 2;

constexpr uint32_t vmStateVersion = 1;
constexpr uint32_t vcpuStateVersion = 1;

struct SimVcpu;

struct SimHypervisor final : Hypervisor {
	explicit SimHypervisor(SimLimits limits);

	HypervisorKind kind() const override { return HypervisorKind::sim; }

	uint32_t maxVcpus() const override { return limits_.maxVcpus; }

	uint32_t maxMemorySlots() const override { return limits_.maxSlots; }

	bool checkCapability(VmCap cap) const override;

	Result<std::unique_ptr<Vm>> createVm(const VmConfig &config) override;

private:
	SimLimits limits_;
};

struct SimVm final : Vm {
	SimVm(const SimHypervisor *hypervisor, SimLimits limits, VmConfig config);

	Result<> initialize();

	HypervisorKind kind() const override { return HypervisorKind::sim; }

	const VmConfig &config() const override { return config_; }

	bool checkCapability(VmCap cap) const override;

	Result<std::unique_ptr<Vcpu>> createVcpu(VcpuId id) override;

	Result<SlotId> addMemoryRegion(MemoryRegion region) override;
	Result<MemoryRegion> removeMemoryRegion(SlotId slot) override;
	std::vector<SlotInfo> memoryRegions() const override;

	Result<DirtyBitmap> getDirtyLog(SlotId slot) override;
	Result<> mergeDirtyLog(SlotId slot, const DirtyBitmap &bitmap) override;

	Result<> setIrqRouting(std::span<const IrqRoute> routes) override;
	std::vector<IrqRoute> irqRouting() const override;

	Result<> injectIrq(Gsi gsi, bool level) override;
	Result<> signalMsi(uint64_t address, uint32_t data) override;

	Result<> registerIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) override;
	Result<> unregisterIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) override;

	Result<> registerIrqFd(Gsi gsi, int eventFd, int resampleFd) override;
	Result<> unregisterIrqFd(Gsi gsi, int eventFd) override;

	Result<VmSnapshot> snapshot() override;
	Result<> checkRestore(const VmSnapshot &snapshot) const override;
	Result<> restore(const VmSnapshot &snapshot) override;

	// Called by vCPUs.

	Result<> readMemory(GuestAddress address, std::span<uint8_t> buffer);
	Result<> writeMemory(GuestAddress address, std::span<const uint8_t> data);

	// Returns true if a registered ioevent consumed the write.
	bool signalIoEvent(IoEventAddress::Space space, uint64_t address,
			uint8_t size, uint64_t value);

	void detachVcpu(VcpuId id);

private:
	Result<> checkRestoreLocked(const VmSnapshot &snapshot) const;

	// Delivers a routed interrupt. Caller holds the topology lock (shared).
	void deliver(const IrqSource &source);

	void deliverVector(VcpuId target, uint8_t vector);

	struct IoEvent {
		int fd;
		IoEventAddress address;
		std::optional<uint64_t> datamatch;
	};

	const SimHypervisor *hypervisor_;
	SimLimits limits_;
	VmConfig config_;

	// Guards slots_, the routing table pointer of router_ and ioEvents_.
	mutable std::shared_mutex topologyMutex_;
	SlotTable slots_;
	IrqRouter router_;
	std::vector<IoEvent> ioEvents_;

	std::mutex vcpuMutex_;
	std::vector<bool> vcpuCreated_;
	std::map<VcpuId, SimVcpu *> vcpus_;
};

struct SimVcpu final : Vcpu, GuestContext {
	SimVcpu(SimVm *vm, VcpuId id);

	~SimVcpu() override;

	void loadProgram(GuestProgram program);

	// Latches a vector and wakes a vCPU that idles in WaitForInterrupt.
	void raise(uint8_t vector);

	// Vcpu.

	VcpuId id() const override { return id_; }

	RunState state() const override { return tracker_.load(); }

	Result<VcpuExit> run() override;

	Result<> completeRead(std::span<const uint8_t> data) override;

	Result<GeneralRegs> getRegs() override;
	Result<> setRegs(const GeneralRegs &regs) override;

	Result<SpecialRegs> getSregs() override;
	Result<> setSregs(const SpecialRegs &sregs) override;

	Result<FpuRegs> getFpu() override;
	Result<> setFpu(const FpuRegs &fpu) override;

	Result<DebugRegs> getDebugRegs() override;
	Result<> setDebugRegs(const DebugRegs &regs) override;

	Result<> requestInterruptWindow() override;

	bool readyForInterrupt() override;

	Result<> injectNmi() override;

	void setImmediateExit(bool exit) override;

	void requestStop() override;

	Result<> debugAttach() override;
	Result<> debugDetach() override;

	Result<VcpuSnapshot> snapshot() override;
	Result<> checkRestore(const VcpuSnapshot &snapshot) const override;
	Result<> restore(const VcpuSnapshot &snapshot) override;

	// GuestContext.

	GeneralRegs &regs() override { return regs_; }
	SpecialRegs &sregs() override { return sregs_; }

	Result<> readMemory(GuestAddress address, std::span<uint8_t> buffer) override;
	Result<> writeMemory(GuestAddress address, std::span<const uint8_t> data) override;

	std::optional<uint8_t> acknowledgeInterrupt() override;

	std::span<const uint8_t> readResult() const override { return readResult_; }

private:
	enum class PendingRead {
		none,
		port,
		mmio
	};

	// Executes guest steps until one of them exits.
	VcpuExit step();

	// Blocks until an interrupt is latched or immediate exit is set.
	// Returns false in the latter case.
	bool waitForInterrupt();

	bool interruptsEnabled() const {
		return regs_.rflags & kRflagsInterrupt;
	}

	exits::Debug debugExit(uint32_t exception) const;

	SimVm *vm_;
	VcpuId id_;
	RunStateTracker tracker_;
	GuestProgram program_;

	GeneralRegs regs_{};
	SpecialRegs sregs_;
	FpuRegs fpu_{};

	bool windowRequested_ = false;
	bool debugging_ = false;
	bool halted_ = false;

	PendingRead pendingRead_ = PendingRead::none;
	uint8_t pendingSize_ = 0;
	std::vector<uint8_t> readResult_;

	std::atomic<bool> immediateExit_{false};

	// Protects the latched interrupts; vCPU threads of other vCPUs and device
	// threads raise interrupts concurrently.
	std::mutex irqMutex_;
	std::condition_variable wake_;
	std::bitset<256> pending_;
	bool nmiPending_ = false;
};

} // namespace hv::sim
