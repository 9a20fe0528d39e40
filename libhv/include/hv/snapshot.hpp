#pragma once

#include <stdint.h>
#include <map>
#include <optional>
#include <span>
#include <vector>

#include <hv/error.hpp>
#include <hv/irq.hpp>
#include <hv/memory.hpp>
#include <hv/registers.hpp>
#include <hv/types.hpp>

namespace hv {

struct Vm;
struct Vcpu;

// Backend-private state. Only the backend that wrote it interprets the bytes;
// everybody else only compares the tag.
struct OpaqueState {
	HypervisorKind backend = HypervisorKind::kvm;
	uint32_t version = 0;
	std::vector<uint8_t> data;

	bool operator== (const OpaqueState &) const = default;
};

// Fails with incompatibleSnapshot for another backend's state and with
// unsupportedVersion for another version of this backend's state.
Result<> checkOpaque(const OpaqueState &state, HypervisorKind backend, uint32_t version);

struct VmSnapshot {
	// Layout only; guest memory contents are saved by the caller.
	uint32_t vcpuCount = 0;
	uint64_t memorySize = 0;
	std::vector<SlotInfo> regions;
	std::vector<IrqRoute> routes;
	std::vector<Gsi> assertedLines;
	SlotId nextSlotId = 0;
	OpaqueState backendState;
};

struct VcpuSnapshot {
	VcpuId id = 0;
	GeneralRegs regs{};
	SpecialRegs sregs{};
	std::optional<FpuRegs> fpu;
	std::optional<DebugRegs> debugRegs;
	OpaqueState backendState;
};

constexpr uint32_t kSnapshotVersion = 1;

struct SnapshotBlob {
	uint32_t version = kSnapshotVersion;
	VmSnapshot vm;
	std::map<VcpuId, VcpuSnapshot> vcpus;
	// Keyed by the slot IDs recorded in vm.regions.
	std::map<SlotId, DirtyBitmap> dirtyLogs;
};

// Captures the VM, every vCPU and the pending dirty logs. No vCPU may be running.
// Dirty logs are read without losing them: they are still reported by the
// next Vm::getDirtyLog().
Result<SnapshotBlob> captureMachine(Vm &vm, std::span<Vcpu *const> vcpus);

// Restores onto a freshly created VM of the same topology. Everything is
// validated before the first piece of state is applied.
Result<> restoreMachine(Vm &vm, std::span<Vcpu *const> vcpus, const SnapshotBlob &blob);

Result<std::vector<uint8_t>> encodeSnapshot(const SnapshotBlob &blob);

Result<SnapshotBlob> decodeSnapshot(std::span<const uint8_t> bytes);

} // namespace hv
