#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>
#include <iostream>

#include "sim.hpp"

namespace hv::sim {

namespace {

constexpr bool logInterrupts = false;
constexpr bool logIoEvents = false;

} // anonymous namespace

SimVm::SimVm(const SimHypervisor *hypervisor, SimLimits limits, VmConfig config)
: hypervisor_{hypervisor}, limits_{limits}, config_{config},
		slots_{limits.maxSlots}, router_{IrqChipLayout{.maxRoutes = limits.maxRoutes}},
		vcpuCreated_(config.vcpuCount, false) { }

Result<> SimVm::initialize() {
	auto routes = defaultX86Routing(router_.layout());
	if(auto outcome = setIrqRouting(routes); !outcome)
		return outcome;

	if(config_.memorySize) {
		auto mapping = HostMapping::allocateAnonymous(config_.memorySize);
		if(!mapping)
			return std::unexpected{mapping.error()};
		MemoryRegion ram;
		ram.guestAddress = 0;
		ram.size = config_.memorySize;
		ram.mapping = std::move(*mapping);
		if(auto slot = addMemoryRegion(std::move(ram)); !slot)
			return std::unexpected{slot.error()};
	}
	return {};
}

bool SimVm::checkCapability(VmCap cap) const {
	return hypervisor_->checkCapability(cap);
}

Result<std::unique_ptr<Vcpu>> SimVm::createVcpu(VcpuId id) {
	std::lock_guard lock{vcpuMutex_};
	if(id >= config_.vcpuCount || vcpuCreated_[id])
		return makeError(ErrorKind::resourceExhausted, id, "createVcpu");
	vcpuCreated_[id] = true;

	auto vcpu = std::make_unique<SimVcpu>(this, id);
	vcpus_.emplace(id, vcpu.get());
	return vcpu;
}

void SimVm::detachVcpu(VcpuId id) {
	std::lock_guard lock{vcpuMutex_};
	vcpus_.erase(id);
}

// ----------------------------------------------------------------------------
// Memory.
// ----------------------------------------------------------------------------

Result<SlotId> SimVm::addMemoryRegion(MemoryRegion region) {
	std::unique_lock lock{topologyMutex_};
	if(auto outcome = slots_.checkInsert(region); !outcome)
		return std::unexpected{outcome.error()};
	// The software backend has no native slot numbers.
	return slots_.insert(std::move(region), 0);
}

Result<MemoryRegion> SimVm::removeMemoryRegion(SlotId slot) {
	std::unique_lock lock{topologyMutex_};
	auto removed = slots_.remove(slot);
	if(!removed)
		return std::unexpected{removed.error()};
	return std::move(removed->region);
}

std::vector<SlotInfo> SimVm::memoryRegions() const {
	std::shared_lock lock{topologyMutex_};
	return slots_.list();
}

Result<DirtyBitmap> SimVm::getDirtyLog(SlotId slot) {
	std::shared_lock lock{topologyMutex_};
	auto entry = slots_.find(slot);
	if(!entry)
		return makeError(ErrorKind::notFound, slot, "getDirtyLog");
	if(!entry->dirty)
		return makeError(ErrorKind::loggingDisabled, slot, "getDirtyLog");
	return entry->dirty->drain();
}

Result<> SimVm::mergeDirtyLog(SlotId slot, const DirtyBitmap &bitmap) {
	std::shared_lock lock{topologyMutex_};
	auto entry = slots_.find(slot);
	if(!entry)
		return makeError(ErrorKind::notFound, slot, "mergeDirtyLog");
	if(!entry->dirty)
		return makeError(ErrorKind::loggingDisabled, slot, "mergeDirtyLog");
	if(bitmap.pages() != entry->dirty->pages())
		return makeError(ErrorKind::illegalArgs, slot, "mergeDirtyLog");
	entry->dirty->merge(bitmap);
	return {};
}

Result<> SimVm::readMemory(GuestAddress address, std::span<uint8_t> buffer) {
	std::shared_lock lock{topologyMutex_};
	auto slot = slots_.findAddress(address);
	if(!slot)
		return makeError(ErrorKind::notFound, address, "readMemory");
	auto offset = address - slot->region.guestAddress;
	if(buffer.size() > slot->region.size - offset)
		return makeError(ErrorKind::notFound, address + buffer.size(), "readMemory");

	memcpy(buffer.data(), slot->region.mapping.bytes().data() + offset, buffer.size());
	return {};
}

Result<> SimVm::writeMemory(GuestAddress address, std::span<const uint8_t> data) {
	std::shared_lock lock{topologyMutex_};
	auto slot = slots_.findAddress(address);
	if(!slot || slot->region.readOnly)
		return makeError(ErrorKind::notFound, address, "writeMemory");
	auto offset = address - slot->region.guestAddress;
	if(data.size() > slot->region.size - offset)
		return makeError(ErrorKind::notFound, address + data.size(), "writeMemory");

	memcpy(slot->region.mapping.bytes().data() + offset, data.data(), data.size());
	if(slot->dirty)
		slot->dirty->markRange(offset, data.size());
	return {};
}

// ----------------------------------------------------------------------------
// Interrupts.
// ----------------------------------------------------------------------------

Result<> SimVm::setIrqRouting(std::span<const IrqRoute> routes) {
	std::unique_lock lock{topologyMutex_};
	auto table = router_.prepare(routes);
	if(!table)
		return std::unexpected{table.error()};
	router_.publish(std::move(*table));
	return {};
}

std::vector<IrqRoute> SimVm::irqRouting() const {
	std::shared_lock lock{topologyMutex_};
	return router_.current()->routes();
}

Result<> SimVm::injectIrq(Gsi gsi, bool level) {
	std::shared_lock lock{topologyMutex_};
	auto source = router_.current()->lookup(gsi);
	if(!source)
		return makeError(ErrorKind::invalidRoute, gsi, "injectIrq");
	if(logInterrupts)
		std::cout << "hv/sim: GSI " << gsi << " set to " << level << std::endl;

	if(router_.setLevel(gsi, level))
		deliver(*source);
	return {};
}

Result<> SimVm::signalMsi(uint64_t address, uint32_t data) {
	MsiMessage msi{address, data};
	if((address & 0xFFF0'0000) != 0xFEE0'0000)
		return makeError(ErrorKind::invalidRoute, address, "signalMsi");
	deliver(msi);
	return {};
}

void SimVm::deliver(const IrqSource &source) {
	if(auto pin = std::get_if<IrqchipPin>(&source)) {
		switch(pin->chip) {
		case IrqChip::picPrimary:
			deliverVector(0, picPrimaryBase + pin->pin);
			break;
		case IrqChip::picSecondary:
			deliverVector(0, picSecondaryBase + pin->pin);
			break;
		case IrqChip::ioapic:
			deliverVector(0, ioapicBase + pin->pin);
			break;
		}
	}else{
		auto &msi = std::get<MsiMessage>(source);
		deliverVector((msi.address >> 12) & 0xFF, msi.data & 0xFF);
	}
}

void SimVm::deliverVector(VcpuId target, uint8_t vector) {
	std::lock_guard lock{vcpuMutex_};
	auto it = vcpus_.find(target);
	if(it == vcpus_.end()) {
		if(logInterrupts)
			std::cout << "hv/sim: Dropping vector 0x" << std::hex << int(vector) << std::dec
					<< " for absent vCPU " << target << std::endl;
		return;
	}
	it->second->raise(vector);
}

// ----------------------------------------------------------------------------
// ioevents and irqfds.
// ----------------------------------------------------------------------------

Result<> SimVm::registerIoEvent(int eventFd, IoEventAddress address,
		std::optional<uint64_t> datamatch) {
	if(eventFd < 0)
		return makeError(ErrorKind::illegalArgs, address.address, "registerIoEvent");
	if(address.space == IoEventAddress::Space::pio && !address.length)
		return makeError(ErrorKind::illegalArgs, address.address, "registerIoEvent");

	std::unique_lock lock{topologyMutex_};
	for(auto &event : ioEvents_) {
		if(event.address == address && event.datamatch == datamatch)
			return makeError(ErrorKind::overlap, address.address, "registerIoEvent");
	}
	ioEvents_.push_back(IoEvent{eventFd, address, datamatch});
	return {};
}

Result<> SimVm::unregisterIoEvent(int eventFd, IoEventAddress address,
		std::optional<uint64_t> datamatch) {
	std::unique_lock lock{topologyMutex_};
	auto it = std::find_if(ioEvents_.begin(), ioEvents_.end(), [&] (const IoEvent &event) {
		return event.fd == eventFd && event.address == address
				&& event.datamatch == datamatch;
	});
	if(it == ioEvents_.end())
		return makeError(ErrorKind::notFound, address.address, "unregisterIoEvent");
	ioEvents_.erase(it);
	return {};
}

bool SimVm::signalIoEvent(IoEventAddress::Space space, uint64_t address,
		uint8_t size, uint64_t value) {
	std::shared_lock lock{topologyMutex_};
	for(auto &event : ioEvents_) {
		if(event.address.space != space || event.address.address != address)
			continue;
		if(event.address.length && event.address.length != size)
			continue;
		if(event.datamatch && *event.datamatch != value)
			continue;

		if(logIoEvents)
			std::cout << "hv/sim: ioevent at 0x" << std::hex << address << std::dec << std::endl;
		uint64_t one = 1;
		if(write(event.fd, &one, sizeof(one)) != sizeof(one))
			std::cout << "\e[31m" "hv/sim: Failed to signal ioevent: "
					<< strerror(errno) << "\e[39m" << std::endl;
		return true;
	}
	return false;
}

Result<> SimVm::registerIrqFd(Gsi gsi, int, int) {
	return makeError(ErrorKind::unsupported, gsi, "registerIrqFd");
}

Result<> SimVm::unregisterIrqFd(Gsi gsi, int) {
	return makeError(ErrorKind::unsupported, gsi, "unregisterIrqFd");
}

// ----------------------------------------------------------------------------
// Snapshot.
// ----------------------------------------------------------------------------

Result<VmSnapshot> SimVm::snapshot() {
	std::shared_lock lock{topologyMutex_};
	VmSnapshot snapshot;
	snapshot.vcpuCount = config_.vcpuCount;
	snapshot.memorySize = config_.memorySize;
	snapshot.regions = slots_.list();
	snapshot.routes = router_.current()->routes();
	snapshot.assertedLines = router_.assertedLines();
	snapshot.nextSlotId = slots_.nextId();
	snapshot.backendState.backend = HypervisorKind::sim;
	snapshot.backendState.version = vmStateVersion;
	return snapshot;
}

Result<> SimVm::checkRestore(const VmSnapshot &snapshot) const {
	std::shared_lock lock{topologyMutex_};
	return checkRestoreLocked(snapshot);
}

Result<> SimVm::checkRestoreLocked(const VmSnapshot &snapshot) const {
	if(auto outcome = checkOpaque(snapshot.backendState, HypervisorKind::sim, vmStateVersion);
			!outcome)
		return outcome;
	if(!snapshot.backendState.data.empty())
		return makeError(ErrorKind::incompatibleSnapshot, 0, "restore");

	if(snapshot.vcpuCount != config_.vcpuCount)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.vcpuCount, "restore");
	if(snapshot.memorySize != config_.memorySize)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.memorySize, "restore");

	// Slot IDs may differ; the layout may not.
	auto current = slots_.list();
	if(current.size() != snapshot.regions.size())
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.regions.size(), "restore");
	for(size_t i = 0; i < current.size(); ++i) {
		auto &ours = current[i];
		auto &theirs = snapshot.regions[i];
		if(ours.guestAddress != theirs.guestAddress || ours.size != theirs.size
				|| ours.readOnly != theirs.readOnly
				|| ours.dirtyLogEnabled != theirs.dirtyLogEnabled)
			return makeError(ErrorKind::incompatibleSnapshot, theirs.guestAddress, "restore");
	}

	if(auto table = router_.prepare(snapshot.routes); !table)
		return makeError(ErrorKind::incompatibleSnapshot, table.error().subject, "restore");
	return {};
}

Result<> SimVm::restore(const VmSnapshot &snapshot) {
	std::unique_lock lock{topologyMutex_};
	if(auto outcome = checkRestoreLocked(snapshot); !outcome)
		return outcome;

	auto table = router_.prepare(snapshot.routes);
	if(!table)
		return makeError(ErrorKind::incompatibleSnapshot, table.error().subject, "restore");
	router_.publish(std::move(*table));
	router_.restoreLevels(snapshot.assertedLines);
	slots_.advanceNextId(snapshot.nextSlotId);
	return {};
}

} // namespace hv::sim
