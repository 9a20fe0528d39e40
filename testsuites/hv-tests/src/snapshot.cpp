#include <assert.h>
#include <string>
#include <vector>

#include <hv/sim.hpp>
#include <hv/snapshot.hpp>

#include "testsuite.hpp"

namespace actions = hv::sim::actions;

namespace {

constexpr uint64_t ramSize = 0x10000;
constexpr hv::Gsi msiGsi = 40;

// A two-vCPU machine with one dirty-logged RAM slot.
struct snapshot_machine {
	sim_machine machine;
	hv::SlotId ram;
	std::vector<std::unique_ptr<hv::Vcpu>> vcpus;

	std::vector<hv::Vcpu *> vcpuPointers() {
		std::vector<hv::Vcpu *> result;
		for(auto &vcpu : vcpus)
			result.push_back(vcpu.get());
		return result;
	}
};

snapshot_machine make_snapshot_machine(uint32_t vcpuCount = 2,
		hv::GuestAddress ramAddress = 0) {
	snapshot_machine sm{make_sim_machine(vcpuCount), 0, {}};
	auto slot = sm.machine.vm->addMemoryRegion(make_region(ramAddress, ramSize, true));
	assert(slot);
	sm.ram = *slot;
	for(hv::VcpuId id = 0; id < vcpuCount; ++id) {
		auto vcpu = sm.machine.vm->createVcpu(id);
		assert(vcpu);
		sm.vcpus.push_back(std::move(*vcpu));
	}
	return sm;
}

// Brings the source machine into a state worth saving.
void dirty_machine(snapshot_machine &sm) {
	auto &vm = *sm.machine.vm;

	auto routes = hv::defaultX86Routing(hv::IrqChipLayout{});
	routes.push_back(hv::IrqRoute{msiGsi, hv::MsiMessage{0xFEE01000, 0x41}});
	assert(vm.setIrqRouting(routes));
	assert(vm.injectIrq(5, true));

	for(auto &vcpu : sm.vcpus) {
		auto regs = vcpu->getRegs();
		assert(regs);
		regs->rax = 0x1000 + vcpu->id();
		regs->rip = 0x7C00;
		assert(vcpu->setRegs(*regs));
	}

	int step = 0;
	assert(hv::sim::loadGuestProgram(*sm.vcpus[0],
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		if(step++ == 0)
			return actions::MmioWrite{2 * hv::kPageSize, 4, 0x11223344};
		return actions::Halt{};
	}));
	auto exit = sm.vcpus[0]->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
}

hv::SnapshotBlob capture(snapshot_machine &sm) {
	auto vcpus = sm.vcpuPointers();
	auto blob = hv::captureMachine(*sm.machine.vm, vcpus);
	assert(blob);
	return std::move(*blob);
}

std::vector<uint8_t> header(uint32_t version) {
	std::vector<uint8_t> bytes{'H', 'V', 'S', 'N', 'A', 'P', 0, 0};
	for(int i = 0; i < 4; ++i)
		bytes.push_back((version >> (i * 8)) & 0xFF);
	bytes.resize(16);
	return bytes;
}

// A container holding one section with an empty body.
std::vector<uint8_t> single_section(std::string name, uint32_t version) {
	std::vector<uint8_t> section{0x0A, static_cast<uint8_t>(name.size())};
	section.insert(section.end(), name.begin(), name.end());
	section.push_back(0x10);
	section.push_back(static_cast<uint8_t>(version));

	auto bytes = header(hv::kSnapshotVersion);
	bytes.push_back(0x0A);
	bytes.push_back(static_cast<uint8_t>(section.size()));
	bytes.insert(bytes.end(), section.begin(), section.end());
	return bytes;
}

} // anonymous namespace

DEFINE_TEST(snapshot_roundtrip, ([] {
	auto source = make_snapshot_machine();
	dirty_machine(source);

	auto blob = capture(source);
	auto bytes = hv::encodeSnapshot(blob);
	assert(bytes);
	auto decoded = hv::decodeSnapshot(*bytes);
	assert(decoded);

	auto target = make_snapshot_machine();
	auto vcpus = target.vcpuPointers();
	assert(hv::restoreMachine(*target.machine.vm, vcpus, *decoded));

	for(size_t i = 0; i < 2; ++i) {
		auto ours = source.vcpus[i]->getRegs();
		auto theirs = target.vcpus[i]->getRegs();
		assert(ours && theirs && *ours == *theirs);

		auto ourSregs = source.vcpus[i]->getSregs();
		auto theirSregs = target.vcpus[i]->getSregs();
		assert(ourSregs && theirSregs && *ourSregs == *theirSregs);

		auto ourFpu = source.vcpus[i]->getFpu();
		auto theirFpu = target.vcpus[i]->getFpu();
		assert(ourFpu && theirFpu && *ourFpu == *theirFpu);
	}
	assert(target.vcpus[0]->getRegs()->rax == 0x1000);

	assert(source.machine.vm->irqRouting() == target.machine.vm->irqRouting());
	auto vmState = target.machine.vm->snapshot();
	assert(vmState);
	assert(vmState->assertedLines == std::vector<hv::Gsi>{5});

	// Pages dirtied before the capture are reported by both machines.
	auto targetLog = target.machine.vm->getDirtyLog(target.ram);
	assert(targetLog && targetLog->test(2));
	auto sourceLog = source.machine.vm->getDirtyLog(source.ram);
	assert(sourceLog && sourceLog->test(2));
	assert(targetLog->covers(*sourceLog));
}))

DEFINE_TEST(snapshot_pending_interrupt_survives, ([] {
	auto source = make_snapshot_machine();
	dirty_machine(source);

	auto blob = capture(source);
	auto target = make_snapshot_machine();
	auto vcpus = target.vcpuPointers();
	assert(hv::restoreMachine(*target.machine.vm, vcpus, blob));

	// GSI 5 was raised on the source and is still pending on vCPU 0.
	assert(hv::sim::loadGuestProgram(*target.vcpus[0],
			[] (hv::sim::GuestContext &ctx) -> hv::sim::GuestAction {
		ctx.regs().rflags |= hv::kRflagsInterrupt;
		if(auto vector = ctx.acknowledgeInterrupt())
			return actions::PortOut{0x80, 1, *vector};
		return actions::Halt{};
	}));
	auto exit = target.vcpus[0]->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->data == std::vector<uint8_t>{0x35});
}))

DEFINE_TEST(snapshot_other_backend_rejected, ([] {
	auto source = make_snapshot_machine();
	dirty_machine(source);
	auto blob = capture(source);
	blob.vm.backendState.backend = hv::HypervisorKind::kvm;

	auto target = make_snapshot_machine();
	auto vcpus = target.vcpuPointers();
	assert_error(hv::restoreMachine(*target.machine.vm, vcpus, blob),
			hv::ErrorKind::incompatibleSnapshot);

	// Nothing was applied.
	auto regs = target.vcpus[0]->getRegs();
	assert(regs && regs->rip == 0xFFF0 && regs->rax == 0);
	assert(target.machine.vm->irqRouting() == hv::defaultX86Routing(hv::IrqChipLayout{}));
	auto log = target.machine.vm->getDirtyLog(target.ram);
	assert(log && !log->count());

	auto vcpuBlob = capture(source);
	vcpuBlob.vcpus.at(1).backendState.backend = hv::HypervisorKind::kvm;
	assert_error(hv::restoreMachine(*target.machine.vm, vcpus, vcpuBlob),
			hv::ErrorKind::incompatibleSnapshot);
}))

DEFINE_TEST(snapshot_version_rejected, ([] {
	auto source = make_snapshot_machine();
	auto target = make_snapshot_machine();
	auto vcpus = target.vcpuPointers();

	auto blob = capture(source);
	blob.vm.backendState.version = 99;
	assert_error(hv::restoreMachine(*target.machine.vm, vcpus, blob),
			hv::ErrorKind::unsupportedVersion);

	blob = capture(source);
	blob.vcpus.at(0).backendState.version = 99;
	assert_error(hv::restoreMachine(*target.machine.vm, vcpus, blob),
			hv::ErrorKind::unsupportedVersion);

	blob = capture(source);
	blob.version = 99;
	assert_error(hv::restoreMachine(*target.machine.vm, vcpus, blob),
			hv::ErrorKind::unsupportedVersion);
}))

DEFINE_TEST(snapshot_topology_mismatch, ([] {
	auto source = make_snapshot_machine();
	auto blob = capture(source);

	auto fewer = make_snapshot_machine(1);
	auto fewerVcpus = fewer.vcpuPointers();
	assert_error(hv::restoreMachine(*fewer.machine.vm, fewerVcpus, blob),
			hv::ErrorKind::incompatibleSnapshot);

	// Same vCPUs present, but the VM was created for more of them.
	snapshot_machine wider{make_sim_machine(4), 0, {}};
	assert(wider.machine.vm->addMemoryRegion(make_region(0, ramSize, true)));
	for(hv::VcpuId id = 0; id < 2; ++id) {
		auto vcpu = wider.machine.vm->createVcpu(id);
		assert(vcpu);
		wider.vcpus.push_back(std::move(*vcpu));
	}
	auto widerVcpus = wider.vcpuPointers();
	assert_error(hv::restoreMachine(*wider.machine.vm, widerVcpus, blob),
			hv::ErrorKind::incompatibleSnapshot);

	auto moved = make_snapshot_machine(2, 0x20000);
	auto movedVcpus = moved.vcpuPointers();
	assert_error(hv::restoreMachine(*moved.machine.vm, movedVcpus, blob),
			hv::ErrorKind::incompatibleSnapshot);
}))

DEFINE_TEST(snapshot_bytes_rejected, ([] {
	auto source = make_snapshot_machine();
	auto bytes = hv::encodeSnapshot(capture(source));
	assert(bytes);
	assert(hv::decodeSnapshot(*bytes));

	auto badMagic = *bytes;
	badMagic[0] = 'X';
	assert_error(hv::decodeSnapshot(badMagic), hv::ErrorKind::incompatibleSnapshot);

	auto badVersion = *bytes;
	badVersion[8] = 2;
	assert_error(hv::decodeSnapshot(badVersion), hv::ErrorKind::unsupportedVersion);

	std::vector<uint8_t> shortHeader(bytes->begin(), bytes->begin() + 10);
	assert_error(hv::decodeSnapshot(shortHeader), hv::ErrorKind::incompatibleSnapshot);

	std::vector<uint8_t> truncated(bytes->begin(), bytes->end() - 1);
	assert_error(hv::decodeSnapshot(truncated), hv::ErrorKind::incompatibleSnapshot);

	assert_error(hv::decodeSnapshot(std::vector<uint8_t>{}), hv::ErrorKind::incompatibleSnapshot);
}))

DEFINE_TEST(snapshot_unknown_section_rejected, ([] {
	// A container with a single section named "bogus".
	auto bytes = header(hv::kSnapshotVersion);
	std::vector<uint8_t> body{0x0A, 0x07, 0x0A, 0x05, 'b', 'o', 'g', 'u', 's'};
	bytes.insert(bytes.end(), body.begin(), body.end());
	assert_error(hv::decodeSnapshot(bytes), hv::ErrorKind::incompatibleSnapshot);

	// No sections at all: the vm section is missing.
	assert_error(hv::decodeSnapshot(header(hv::kSnapshotVersion)),
			hv::ErrorKind::incompatibleSnapshot);
}))

DEFINE_TEST(snapshot_section_version_rejected, ([] {
	assert_error(hv::decodeSnapshot(single_section("vm", 2)), hv::ErrorKind::unsupportedVersion);
	assert_error(hv::decodeSnapshot(single_section("vcpu/0", 2)),
			hv::ErrorKind::unsupportedVersion);
	assert_error(hv::decodeSnapshot(single_section("dirty-log/0", 2)),
			hv::ErrorKind::unsupportedVersion);

	assert_error(hv::decodeSnapshot(single_section("bogus", 2)),
			hv::ErrorKind::incompatibleSnapshot);
}))
