#include <assert.h>
#include <string.h>
#include <chrono>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

#include <hv/hypervisor.hpp>
#include <hv/snapshot.hpp>

#include "testsuite.hpp"

// These tests run real-mode code on /dev/kvm and are skipped where it
// cannot be opened. The in-kernel interrupt controller handles HLT, so the
// guest code ends in port I/O instead.

namespace {

constexpr hv::GuestAddress codeAddress = 0x7C00;
constexpr uint64_t ramSize = 0x10000;

struct kvm_machine {
	std::unique_ptr<hv::Hypervisor> hypervisor;
	std::unique_ptr<hv::Vm> vm;
	std::unique_ptr<hv::Vcpu> vcpu;
	hv::SlotId ram = 0;
};

std::optional<kvm_machine> make_kvm_machine(std::vector<uint8_t> code) {
	auto hypervisor = hv::openKvm();
	if(!hypervisor) {
		std::cout << "hv-tests: Skipping, KVM is unavailable: " << hypervisor.error()
				<< std::endl;
		return std::nullopt;
	}

	kvm_machine machine;
	machine.hypervisor = std::move(*hypervisor);

	hv::VmConfig config;
	config.kind = hv::HypervisorKind::kvm;
	auto vm = machine.hypervisor->createVm(config);
	assert(vm);
	machine.vm = std::move(*vm);

	// The host address stays the same when the region moves into the VM.
	auto region = make_region(0, ramSize, true);
	memcpy(region.mapping.bytes().data() + codeAddress, code.data(), code.size());
	auto slot = machine.vm->addMemoryRegion(std::move(region));
	assert(slot);
	machine.ram = *slot;

	auto vcpu = machine.vm->createVcpu(0);
	assert(vcpu);
	machine.vcpu = std::move(*vcpu);

	auto sregs = machine.vcpu->getSregs();
	assert(sregs);
	sregs->cs.base = 0;
	sregs->cs.selector = 0;
	assert(machine.vcpu->setSregs(*sregs));

	hv::GeneralRegs regs{};
	regs.rip = codeAddress;
	regs.rflags = hv::kRflagsReserved;
	assert(machine.vcpu->setRegs(regs));
	return machine;
}

} // anonymous namespace

DEFINE_TEST(kvm_port_out, ([] {
	// mov al, 0x42; out 0x80, al
	auto machine = make_kvm_machine({0xB0, 0x42, 0xE6, 0x80});
	if(!machine)
		return;

	auto exit = machine->vcpu->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x80 && out->size == 1);
	assert(out->data == std::vector<uint8_t>{0x42});
}))

DEFINE_TEST(kvm_port_in, ([] {
	// in al, 0x60; out 0x61, al
	auto machine = make_kvm_machine({0xE4, 0x60, 0xE6, 0x61});
	if(!machine)
		return;

	auto exit = machine->vcpu->run();
	assert(exit);
	auto in = std::get_if<hv::exits::IoIn>(&*exit);
	assert(in && in->port == 0x60 && in->size == 1);
	assert(machine->vcpu->completeRead(std::vector<uint8_t>{0x5A}));

	exit = machine->vcpu->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x61);
	assert(out->data == std::vector<uint8_t>{0x5A});
}))

DEFINE_TEST(kvm_dirty_log, ([] {
	// mov byte [0x2000], 1; out 0x80, al
	auto machine = make_kvm_machine({0xC6, 0x06, 0x00, 0x20, 0x01, 0xE6, 0x80});
	if(!machine)
		return;

	// Drops whatever was logged while the machine was set up.
	auto log = machine->vm->getDirtyLog(machine->ram);
	assert(log);

	auto exit = machine->vcpu->run();
	assert(exit && std::holds_alternative<hv::exits::IoOut>(*exit));

	log = machine->vm->getDirtyLog(machine->ram);
	assert(log);
	assert(log->test(2));
}))

DEFINE_TEST(kvm_immediate_exit, ([] {
	auto machine = make_kvm_machine({0xB0, 0x42, 0xE6, 0x80});
	if(!machine)
		return;

	machine->vcpu->setImmediateExit(true);
	auto exit = machine->vcpu->run();
	assert(exit && std::holds_alternative<hv::exits::ImmediateExit>(*exit));

	machine->vcpu->setImmediateExit(false);
	exit = machine->vcpu->run();
	assert(exit && std::holds_alternative<hv::exits::IoOut>(*exit));
}))

DEFINE_TEST(kvm_immediate_exit_kicks_running, ([] {
	// jmp $
	auto machine = make_kvm_machine({0xEB, 0xFE});
	if(!machine)
		return;
	auto &vcpu = *machine->vcpu;

	std::optional<hv::Result<hv::VcpuExit>> result;
	std::thread runner{[&] {
		result = vcpu.run();
	}};

	// Give the guest time to enter KVM_RUN and spin there.
	while(vcpu.state() != hv::RunState::running)
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	std::this_thread::sleep_for(std::chrono::milliseconds(20));

	vcpu.setImmediateExit(true);
	runner.join();
	assert(result && *result);
	assert(std::holds_alternative<hv::exits::ImmediateExit>(**result));
	assert(vcpu.state() == hv::RunState::exited);
}))

DEFINE_TEST(kvm_register_roundtrip, ([] {
	auto machine = make_kvm_machine({0xB0, 0x42, 0xE6, 0x80});
	if(!machine)
		return;

	hv::GeneralRegs regs{};
	regs.rax = 0xDEADBEEF;
	regs.rbx = 7;
	regs.rip = codeAddress;
	regs.rflags = hv::kRflagsReserved;
	assert(machine->vcpu->setRegs(regs));
	assert(*machine->vcpu->getRegs() == regs);

	auto fpu = machine->vcpu->getFpu();
	assert(fpu);
	fpu->xmm[0][0] = 0x5A;
	assert(machine->vcpu->setFpu(*fpu));
	assert(machine->vcpu->getFpu()->xmm[0][0] == 0x5A);

	if(!machine->vm->checkCapability(hv::VmCap::debugRegisters))
		assert_error(machine->vcpu->getDebugRegs(), hv::ErrorKind::unsupported);
}))

DEFINE_TEST(kvm_irq_line_levels, ([] {
	auto machine = make_kvm_machine({0xB0, 0x42, 0xE6, 0x80});
	if(!machine)
		return;
	auto &vm = *machine->vm;

	// Only lines the kernel accepted are recorded.
	assert_error(vm.injectIrq(4000, true), hv::ErrorKind::invalidRoute);
	assert(vm.injectIrq(4, true));
	auto snapshot = vm.snapshot();
	assert(snapshot);
	assert(snapshot->assertedLines == std::vector<hv::Gsi>{4});
	assert(snapshot->vcpuCount == 1);

	assert(vm.injectIrq(4, false));
	snapshot = vm.snapshot();
	assert(snapshot && snapshot->assertedLines.empty());
}))

DEFINE_TEST(kvm_snapshot_roundtrip, ([] {
	std::vector<uint8_t> code{0xB0, 0x42, 0xE6, 0x80};
	auto source = make_kvm_machine(code);
	if(!source)
		return;

	auto exit = source->vcpu->run();
	assert(exit && std::holds_alternative<hv::exits::IoOut>(*exit));

	hv::Vcpu *sourceVcpus[] = {source->vcpu.get()};
	auto blob = hv::captureMachine(*source->vm, sourceVcpus);
	assert(blob);
	auto bytes = hv::encodeSnapshot(*blob);
	assert(bytes);
	auto decoded = hv::decodeSnapshot(*bytes);
	assert(decoded);

	auto target = make_kvm_machine(code);
	assert(target);
	hv::Vcpu *targetVcpus[] = {target->vcpu.get()};
	assert(hv::restoreMachine(*target->vm, targetVcpus, *decoded));

	auto ours = source->vcpu->getRegs();
	auto theirs = target->vcpu->getRegs();
	assert(ours && theirs && *ours == *theirs);
	assert(source->vm->irqRouting() == target->vm->irqRouting());
}))
