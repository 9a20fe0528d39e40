#include <string.h>
#include <algorithm>
#include <charconv>
#include <iostream>
#include <set>
#include <string>
#include <string_view>

#include <hv/snapshot.hpp>
#include <hv/vcpu.hpp>
#include <hv/vm.hpp>

#include "hv/snapshot.pb.h"

namespace hv {

namespace {

constexpr bool logSnapshots = false;

constexpr char snapshotMagic[8] = {'H', 'V', 'S', 'N', 'A', 'P', 0, 0};
constexpr size_t headerSize = 16;

constexpr uint32_t vmSectionVersion = 1;
constexpr uint32_t vcpuSectionVersion = 1;
constexpr uint32_t dirtyLogSectionVersion = 1;

std::unexpected<Error> rejectSnapshot(ErrorKind kind, uint64_t subject, const char *what) {
	std::cout << "\e[31m" "hv: Rejecting snapshot: " << what
			<< " (" << subject << ")" "\e[39m" << std::endl;
	return makeError(kind, subject, "decodeSnapshot");
}

void putLe32(uint8_t *p, uint32_t v) {
	for(int i = 0; i < 4; ++i)
		p[i] = (v >> (i * 8)) & 0xFF;
}

uint32_t getLe32(const uint8_t *p) {
	uint32_t v = 0;
	for(int i = 0; i < 4; ++i)
		v |= uint32_t{p[i]} << (i * 8);
	return v;
}

// Parses the numeric suffix of "vcpu/<id>" style section names.
bool parseIndex(std::string_view name, std::string_view prefix, uint32_t &index) {
	if(!name.starts_with(prefix))
		return false;
	auto digits = name.substr(prefix.size());
	if(digits.empty())
		return false;
	auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
	return ec == std::errc{} && ptr == digits.data() + digits.size();
}

// ----------------------------------------------------------------------------
// Conversion to the wire messages.
// ----------------------------------------------------------------------------

void toProto(const OpaqueState &state, proto::OpaqueState *msg) {
	msg->set_backend(static_cast<uint32_t>(state.backend));
	msg->set_version(state.version);
	msg->set_data(state.data.data(), state.data.size());
}

void toProto(const SegmentRegister &seg, proto::Segment *msg) {
	msg->set_base(seg.base);
	msg->set_limit(seg.limit);
	msg->set_selector(seg.selector);
	msg->set_type(seg.type);
	msg->set_present(seg.present);
	msg->set_dpl(seg.dpl);
	msg->set_db(seg.db);
	msg->set_s(seg.s);
	msg->set_l(seg.l);
	msg->set_g(seg.g);
	msg->set_avl(seg.avl);
	msg->set_unusable(seg.unusable);
}

void toProto(const DescriptorTable &table, proto::DescriptorTable *msg) {
	msg->set_base(table.base);
	msg->set_limit(table.limit);
}

void toProto(const GeneralRegs &regs, proto::GeneralRegs *msg) {
	msg->set_rax(regs.rax);
	msg->set_rbx(regs.rbx);
	msg->set_rcx(regs.rcx);
	msg->set_rdx(regs.rdx);
	msg->set_rsi(regs.rsi);
	msg->set_rdi(regs.rdi);
	msg->set_rbp(regs.rbp);
	msg->set_r8(regs.r8);
	msg->set_r9(regs.r9);
	msg->set_r10(regs.r10);
	msg->set_r11(regs.r11);
	msg->set_r12(regs.r12);
	msg->set_r13(regs.r13);
	msg->set_r14(regs.r14);
	msg->set_r15(regs.r15);
	msg->set_rsp(regs.rsp);
	msg->set_rip(regs.rip);
	msg->set_rflags(regs.rflags);
}

void toProto(const SpecialRegs &sregs, proto::SpecialRegs *msg) {
	toProto(sregs.cs, msg->mutable_cs());
	toProto(sregs.ds, msg->mutable_ds());
	toProto(sregs.es, msg->mutable_es());
	toProto(sregs.fs, msg->mutable_fs());
	toProto(sregs.gs, msg->mutable_gs());
	toProto(sregs.ss, msg->mutable_ss());
	toProto(sregs.tr, msg->mutable_tr());
	toProto(sregs.ldt, msg->mutable_ldt());
	toProto(sregs.gdt, msg->mutable_gdt());
	toProto(sregs.idt, msg->mutable_idt());
	msg->set_cr0(sregs.cr0);
	msg->set_cr2(sregs.cr2);
	msg->set_cr3(sregs.cr3);
	msg->set_cr4(sregs.cr4);
	msg->set_cr8(sregs.cr8);
	msg->set_efer(sregs.efer);
	msg->set_apic_base(sregs.apicBase);
	for(auto word : sregs.interruptBitmap)
		msg->add_interrupt_bitmap(word);
}

void toProto(const FpuRegs &fpu, proto::FpuRegs *msg) {
	msg->set_fpr(fpu.fpr.data(), sizeof(fpu.fpr));
	msg->set_fcw(fpu.fcw);
	msg->set_fsw(fpu.fsw);
	msg->set_ftwx(fpu.ftwx);
	msg->set_last_opcode(fpu.lastOpcode);
	msg->set_last_ip(fpu.lastIp);
	msg->set_last_dp(fpu.lastDp);
	msg->set_xmm(fpu.xmm.data(), sizeof(fpu.xmm));
	msg->set_mxcsr(fpu.mxcsr);
}

void toProto(const DebugRegs &regs, proto::DebugRegs *msg) {
	for(auto db : regs.db)
		msg->add_db(db);
	msg->set_dr6(regs.dr6);
	msg->set_dr7(regs.dr7);
}

void toProto(const VmSnapshot &vm, proto::VmState *msg) {
	msg->set_vcpu_count(vm.vcpuCount);
	msg->set_memory_size(vm.memorySize);
	for(auto &info : vm.regions) {
		auto region = msg->add_regions();
		region->set_id(info.id);
		region->set_guest_address(info.guestAddress);
		region->set_size(info.size);
		region->set_read_only(info.readOnly);
		region->set_dirty_log(info.dirtyLogEnabled);
	}
	for(auto &route : vm.routes) {
		auto entry = msg->add_routes();
		entry->set_gsi(route.gsi);
		if(auto pin = std::get_if<IrqchipPin>(&route.source)) {
			entry->mutable_pin()->set_chip(static_cast<uint32_t>(pin->chip));
			entry->mutable_pin()->set_pin(pin->pin);
		}else{
			auto &msi = std::get<MsiMessage>(route.source);
			entry->mutable_msi()->set_address(msi.address);
			entry->mutable_msi()->set_data(msi.data);
		}
	}
	for(auto gsi : vm.assertedLines)
		msg->add_asserted_lines(gsi);
	msg->set_next_slot_id(vm.nextSlotId);
	toProto(vm.backendState, msg->mutable_backend_state());
}

void toProto(const VcpuSnapshot &vcpu, proto::VcpuState *msg) {
	msg->set_id(vcpu.id);
	toProto(vcpu.regs, msg->mutable_regs());
	toProto(vcpu.sregs, msg->mutable_sregs());
	if(vcpu.fpu)
		toProto(*vcpu.fpu, msg->mutable_fpu());
	if(vcpu.debugRegs)
		toProto(*vcpu.debugRegs, msg->mutable_debug_regs());
	toProto(vcpu.backendState, msg->mutable_backend_state());
}

// ----------------------------------------------------------------------------
// Conversion from the wire messages.
// Malformed messages are rejected as incompatible; the subject is the section index.
// ----------------------------------------------------------------------------

Result<> fromProto(const proto::OpaqueState &msg, OpaqueState &state, uint64_t section) {
	auto backend = static_cast<HypervisorKind>(msg.backend());
	if(backend != HypervisorKind::kvm && backend != HypervisorKind::sim)
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "unknown backend");
	state.backend = backend;
	state.version = msg.version();
	state.data.assign(msg.data().begin(), msg.data().end());
	return {};
}

void fromProto(const proto::Segment &msg, SegmentRegister &seg) {
	seg.base = msg.base();
	seg.limit = msg.limit();
	seg.selector = msg.selector();
	seg.type = msg.type();
	seg.present = msg.present();
	seg.dpl = msg.dpl();
	seg.db = msg.db();
	seg.s = msg.s();
	seg.l = msg.l();
	seg.g = msg.g();
	seg.avl = msg.avl();
	seg.unusable = msg.unusable();
}

void fromProto(const proto::DescriptorTable &msg, DescriptorTable &table) {
	table.base = msg.base();
	table.limit = msg.limit();
}

void fromProto(const proto::GeneralRegs &msg, GeneralRegs &regs) {
	regs.rax = msg.rax();
	regs.rbx = msg.rbx();
	regs.rcx = msg.rcx();
	regs.rdx = msg.rdx();
	regs.rsi = msg.rsi();
	regs.rdi = msg.rdi();
	regs.rbp = msg.rbp();
	regs.r8 = msg.r8();
	regs.r9 = msg.r9();
	regs.r10 = msg.r10();
	regs.r11 = msg.r11();
	regs.r12 = msg.r12();
	regs.r13 = msg.r13();
	regs.r14 = msg.r14();
	regs.r15 = msg.r15();
	regs.rsp = msg.rsp();
	regs.rip = msg.rip();
	regs.rflags = msg.rflags();
}

Result<> fromProto(const proto::SpecialRegs &msg, SpecialRegs &sregs, uint64_t section) {
	if(msg.interrupt_bitmap_size() != static_cast<int>(sregs.interruptBitmap.size()))
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "bad interrupt bitmap");
	fromProto(msg.cs(), sregs.cs);
	fromProto(msg.ds(), sregs.ds);
	fromProto(msg.es(), sregs.es);
	fromProto(msg.fs(), sregs.fs);
	fromProto(msg.gs(), sregs.gs);
	fromProto(msg.ss(), sregs.ss);
	fromProto(msg.tr(), sregs.tr);
	fromProto(msg.ldt(), sregs.ldt);
	fromProto(msg.gdt(), sregs.gdt);
	fromProto(msg.idt(), sregs.idt);
	sregs.cr0 = msg.cr0();
	sregs.cr2 = msg.cr2();
	sregs.cr3 = msg.cr3();
	sregs.cr4 = msg.cr4();
	sregs.cr8 = msg.cr8();
	sregs.efer = msg.efer();
	sregs.apicBase = msg.apic_base();
	for(size_t i = 0; i < sregs.interruptBitmap.size(); ++i)
		sregs.interruptBitmap[i] = msg.interrupt_bitmap(i);
	return {};
}

Result<> fromProto(const proto::FpuRegs &msg, FpuRegs &fpu, uint64_t section) {
	if(msg.fpr().size() != sizeof(fpu.fpr) || msg.xmm().size() != sizeof(fpu.xmm))
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "bad FPU state");
	memcpy(fpu.fpr.data(), msg.fpr().data(), sizeof(fpu.fpr));
	fpu.fcw = msg.fcw();
	fpu.fsw = msg.fsw();
	fpu.ftwx = msg.ftwx();
	fpu.lastOpcode = msg.last_opcode();
	fpu.lastIp = msg.last_ip();
	fpu.lastDp = msg.last_dp();
	memcpy(fpu.xmm.data(), msg.xmm().data(), sizeof(fpu.xmm));
	fpu.mxcsr = msg.mxcsr();
	return {};
}

Result<> fromProto(const proto::DebugRegs &msg, DebugRegs &regs, uint64_t section) {
	if(msg.db_size() != static_cast<int>(regs.db.size()))
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "bad debug registers");
	for(size_t i = 0; i < regs.db.size(); ++i)
		regs.db[i] = msg.db(i);
	regs.dr6 = msg.dr6();
	regs.dr7 = msg.dr7();
	return {};
}

Result<> fromProto(const proto::VmState &msg, VmSnapshot &vm, uint64_t section) {
	vm.vcpuCount = msg.vcpu_count();
	vm.memorySize = msg.memory_size();
	for(auto &region : msg.regions())
		vm.regions.push_back(SlotInfo{region.id(), region.guest_address(), region.size(),
				region.read_only(), region.dirty_log()});

	for(auto &entry : msg.routes()) {
		if(entry.has_pin()) {
			if(entry.pin().chip() > static_cast<uint32_t>(IrqChip::ioapic))
				return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "unknown irqchip");
			vm.routes.push_back(IrqRoute{entry.gsi(),
					IrqchipPin{static_cast<IrqChip>(entry.pin().chip()), entry.pin().pin()}});
		}else if(entry.has_msi()) {
			vm.routes.push_back(IrqRoute{entry.gsi(),
					MsiMessage{entry.msi().address(), entry.msi().data()}});
		}else{
			return rejectSnapshot(ErrorKind::incompatibleSnapshot, section, "route without source");
		}
	}

	vm.assertedLines.assign(msg.asserted_lines().begin(), msg.asserted_lines().end());
	vm.nextSlotId = msg.next_slot_id();
	return fromProto(msg.backend_state(), vm.backendState, section);
}

Result<> fromProto(const proto::VcpuState &msg, VcpuSnapshot &vcpu, uint64_t section) {
	vcpu.id = msg.id();
	fromProto(msg.regs(), vcpu.regs);
	if(auto outcome = fromProto(msg.sregs(), vcpu.sregs, section); !outcome)
		return outcome;
	if(msg.has_fpu()) {
		FpuRegs fpu{};
		if(auto outcome = fromProto(msg.fpu(), fpu, section); !outcome)
			return outcome;
		vcpu.fpu = fpu;
	}
	if(msg.has_debug_regs()) {
		DebugRegs regs{};
		if(auto outcome = fromProto(msg.debug_regs(), regs, section); !outcome)
			return outcome;
		vcpu.debugRegs = regs;
	}
	return fromProto(msg.backend_state(), vcpu.backendState, section);
}

template<typename M>
void addSection(proto::Container &container, std::string name, uint32_t version,
		const M &msg) {
	auto section = container.add_sections();
	section->set_name(std::move(name));
	section->set_version(version);
	section->set_body(msg.SerializeAsString());
}

} // anonymous namespace

Result<> checkOpaque(const OpaqueState &state, HypervisorKind backend, uint32_t version) {
	if(state.backend != backend)
		return makeError(ErrorKind::incompatibleSnapshot, static_cast<uint32_t>(state.backend),
				"restore");
	if(state.version != version)
		return makeError(ErrorKind::unsupportedVersion, state.version, "restore");
	return {};
}

Result<SnapshotBlob> captureMachine(Vm &vm, std::span<Vcpu *const> vcpus) {
	SnapshotBlob blob;

	for(auto vcpu : vcpus) {
		auto snapshot = vcpu->snapshot();
		if(!snapshot)
			return std::unexpected{snapshot.error()};
		auto [it, inserted] = blob.vcpus.emplace(vcpu->id(), std::move(*snapshot));
		if(!inserted)
			return makeError(ErrorKind::illegalArgs, vcpu->id(), "captureMachine");
	}

	auto vmSnapshot = vm.snapshot();
	if(!vmSnapshot)
		return std::unexpected{vmSnapshot.error()};
	blob.vm = std::move(*vmSnapshot);

	// Reading the log clears it; merge it back so that the caller's next
	// getDirtyLog() still reports these pages.
	for(auto &info : blob.vm.regions) {
		if(!info.dirtyLogEnabled)
			continue;
		auto bitmap = vm.getDirtyLog(info.id);
		if(!bitmap)
			return std::unexpected{bitmap.error()};
		if(auto outcome = vm.mergeDirtyLog(info.id, *bitmap); !outcome)
			return std::unexpected{outcome.error()};
		blob.dirtyLogs.emplace(info.id, std::move(*bitmap));
	}

	if(logSnapshots)
		std::cout << "hv: Captured " << blob.vcpus.size() << " vCPUs, "
				<< blob.vm.regions.size() << " regions" << std::endl;
	return blob;
}

Result<> restoreMachine(Vm &vm, std::span<Vcpu *const> vcpus, const SnapshotBlob &blob) {
	if(blob.version != kSnapshotVersion)
		return makeError(ErrorKind::unsupportedVersion, blob.version, "restoreMachine");
	if(vcpus.size() != blob.vcpus.size())
		return makeError(ErrorKind::incompatibleSnapshot, vcpus.size(), "restoreMachine");

	// Validate everything before the first piece of state is applied.
	std::set<VcpuId> seen;
	for(auto vcpu : vcpus) {
		auto it = blob.vcpus.find(vcpu->id());
		if(it == blob.vcpus.end() || !seen.insert(vcpu->id()).second)
			return makeError(ErrorKind::incompatibleSnapshot, vcpu->id(), "restoreMachine");
		if(auto outcome = vcpu->checkRestore(it->second); !outcome)
			return outcome;
	}

	if(auto outcome = vm.checkRestore(blob.vm); !outcome)
		return outcome;

	for(auto &[slot, bitmap] : blob.dirtyLogs) {
		auto it = std::find_if(blob.vm.regions.begin(), blob.vm.regions.end(),
				[&] (const SlotInfo &info) { return info.id == slot; });
		if(it == blob.vm.regions.end() || !it->dirtyLogEnabled
				|| bitmap.pages() != it->size / kPageSize)
			return makeError(ErrorKind::incompatibleSnapshot, slot, "restoreMachine");
	}

	if(auto outcome = vm.restore(blob.vm); !outcome)
		return outcome;
	for(auto vcpu : vcpus)
		if(auto outcome = vcpu->restore(blob.vcpus.at(vcpu->id())); !outcome)
			return outcome;

	// Slot IDs of the fresh VM differ from the recorded ones; match by address.
	auto current = vm.memoryRegions();
	for(auto &[slot, bitmap] : blob.dirtyLogs) {
		auto recorded = std::find_if(blob.vm.regions.begin(), blob.vm.regions.end(),
				[&] (const SlotInfo &info) { return info.id == slot; });
		auto target = std::find_if(current.begin(), current.end(),
				[&] (const SlotInfo &info) { return info.guestAddress == recorded->guestAddress; });
		if(target == current.end())
			return makeError(ErrorKind::incompatibleSnapshot, slot, "restoreMachine");
		if(auto outcome = vm.mergeDirtyLog(target->id, bitmap); !outcome)
			return outcome;
	}
	return {};
}

Result<std::vector<uint8_t>> encodeSnapshot(const SnapshotBlob &blob) {
	proto::Container container;

	proto::VmState vmState;
	toProto(blob.vm, &vmState);
	addSection(container, "vm", vmSectionVersion, vmState);

	for(auto &[id, vcpu] : blob.vcpus) {
		proto::VcpuState vcpuState;
		toProto(vcpu, &vcpuState);
		addSection(container, "vcpu/" + std::to_string(id), vcpuSectionVersion, vcpuState);
	}

	for(auto &[slot, bitmap] : blob.dirtyLogs) {
		proto::DirtyLog log;
		log.set_slot(slot);
		log.set_pages(bitmap.pages());
		for(auto word : bitmap.words())
			log.add_words(word);
		addSection(container, "dirty-log/" + std::to_string(slot), dirtyLogSectionVersion, log);
	}

	std::string body;
	if(!container.SerializeToString(&body))
		return makeError(ErrorKind::illegalArgs, 0, "encodeSnapshot");

	std::vector<uint8_t> bytes(headerSize + body.size());
	memcpy(bytes.data(), snapshotMagic, sizeof(snapshotMagic));
	putLe32(bytes.data() + 8, blob.version);
	putLe32(bytes.data() + 12, 0);
	memcpy(bytes.data() + headerSize, body.data(), body.size());
	return bytes;
}

Result<SnapshotBlob> decodeSnapshot(std::span<const uint8_t> bytes) {
	if(bytes.size() < headerSize || memcmp(bytes.data(), snapshotMagic, sizeof(snapshotMagic)))
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, 0, "bad magic");
	auto version = getLe32(bytes.data() + 8);
	if(version != kSnapshotVersion)
		return rejectSnapshot(ErrorKind::unsupportedVersion, version, "unknown container version");

	proto::Container container;
	if(!container.ParseFromArray(bytes.data() + headerSize, bytes.size() - headerSize))
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, 0, "malformed container");

	SnapshotBlob blob;
	blob.version = version;
	bool haveVm = false;

	for(int i = 0; i < container.sections_size(); ++i) {
		auto &section = container.sections(i);
		std::string_view name = section.name();
		uint32_t index;

		if(name == "vm") {
			if(section.version() != vmSectionVersion)
				return rejectSnapshot(ErrorKind::unsupportedVersion, i, "unknown vm section version");
			proto::VmState msg;
			if(haveVm || !msg.ParseFromString(section.body()))
				return rejectSnapshot(ErrorKind::incompatibleSnapshot, i, "malformed vm section");
			if(auto outcome = fromProto(msg, blob.vm, i); !outcome)
				return std::unexpected{outcome.error()};
			haveVm = true;
		}else if(parseIndex(name, "vcpu/", index)) {
			if(section.version() != vcpuSectionVersion)
				return rejectSnapshot(ErrorKind::unsupportedVersion, i, "unknown vcpu section version");
			proto::VcpuState msg;
			if(!msg.ParseFromString(section.body()) || msg.id() != index
					|| blob.vcpus.contains(index))
				return rejectSnapshot(ErrorKind::incompatibleSnapshot, i, "malformed vcpu section");
			VcpuSnapshot vcpu;
			if(auto outcome = fromProto(msg, vcpu, i); !outcome)
				return std::unexpected{outcome.error()};
			blob.vcpus.emplace(index, std::move(vcpu));
		}else if(parseIndex(name, "dirty-log/", index)) {
			if(section.version() != dirtyLogSectionVersion)
				return rejectSnapshot(ErrorKind::unsupportedVersion, i,
						"unknown dirty-log section version");
			proto::DirtyLog msg;
			if(!msg.ParseFromString(section.body()) || msg.slot() != index
					|| blob.dirtyLogs.contains(index)
					|| static_cast<uint64_t>(msg.words_size()) != (msg.pages() + 63) / 64)
				return rejectSnapshot(ErrorKind::incompatibleSnapshot, i,
						"malformed dirty-log section");
			DirtyBitmap bitmap{msg.pages()};
			std::copy(msg.words().begin(), msg.words().end(), bitmap.words().begin());
			blob.dirtyLogs.emplace(index, std::move(bitmap));
		}else{
			return rejectSnapshot(ErrorKind::incompatibleSnapshot, i, "unknown section");
		}
	}

	if(!haveVm)
		return rejectSnapshot(ErrorKind::incompatibleSnapshot, container.sections_size(),
				"missing vm section");
	return blob;
}

} // namespace hv
