#include <hv/registers.hpp>

namespace hv {

SpecialRegs resetSpecialRegs() {
	SpecialRegs sregs{};

	SegmentRegister data{};
	data.limit = 0xFFFF;
	data.type = 3;
	data.present = 1;
	data.s = 1;
	sregs.ds = data;
	sregs.es = data;
	sregs.fs = data;
	sregs.gs = data;
	sregs.ss = data;

	sregs.cs = data;
	sregs.cs.type = 11;
	sregs.cs.selector = 0xF000;
	sregs.cs.base = 0xFFFF0000;

	sregs.ldt.limit = 0xFFFF;
	sregs.ldt.type = 2;
	sregs.ldt.present = 1;

	sregs.tr.limit = 0xFFFF;
	sregs.tr.type = 3;
	sregs.tr.present = 1;

	sregs.gdt.limit = 0xFFFF;
	sregs.idt.limit = 0xFFFF;

	// CD | NW | ET.
	sregs.cr0 = 0x6000'0010;
	sregs.apicBase = 0xFEE0'0000 | (1 << 11) | (1 << 8);
	return sregs;
}

} // namespace hv
