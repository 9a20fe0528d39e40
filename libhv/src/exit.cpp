#include <ostream>

#include <hv/exit.hpp>

namespace hv {

namespace {

template<typename... Ts>
struct Overloaded : Ts... {
	using Ts::operator()...;
};

} // anonymous namespace

const char *exitName(const VcpuExit &exit) {
	return std::visit(Overloaded{
		[] (const exits::IoIn &) { return "io-in"; },
		[] (const exits::IoOut &) { return "io-out"; },
		[] (const exits::MmioRead &) { return "mmio-read"; },
		[] (const exits::MmioWrite &) { return "mmio-write"; },
		[] (const exits::Hlt &) { return "hlt"; },
		[] (const exits::Shutdown &) { return "shutdown"; },
		[] (const exits::InterruptWindowOpen &) { return "interrupt-window-open"; },
		[] (const exits::Debug &) { return "debug"; },
		[] (const exits::ImmediateExit &) { return "immediate-exit"; },
		[] (const exits::FailEntry &) { return "fail-entry"; },
		[] (const exits::SystemEvent &) { return "system-event"; },
		[] (const exits::InternalError &) { return "internal-error"; },
		[] (const exits::Unknown &) { return "unknown"; }
	}, exit);
}

std::ostream &operator<< (std::ostream &os, const VcpuExit &exit) {
	os << exitName(exit);
	os << std::hex;
	if(auto in = std::get_if<exits::IoIn>(&exit)) {
		os << " port 0x" << in->port << ", size " << int(in->size);
	}else if(auto out = std::get_if<exits::IoOut>(&exit)) {
		os << " port 0x" << out->port << ", size " << int(out->size);
	}else if(auto read = std::get_if<exits::MmioRead>(&exit)) {
		os << " 0x" << read->address << ", size " << int(read->size);
	}else if(auto write = std::get_if<exits::MmioWrite>(&exit)) {
		os << " 0x" << write->address << ", size " << int(write->size);
	}else if(auto debug = std::get_if<exits::Debug>(&exit)) {
		os << " exception 0x" << debug->exception << " at 0x" << debug->pc;
	}else if(auto fail = std::get_if<exits::FailEntry>(&exit)) {
		os << " reason 0x" << fail->hardwareReason;
	}else if(auto event = std::get_if<exits::SystemEvent>(&exit)) {
		switch(event->type) {
		case exits::SystemEvent::Type::shutdown: os << " shutdown"; break;
		case exits::SystemEvent::Type::reset: os << " reset"; break;
		case exits::SystemEvent::Type::crash: os << " crash"; break;
		}
	}else if(auto internal = std::get_if<exits::InternalError>(&exit)) {
		os << " suberror 0x" << internal->suberror;
	}else if(auto unknown = std::get_if<exits::Unknown>(&exit)) {
		os << " code 0x" << unknown->code;
	}
	os << std::dec;
	return os;
}

} // namespace hv
