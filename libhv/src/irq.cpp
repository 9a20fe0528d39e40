#include <hv/irq.hpp>

namespace hv {

namespace {

// Interrupt window of the local APICs.
constexpr uint64_t msiWindowMask = 0xFFF0'0000;
constexpr uint64_t msiWindowBase = 0xFEE0'0000;

} // anonymous namespace

uint32_t IrqChipLayout::pinCount(IrqChip chip) const {
	switch(chip) {
	case IrqChip::picPrimary: return picPrimaryPins;
	case IrqChip::picSecondary: return picSecondaryPins;
	case IrqChip::ioapic: return ioapicPins;
	}
	return 0;
}

std::vector<IrqRoute> defaultX86Routing(const IrqChipLayout &layout) {
	std::vector<IrqRoute> routes;
	for(uint32_t pin = 0; pin < layout.ioapicPins; ++pin)
		routes.push_back(IrqRoute{pin, IrqchipPin{IrqChip::ioapic, pin}});
	return routes;
}

const IrqSource *RoutingTable::lookup(Gsi gsi) const {
	auto it = entries_.find(gsi);
	if(it == entries_.end())
		return nullptr;
	return &it->second;
}

std::vector<IrqRoute> RoutingTable::routes() const {
	std::vector<IrqRoute> routes;
	routes.reserve(entries_.size());
	for(auto &[gsi, source] : entries_)
		routes.push_back(IrqRoute{gsi, source});
	return routes;
}

IrqRouter::IrqRouter(IrqChipLayout layout)
: layout_{layout}, table_{std::make_shared<RoutingTable>(0, std::map<Gsi, IrqSource>{})} { }

Result<std::shared_ptr<const RoutingTable>>
IrqRouter::prepare(std::span<const IrqRoute> routes) const {
	if(routes.size() > layout_.maxRoutes)
		return makeError(ErrorKind::resourceExhausted, routes.size(), "setIrqRouting");

	std::map<Gsi, IrqSource> entries;
	for(auto &route : routes) {
		if(auto pin = std::get_if<IrqchipPin>(&route.source)) {
			if(pin->pin >= layout_.pinCount(pin->chip))
				return makeError(ErrorKind::invalidRoute, route.gsi, "setIrqRouting");
		}else{
			auto &msi = std::get<MsiMessage>(route.source);
			if((msi.address & msiWindowMask) != msiWindowBase)
				return makeError(ErrorKind::invalidRoute, route.gsi, "setIrqRouting");
		}
		entries.insert_or_assign(route.gsi, route.source);
	}

	return std::make_shared<const RoutingTable>(table_->version() + 1, std::move(entries));
}

void IrqRouter::publish(std::shared_ptr<const RoutingTable> table) {
	table_ = std::move(table);
}

bool IrqRouter::setLevel(Gsi gsi, bool level) {
	std::lock_guard lock{levelMutex_};
	if(level)
		return asserted_.insert(gsi).second;
	asserted_.erase(gsi);
	return false;
}

bool IrqRouter::isAsserted(Gsi gsi) const {
	std::lock_guard lock{levelMutex_};
	return asserted_.contains(gsi);
}

std::vector<Gsi> IrqRouter::assertedLines() const {
	std::lock_guard lock{levelMutex_};
	return std::vector<Gsi>(asserted_.begin(), asserted_.end());
}

void IrqRouter::restoreLevels(std::span<const Gsi> asserted) {
	std::lock_guard lock{levelMutex_};
	asserted_ = std::set<Gsi>(asserted.begin(), asserted.end());
}

} // namespace hv
