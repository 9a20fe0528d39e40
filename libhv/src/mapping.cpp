#include <errno.h>
#include <sys/mman.h>
#include <iostream>

#include <hv/mapping.hpp>

namespace hv {

Result<HostMapping> HostMapping::allocateAnonymous(size_t size) {
	if(!size || (size & (pageSize - 1)))
		return makeError(ErrorKind::invalidAlignment, size, "allocateAnonymous");

	auto window = mmap(nullptr, size, PROT_READ | PROT_WRITE,
			MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE, -1, 0);
	if(window == MAP_FAILED)
		return backendFailure("mmap", errno, size);
	return HostMapping{window, size};
}

Result<HostMapping> HostMapping::mapFile(int fd, off_t offset, size_t size, bool writable) {
	if(!size || (size & (pageSize - 1)) || (offset & (pageSize - 1)))
		return makeError(ErrorKind::invalidAlignment, size, "mapFile");

	int prot = PROT_READ;
	if(writable)
		prot |= PROT_WRITE;
	auto window = mmap(nullptr, size, prot, MAP_SHARED, fd, offset);
	if(window == MAP_FAILED)
		return backendFailure("mmap", errno, fd);
	return HostMapping{window, size};
}

HostMapping::~HostMapping() {
	if(!window_)
		return;
	if(munmap(window_, size_))
		std::cout << "\e[31m" "hv: munmap() of " << window_ << " failed" "\e[39m" << std::endl;
}

} // namespace hv
