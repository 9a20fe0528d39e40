#include <unistd.h>
#include <iostream>

#include <hv/descriptor.hpp>

namespace hv {

UniqueFd::~UniqueFd() {
	if(fd_ < 0)
		return;
	if(close(fd_))
		std::cout << "\e[31m" "hv: close() of fd " << fd_ << " failed" "\e[39m" << std::endl;
}

} // namespace hv
