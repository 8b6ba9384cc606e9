#include "serbridge/pch.h"
#include <boost/rational.hpp>

namespace boost {
	template class rational<std::uint64_t>;
	template class basic_format<char>;
}

namespace std {
	template class std::vector<std::uint64_t>;
}
