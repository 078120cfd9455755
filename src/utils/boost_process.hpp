#pragma once

#include <boost/version.hpp>

// Boost 1.86 moved the v1 API under boost/process/v1/.
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#include <boost/process/v1/posix.hpp>

namespace shellbox {
namespace bp = boost::process::v1;
}  // namespace shellbox
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <boost/process/posix.hpp>

namespace shellbox {
namespace bp = boost::process;
}  // namespace shellbox
#endif
