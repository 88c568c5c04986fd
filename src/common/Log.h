#ifndef JSTREAM_COMMON_LOG_H
#define JSTREAM_COMMON_LOG_H

#include <spdlog/common.h>
#include <spdlog/spdlog.h>

namespace jstream {

// Library code logs through the spdlog default logger; applications pick the
// sink and level.
namespace log = spdlog;

} // namespace jstream

#endif // JSTREAM_COMMON_LOG_H
