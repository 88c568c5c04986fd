#include "DecoderRegistry.h"

#include "../common/Log.h"

namespace jstream::json {

void DecoderRegistry::clear() {
    plans_.clear();
}

void DecoderRegistry::on_registered(const std::type_info &type, bool replaced) const {
    if (replaced) {
        log::debug("decode plan for {} replaced", type.name());
    } else {
        log::debug("decode plan for {} registered", type.name());
    }
}

} // namespace jstream::json
