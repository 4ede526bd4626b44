// SPDX-License-Identifier: MIT

#include "tsingest/data_provider.hpp"
#include "tsingest/logging.hpp"

namespace tsingest {

void close_after_failure(IDataProvider& provider) {
    if (auto closed = provider.close(); !closed) {
        log()->warn("{}: close after failed run: {}", provider.name(),
                    to_string(closed.error()));
    }
}

}  // namespace tsingest
