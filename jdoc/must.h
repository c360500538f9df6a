#pragma once

#include <cstdlib>
#include <utility>

#include "error.h"
#include "log.h"

namespace jdoc {

/**
 * Abort-on-failure form of any jdoc operation.
 *
 * Every fallible operation in jdoc throws jdoc::Error. Call sites that treat
 * such a failure as a programming error rather than bad data wrap the call:
 *
 *   std::string name = jdoc::must([&] { return doc.get_as<std::string>("name"); });
 *
 * The callable's result is returned unchanged. If it throws jdoc::Error the
 * diagnostic is logged at critical level and the process aborts. This is
 * the only place where the library aborts.
 */
template <typename Fn>
decltype(auto) must(Fn&& fn) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const Error& e) {
        logger()->critical("{}: {}", to_string(e.kind()), e.what());
        logger()->flush();
        std::abort();
    }
}

} // namespace jdoc
