#pragma once

#include <rr/core/errors/error.hpp>

namespace rr::core::err {

    namespace {
        class ResolverError : public Diagnostic {
        public:
            ResolverError(u32 errorCode, std::string title) noexcept :
                    Diagnostic('S', errorCode, std::move(title)) { }
        };
    }

    const static inline ResolverError SR001(1, "Probe failure.");
    const static inline ResolverError SR002(2, "Assembly folder discovery failure.");

}
