/**
 * @file native_api.cpp
 * @brief Symbol resolution for NativeApi.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/native_api.h"
#include "vcxbridge/logging.h"

namespace vcxbridge {

const char* NativeApi::first_missing() const noexcept {
#define VCXBRIDGE_CHECK_FIELD(name) \
    if (name == nullptr) { return #name; }
    VCXBRIDGE_NATIVE_FUNCTIONS(VCXBRIDGE_CHECK_FIELD)
#undef VCXBRIDGE_CHECK_FIELD
    return nullptr;
}

Result<NativeApi> NativeApi::resolve(const SharedLibrary& library) {
    VCXBRIDGE_CHECK(library.is_loaded(), ErrorCode::InvalidConfiguration,
                    "library is not loaded");

    NativeApi api;
#define VCXBRIDGE_RESOLVE_FIELD(name) \
    api.name = reinterpret_cast<decltype(api.name)>(library.symbol(#name));
    VCXBRIDGE_NATIVE_FUNCTIONS(VCXBRIDGE_RESOLVE_FIELD)
#undef VCXBRIDGE_RESOLVE_FIELD

    if (const char* missing = api.first_missing()) {
        VCXBRIDGE_LOG_ERROR("LIBRARY", "%s: missing entry point %s",
                            library.path().c_str(), missing);
        return make_error(ErrorCode::InvalidConfiguration,
                          "missing required entry point '" + std::string(missing) +
                          "' in " + library.path());
    }

    return api;
}

} // namespace vcxbridge
