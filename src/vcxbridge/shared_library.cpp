/**
 * @file shared_library.cpp
 * @brief dlopen-backed SharedLibrary.
 *
 * @copyright GPL-2.0-or-later
 */

#include "vcxbridge/shared_library.h"
#include "vcxbridge/logging.h"

#include <dlfcn.h>

#include <utility>

namespace vcxbridge {

SharedLibrary::~SharedLibrary() {
    close();
}

SharedLibrary::SharedLibrary(SharedLibrary&& other) noexcept
    : handle_(std::exchange(other.handle_, nullptr))
    , path_(std::move(other.path_))
{}

SharedLibrary& SharedLibrary::operator=(SharedLibrary&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = std::exchange(other.handle_, nullptr);
        path_ = std::move(other.path_);
    }
    return *this;
}

Result<SharedLibrary> SharedLibrary::open(const std::string& path) {
    VCXBRIDGE_CHECK(!path.empty(), ErrorCode::InvalidConfiguration,
                    "library path is empty");

    void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL | RTLD_NODELETE);
    if (handle == nullptr) {
        const char* reason = dlerror();
        std::string message = "cannot load '" + path + "': " +
                              (reason ? reason : "unknown loader error");
        VCXBRIDGE_LOG_ERROR("LIBRARY", "%s", message.c_str());
        return make_error(ErrorCode::InvalidConfiguration, std::move(message));
    }

    VCXBRIDGE_LOG_DEBUG("LIBRARY", "loaded %s", path.c_str());
    return SharedLibrary(handle, path);
}

void* SharedLibrary::symbol(const char* name) const noexcept {
    if (handle_ == nullptr || name == nullptr) {
        return nullptr;
    }
    return dlsym(handle_, name);
}

void SharedLibrary::close() noexcept {
    if (handle_ != nullptr) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

} // namespace vcxbridge
