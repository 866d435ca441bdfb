/**
 * @file shared_library.h
 * @brief RAII owner of a dynamically loaded native library.
 *
 * Libraries are opened with RTLD_NOW so that unresolved dependencies
 * fail at load time, and RTLD_NODELETE because native worker threads
 * may still be returning from a completion callback when the last
 * reference is dropped.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <vcxbridge/error.h>

#include <string>
#include <string_view>

namespace vcxbridge {

class SharedLibrary {
public:
    SharedLibrary() = default;
    ~SharedLibrary();

    // Non-copyable
    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    // Movable
    SharedLibrary(SharedLibrary&& other) noexcept;
    SharedLibrary& operator=(SharedLibrary&& other) noexcept;

    /**
     * @brief Open a library.
     *
     * @param path Filesystem path passed verbatim to the loader
     * @return Loaded library, or InvalidConfiguration with the loader's message
     */
    [[nodiscard]] static Result<SharedLibrary> open(const std::string& path);

    /**
     * @brief Resolve a symbol.
     *
     * @return Symbol address, or nullptr if missing or not loaded
     */
    [[nodiscard]] void* symbol(const char* name) const noexcept;

    [[nodiscard]] bool is_loaded() const noexcept { return handle_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /**
     * @brief Drop the loader reference now.
     */
    void close() noexcept;

private:
    SharedLibrary(void* handle, std::string path)
        : handle_(handle), path_(std::move(path)) {}

    void* handle_ = nullptr;
    std::string path_;
};

} // namespace vcxbridge
