#pragma once
#include <iostream>
#include <utility>

namespace tictac {

/// Output stream that holds the global log mutex for its lifetime.
struct SyncOutputStream {
    explicit SyncOutputStream(std::ostream& os);
    ~SyncOutputStream();

    SyncOutputStream(const SyncOutputStream&) = delete;
    SyncOutputStream& operator=(const SyncOutputStream&) = delete;
    SyncOutputStream(SyncOutputStream&&) = delete;
    SyncOutputStream& operator=(SyncOutputStream&&) = delete;

    template <typename T>
    SyncOutputStream& operator<<(T&& value) {
        os << std::forward<T>(value);
        return *this;
    }
    SyncOutputStream& operator<<(std::ostream& (*m)(std::ostream&)) {
        os << m;
        return *this;
    }

    std::ostream& os;
};

[[nodiscard]] inline SyncOutputStream sync_cerr() {
    return SyncOutputStream{std::cerr};
}

} // namespace tictac

#define TICTAC_INFO(message)  ::tictac::sync_cerr() << "[tictac] INFO " << message << std::endl
#define TICTAC_ERROR(message) ::tictac::sync_cerr() << "[tictac] ERROR " << message << std::endl
#ifdef NDEBUG
    #define TICTAC_DEBUG(message) ((void)0)
#else
    #define TICTAC_DEBUG(message) ::tictac::sync_cerr() << "[tictac] DEBUG " << message << std::endl
#endif
