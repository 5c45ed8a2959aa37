#include "tictac/util/log.hpp"
#include <mutex>

namespace tictac {

namespace {
std::mutex& log_mutex() {
    static std::mutex mutex;
    return mutex;
}
} // namespace

SyncOutputStream::SyncOutputStream(std::ostream& os) : os(os) {
    log_mutex().lock();
}

SyncOutputStream::~SyncOutputStream() {
    log_mutex().unlock();
}

} // namespace tictac
