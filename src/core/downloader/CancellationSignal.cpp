/**
 * CancellationSignal.cpp
 */

#include "CancellationSignal.hpp"

#include <cerrno>
#include <new>
#include <system_error>
#include <sys/mman.h>

namespace modeld::core::downloader {

static_assert(std::atomic<int>::is_always_lock_free,
              "cancellation cell must be lock-free to be shared across processes");

std::shared_ptr<CancellationSignal> CancellationSignal::create() {
    void* memory = ::mmap(nullptr, sizeof(std::atomic<int>), PROT_READ | PROT_WRITE,
                          MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (memory == MAP_FAILED) {
        throw std::system_error(errno, std::generic_category(), "mmap for cancellation signal");
    }
    auto* cell = new (memory) std::atomic<int>(static_cast<int>(State::Armed));
    return std::shared_ptr<CancellationSignal>(new CancellationSignal(cell));
}

CancellationSignal::CancellationSignal(std::atomic<int>* cell)
    : m_cell(cell) {
}

CancellationSignal::~CancellationSignal() {
    if (m_cell) {
        m_cell->~atomic();
        ::munmap(m_cell, sizeof(std::atomic<int>));
    }
}

bool CancellationSignal::cancel() {
    int expected = static_cast<int>(State::Armed);
    return m_cell->compare_exchange_strong(expected, static_cast<int>(State::Cancelled));
}

void CancellationSignal::acknowledge() {
    int expected = static_cast<int>(State::Cancelled);
    m_cell->compare_exchange_strong(expected, static_cast<int>(State::Acknowledged));
}

CancellationSignal::State CancellationSignal::state() const {
    return static_cast<State>(m_cell->load());
}

const char* toString(CancellationSignal::State state) {
    switch (state) {
        case CancellationSignal::State::Armed:        return "armed";
        case CancellationSignal::State::Cancelled:    return "cancelled";
        case CancellationSignal::State::Acknowledged: return "acknowledged";
    }
    return "unknown";
}

} // namespace modeld::core::downloader
