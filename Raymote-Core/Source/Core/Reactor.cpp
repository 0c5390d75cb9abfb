#include "Core/Reactor.hpp"
#include <fmt/core.h>

Reactor::~Reactor() { stop(); }

void Reactor::start() {
    std::lock_guard<std::mutex> lk(m_postMx);
    if (m_running.exchange(true)) return;

    m_io.restart(); // pronto anche dopo uno stop precedente
    m_guard = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(m_io.get_executor());
    m_thread = std::thread([this] {
        m_threadId.store(std::this_thread::get_id());
        for (;;) {
            try {
                m_io.run();
                break;
            }
            catch (const std::exception& e) {
                // un handler ha lanciato: logga e continua a servire gli altri
                fmt::print("[IO] eccezione in un handler: {}\n", e.what());
            }
        }
    });
}

void Reactor::stop() {
    {
        std::lock_guard<std::mutex> lk(m_postMx);
        if (!m_running.exchange(false)) return;
    }

    m_guard.reset();
    m_io.stop();
    if (m_thread.joinable()) {
        m_thread.join();
    }
    m_threadId.store(std::thread::id());

    // esegue i task accodati prima dello stop: nessun call() resta appeso
    m_io.restart();
    for (;;) {
        try {
            m_io.poll();
            break;
        }
        catch (const std::exception& e) {
            fmt::print("[IO] eccezione in un handler: {}\n", e.what());
        }
    }
}

bool Reactor::runningInThisThread() const {
    return m_threadId.load() == std::this_thread::get_id();
}
