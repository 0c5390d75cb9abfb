#pragma once
#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>

// Unico io_context del processo, eseguito su un thread dedicato.
// Tutto l'I/O seriale e i timer di keepalive girano qui.
class Reactor {
public:
    Reactor() = default;
    ~Reactor();

    Reactor(const Reactor&) = delete;
    Reactor& operator=(const Reactor&) = delete;

    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return m_running.load(); }
    [[nodiscard]] bool runningInThisThread() const;

    asio::io_context& io() { return m_io; }

    // Fire-and-forget sul thread del reactor. false se fermo (f scartata).
    // Quanto accodato prima di stop() viene comunque eseguito.
    template <typename F>
    bool post(F&& f) {
        std::lock_guard<std::mutex> lk(m_postMx);
        if (!m_running.load()) return false;
        asio::post(m_io, std::forward<F>(f));
        return true;
    }

    // Esegue f sul reactor e ne restituisce il risultato al chiamante.
    // Inline se già sul thread del reactor. Lancia std::runtime_error se fermo.
    template <typename F>
    auto call(F&& f) -> std::invoke_result_t<F> {
        using R = std::invoke_result_t<F>;
        if (runningInThisThread()) return f();

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        auto fut = task->get_future();
        if (!post([task] { (*task)(); })) throw std::runtime_error("reactor not running");
        return fut.get();
    }

private:
    asio::io_context m_io;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> m_guard;
    std::thread m_thread;
    std::atomic<std::thread::id> m_threadId{};
    std::atomic<bool> m_running{ false };
    std::mutex m_postMx; // post() contro stop()
};
