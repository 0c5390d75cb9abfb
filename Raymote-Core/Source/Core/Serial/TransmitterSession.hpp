#pragma once
#include "Core/Serial/SerialSession.hpp"
#include "Core/IrProtocol.hpp"
#include <deque>
#include <functional>
#include <memory>
#include <string>

// Scrive comandi "<protocol>,<bits>,<code>\n" sul trasmettitore IR.
// Le send concorrenti sono accodate: una sola async_write in volo,
// completamenti nell'ordine di invio. Un errore di scrittura chiude la
// porta (stato Failed) e fallisce le send ancora in coda.
class TransmitterSession : public SerialSession {
public:
    // err vuoto = scrittura completata
    using SendHandler = std::function<void(const std::string& err)>;

    explicit TransmitterSession(asio::io_context& io);
    ~TransmitterSession() override;

    // Sul thread dell'io_context. Se non connesso, done("not_connected")
    // viene chiamato subito senza alcun I/O.
    void send(const TransmitCommand& cmd, SendHandler done);

    [[nodiscard]] size_t pendingWrites() const { return m_queue.size(); }

protected:
    void onClosing() override;

private:
    struct PendingWrite {
        std::shared_ptr<const std::string> bytes;
        SendHandler done;
    };

    void doWrite(std::uint64_t gen);
    void failPending(const std::string& err);

    std::deque<PendingWrite> m_queue;
};
