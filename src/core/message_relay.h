#pragma once

#include <functional>
#include <mutex>
#include <string>

// Forwards page messages from the browser engine's thread to a receiver
// that may be destroyed first. Once Detach() returns, the receiver is never
// called again.
class MessageRelay {
public:
    using Receiver = std::function<void(const std::string& message)>;

    explicit MessageRelay(Receiver receiver);

    // Returns false if the relay is detached.
    bool Deliver(const std::string& message);

    // Blocks until any delivery in progress on another thread has returned.
    // Must not be called from inside the receiver.
    void Detach();

    bool IsAttached() const;

private:
    mutable std::mutex m_mutex;
    Receiver           m_receiver;

    MessageRelay(const MessageRelay&) = delete;
    MessageRelay& operator=(const MessageRelay&) = delete;
};
