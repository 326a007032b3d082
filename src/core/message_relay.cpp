#include "message_relay.h"

#include <utility>

MessageRelay::MessageRelay(Receiver receiver)
    : m_receiver(std::move(receiver)) {
}

bool MessageRelay::Deliver(const std::string& message) {
    // Held for the whole call so Detach() can't return mid-delivery
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_receiver) return false;
    m_receiver(message);
    return true;
}

void MessageRelay::Detach() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_receiver = nullptr;
}

bool MessageRelay::IsAttached() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<bool>(m_receiver);
}
