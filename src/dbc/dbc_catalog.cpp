// src/dbc/dbc_catalog.cpp
#include "dbc/dbc_catalog.hpp"

namespace dbc {

const Signal* Message::find_signal(const std::string& signal_name) const {
    for (const auto& sig : signals) {
        if (sig.name == signal_name)
            return &sig;
    }
    return nullptr;
}

const Message* Catalog::find(uint32_t frame_id, bool extended) const {
    auto it = by_id_.find(message_key(frame_id, extended));
    if (it == by_id_.end())
        return nullptr;
    return &messages_[it->second];
}

Message* Catalog::find_mutable(uint32_t frame_id, bool extended) {
    auto it = by_id_.find(message_key(frame_id, extended));
    if (it == by_id_.end())
        return nullptr;
    return &messages_[it->second];
}

bool Catalog::add(Message msg) {
    const uint32_t key = message_key(msg.id, msg.extended);
    msg.id = normalize_id(msg.id);
    msg.extended = (key & kExtendedKeyFlag) != 0;
    if (by_id_.count(key) != 0)
        return false;
    by_id_[key] = messages_.size();
    messages_.push_back(std::move(msg));
    return true;
}

size_t Catalog::signal_count() const {
    size_t n = 0;
    for (const auto& msg : messages_)
        n += msg.signals.size();
    return n;
}

} // namespace dbc
