// src/dbc/dbc_catalog.hpp
#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/bitpack.hpp"

namespace dbc {

// Transmitter / receiver name used when the DBC leaves it unassigned
constexpr const char* kUnknownNode = "Unknown";

enum class MuxRole {
    None,         // plain signal
    Multiplexer,  // selects the active group ("M")
    Multiplexed   // active only when the multiplexer equals mux_value ("mN")
};

enum class ValueType {
    Integer,
    Float32,  // SIG_VALTYPE_ 1
    Float64   // SIG_VALTYPE_ 2
};

// One signal inside a CAN message
struct Signal {
    std::string name;

    int start_bit = 0;
    int bit_length = 0;

    utils::Endianness endianness = utils::Endianness::Little;
    bool is_signed = false;
    ValueType value_type = ValueType::Integer;

    double factor = 1.0;
    double offset = 0.0;

    // [0|0] in the DBC means "no range declared"
    bool has_range = false;
    double min = 0.0;
    double max = 0.0;

    std::string unit;

    // Filled by units::UnitNormalizer::annotate; pass-through until then
    std::string canonical_unit;
    bool unit_mapped = false;

    MuxRole mux_role = MuxRole::None;
    uint64_t mux_value = 0;

    std::vector<std::string> receivers;

    // Payload bytes needed to cover every bit of this signal
    size_t required_bytes() const {
        return utils::required_bytes(start_bit, bit_length, endianness);
    }
};

// Multiplexer signal → (multiplexer raw value → dependent signals).
// Stores positions into Message::signals, never pointers.
struct MultiplexIndex {
    int multiplexer = -1;
    std::map<uint64_t, std::vector<size_t>> groups;

    bool is_multiplexed() const { return multiplexer >= 0; }
};

// One CAN message definition
struct Message {
    uint32_t id = 0;          // 11- or 29-bit identifier, flag bit stripped
    bool extended = false;
    std::string name;
    int length = 8;           // bytes
    std::string transmitter = kUnknownNode;

    std::vector<Signal> signals;
    MultiplexIndex mux;

    const Signal* find_signal(const std::string& signal_name) const;
};

// Messages keyed by (identifier, frame format). Standard 0x100 and
// extended 0x00000100 are different messages. Built once per DBC file and
// shared read-only by every decode call of a session.
class Catalog {
public:
    // Node names from BU_ plus every transmitter / receiver seen
    std::vector<std::string> nodes;

    // frame_id may carry the DBC extended flag (bit 31); identifiers above
    // 11 bits are always extended
    const Message* find(uint32_t frame_id, bool extended = false) const;
    Message* find_mutable(uint32_t frame_id, bool extended = false);

    bool contains(uint32_t frame_id, bool extended = false) const {
        return find(frame_id, extended) != nullptr;
    }

    // Inserts; false if the identifier and format are already present
    bool add(Message msg);

    // Messages in DBC declaration order
    const std::vector<Message>& messages() const { return messages_; }
    std::vector<Message>& messages_mutable() { return messages_; }

    size_t size() const { return messages_.size(); }
    size_t signal_count() const;

private:
    std::vector<Message> messages_;
    std::unordered_map<uint32_t, size_t> by_id_;
};

// Bare identifier: masks the extended-frame flag (bit 31) and anything
// above 29 bits.
inline uint32_t normalize_id(uint32_t raw_id) {
    return raw_id & 0x1FFFFFFFu;
}

constexpr uint32_t kExtendedKeyFlag = 0x80000000u;

// Lookup key: bare identifier, with bit 31 set for extended frames
inline uint32_t message_key(uint32_t raw_id, bool extended) {
    const uint32_t id = normalize_id(raw_id);
    if (extended || (raw_id & kExtendedKeyFlag) != 0 || id > 0x7FFu)
        return id | kExtendedKeyFlag;
    return id;
}

} // namespace dbc
