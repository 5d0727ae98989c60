// src/dbc/dbc_parser.cpp
#include "dbc/dbc_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>

#include "config/config_error.hpp"
#include "utils/logging.hpp"

namespace dbc {

MalformedCatalog::MalformedCatalog(int line, const std::string& construct, const std::string& detail)
    : std::runtime_error("[DbcParser] line " + std::to_string(line) + " (" + construct + "): " + detail)
    , line_(line)
    , construct_(construct)
{
}

namespace {

const char* kVectorPlaceholder = "Vector__XXX";
const char* kIndependentSignals = "VECTOR__INDEPENDENT_SIG_MSG";
constexpr int kMaxMessageLength = 64;  // CAN FD

// BO_ 256 EngineData: 8 ECU1
const std::regex kMessageRx(R"(^BO_\s+(\d+)\s+(\w+)\s*:\s*(\d+)\s+(\w+)\s*$)");

// SG_ Speed m2 : 0|16@1+ (0.01,0) [0|250] "km/h" ABS,DASH
const std::regex kSignalRx(
    R"(^SG_\s+(\w+)(?:\s+(M|m\d+M?))?\s*:\s*(\d+)\s*\|\s*(\d+)\s*@\s*([01])\s*([+-])\s*)"
    R"(\(\s*([^,\s]+)\s*,\s*([^)\s]+)\s*\)\s*)"
    R"(\[\s*([^|\s]+)\s*\|\s*([^\]\s]+)\s*\]\s*)"
    R"re("([^"]*)"\s*(.*)$)re");

// SIG_VALTYPE_ 256 Pressure : 1;
const std::regex kValTypeRx(R"(^SIG_VALTYPE_\s+(\d+)\s+(\w+)\s*:?\s*(\d)\s*;?\s*$)");

struct Statement {
    int line = 0;
    std::string text;
};

struct PendingMessage {
    Message msg;
    int line = 0;
    std::vector<int> signal_lines;
    bool dropped = false;
};

std::string trim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        e--;
    return s.substr(b, e - b);
}

bool starts_with_keyword(const std::string& s, const char* kw) {
    const size_t n = std::char_traits<char>::length(kw);
    if (s.compare(0, n, kw) != 0)
        return false;
    return s.size() == n || std::isspace(static_cast<unsigned char>(s[n])) || s[n] == ':';
}

size_t count_quotes(const std::string& s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"' && (i == 0 || s[i - 1] != '\\'))
            ++n;
    }
    return n;
}

// Splits into logical statements. A line with an open quoted string (CM_
// comments, attribute strings) swallows following lines until it closes.
std::vector<Statement> split_statements(const std::string& text) {
    std::vector<Statement> out;
    std::istringstream in(text);
    std::string line;
    int line_no = 0;

    Statement cur;
    bool open_quote = false;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (open_quote) {
            cur.text += "\n" + line;
            if (count_quotes(line) % 2 == 1) {
                open_quote = false;
                out.push_back(cur);
            }
            continue;
        }

        cur.line = line_no;
        cur.text = line;
        if (count_quotes(line) % 2 == 1) {
            open_quote = true;
            continue;
        }
        out.push_back(cur);
    }

    if (open_quote) {
        throw MalformedCatalog(cur.line, "string", "unterminated quoted string");
    }
    return out;
}

std::string node_or_unknown(const std::string& name) {
    if (name.empty() || name == kVectorPlaceholder)
        return kUnknownNode;
    return name;
}

double parse_number(const std::string& s, int line, const char* construct) {
    try {
        size_t used = 0;
        double v = std::stod(s, &used);
        if (used != s.size())
            throw MalformedCatalog(line, construct, "invalid number '" + s + "'");
        return v;
    } catch (const std::invalid_argument&) {
        throw MalformedCatalog(line, construct, "invalid number '" + s + "'");
    } catch (const std::out_of_range&) {
        throw MalformedCatalog(line, construct, "number out of range '" + s + "'");
    }
}

uint64_t parse_unsigned(const std::string& s, int line, const char* construct) {
    try {
        return std::stoull(s);
    } catch (const std::exception&) {
        throw MalformedCatalog(line, construct, "invalid integer '" + s + "'");
    }
}

std::vector<std::string> parse_receivers(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
        if (ch == ',' || std::isspace(static_cast<unsigned char>(ch))) {
            if (!cur.empty()) {
                out.push_back(node_or_unknown(cur));
                cur.clear();
            }
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty())
        out.push_back(node_or_unknown(cur));
    if (out.empty())
        out.push_back(kUnknownNode);
    return out;
}

PendingMessage parse_message(const Statement& st) {
    std::smatch m;
    const std::string text = trim(st.text);
    if (!std::regex_match(text, m, kMessageRx)) {
        throw MalformedCatalog(st.line, "BO_", "cannot parse message definition");
    }

    PendingMessage pm;
    pm.line = st.line;

    const uint64_t raw_id = parse_unsigned(m[1].str(), st.line, "BO_");
    if (raw_id > 0xFFFFFFFFULL) {
        throw MalformedCatalog(st.line, "BO_", "identifier exceeds 32 bits");
    }
    const uint32_t id32 = static_cast<uint32_t>(raw_id);

    pm.msg.extended = (id32 & 0x80000000u) != 0;
    pm.msg.id = normalize_id(id32);
    if (!pm.msg.extended && pm.msg.id > 0x7FFu) {
        throw MalformedCatalog(st.line, "BO_",
            "standard identifier exceeds 11 bits (extended ids need bit 31 set)");
    }

    pm.msg.name = m[2].str();
    const uint64_t length = parse_unsigned(m[3].str(), st.line, "BO_");
    if (length > static_cast<uint64_t>(kMaxMessageLength)) {
        throw MalformedCatalog(st.line, "BO_", "message length " + m[3].str() + " exceeds 64 bytes");
    }
    pm.msg.length = static_cast<int>(length);
    pm.msg.transmitter = node_or_unknown(m[4].str());
    pm.dropped = (pm.msg.name == kIndependentSignals);
    return pm;
}

Signal parse_signal(const Statement& st) {
    std::smatch m;
    const std::string text = trim(st.text);
    if (!std::regex_match(text, m, kSignalRx)) {
        throw MalformedCatalog(st.line, "SG_", "cannot parse signal definition");
    }

    Signal sig;
    sig.name = m[1].str();

    const std::string mux = m[2].str();
    if (mux == "M") {
        sig.mux_role = MuxRole::Multiplexer;
    } else if (!mux.empty()) {
        if (mux.back() == 'M') {
            throw MalformedCatalog(st.line, "SG_",
                "extended multiplexing is not supported (signal " + sig.name + ")");
        }
        sig.mux_role = MuxRole::Multiplexed;
        sig.mux_value = parse_unsigned(mux.substr(1), st.line, "SG_");
    }

    const uint64_t start = parse_unsigned(m[3].str(), st.line, "SG_");
    const uint64_t length = parse_unsigned(m[4].str(), st.line, "SG_");
    if (length < 1 || length > 64) {
        throw MalformedCatalog(st.line, "SG_",
            "bit length " + m[4].str() + " of " + sig.name + " outside 1..64");
    }
    if (start >= static_cast<uint64_t>(kMaxMessageLength * 8)) {
        throw MalformedCatalog(st.line, "SG_", "start bit " + m[3].str() + " of " + sig.name + " out of range");
    }
    sig.start_bit = static_cast<int>(start);
    sig.bit_length = static_cast<int>(length);

    // @1 = Intel (little endian), @0 = Motorola (big endian)
    sig.endianness = (m[5].str() == "1") ? utils::Endianness::Little : utils::Endianness::Big;
    sig.is_signed = (m[6].str() == "-");

    sig.factor = parse_number(m[7].str(), st.line, "SG_");
    sig.offset = parse_number(m[8].str(), st.line, "SG_");
    if (sig.factor == 0.0) {
        throw MalformedCatalog(st.line, "SG_", "zero scale factor for " + sig.name);
    }

    sig.min = parse_number(m[9].str(), st.line, "SG_");
    sig.max = parse_number(m[10].str(), st.line, "SG_");
    sig.has_range = !(sig.min == 0.0 && sig.max == 0.0);

    sig.unit = m[11].str();
    sig.canonical_unit = sig.unit;
    sig.receivers = parse_receivers(m[12].str());
    return sig;
}

void apply_value_type(const Statement& st, std::vector<PendingMessage>& pending) {
    std::smatch m;
    const std::string text = trim(st.text);
    if (!std::regex_match(text, m, kValTypeRx)) {
        throw MalformedCatalog(st.line, "SIG_VALTYPE_", "cannot parse value type");
    }

    const uint64_t raw_id = parse_unsigned(m[1].str(), st.line, "SIG_VALTYPE_");
    const uint32_t key = message_key(static_cast<uint32_t>(raw_id), false);
    const std::string name = m[2].str();
    const int type = static_cast<int>(parse_unsigned(m[3].str(), st.line, "SIG_VALTYPE_"));

    for (auto& pm : pending) {
        if (message_key(pm.msg.id, pm.msg.extended) != key)
            continue;
        if (pm.dropped)
            return;
        for (auto& sig : pm.msg.signals) {
            if (sig.name != name)
                continue;
            if (type == 0) {
                sig.value_type = ValueType::Integer;
            } else if (type == 1) {
                if (sig.bit_length != 32)
                    throw MalformedCatalog(st.line, "SIG_VALTYPE_", "float32 signal " + name + " must be 32 bits");
                sig.value_type = ValueType::Float32;
            } else if (type == 2) {
                if (sig.bit_length != 64)
                    throw MalformedCatalog(st.line, "SIG_VALTYPE_", "float64 signal " + name + " must be 64 bits");
                sig.value_type = ValueType::Float64;
            } else {
                throw MalformedCatalog(st.line, "SIG_VALTYPE_", "unknown value type " + m[3].str());
            }
            return;
        }
    }
    throw MalformedCatalog(st.line, "SIG_VALTYPE_", "unknown signal " + name);
}

// Marks each signal's bits; a bit already owned by another signal is an overlap
void mark_bits(const PendingMessage& pm, size_t sig_index, std::vector<int>& owner) {
    const Signal& sig = pm.msg.signals[sig_index];
    for (int bit : utils::field_bit_positions(sig.start_bit, sig.bit_length, sig.endianness)) {
        int& slot = owner[static_cast<size_t>(bit)];
        if (slot >= 0) {
            const Signal& other = pm.msg.signals[static_cast<size_t>(slot)];
            throw MalformedCatalog(pm.signal_lines[sig_index], "SG_",
                "signal " + sig.name + " overlaps " + other.name + " in message " + pm.msg.name);
        }
        slot = static_cast<int>(sig_index);
    }
}

void validate_message(PendingMessage& pm) {
    Message& msg = pm.msg;
    const size_t n_bits = static_cast<size_t>(msg.length) * 8;

    // Bit ranges and multiplexer bookkeeping
    for (size_t i = 0; i < msg.signals.size(); ++i) {
        const Signal& sig = msg.signals[i];
        const int line = pm.signal_lines[i];

        if (sig.required_bytes() > static_cast<size_t>(msg.length)) {
            throw MalformedCatalog(line, "SG_",
                "signal " + sig.name + " (" + std::to_string(sig.start_bit) + "|" +
                std::to_string(sig.bit_length) + ") exceeds " + std::to_string(msg.length) +
                "-byte message " + msg.name);
        }

        if (sig.mux_role == MuxRole::Multiplexer) {
            if (msg.mux.is_multiplexed()) {
                throw MalformedCatalog(line, "SG_", "message " + msg.name + " declares more than one multiplexer");
            }
            if (sig.value_type != ValueType::Integer) {
                throw MalformedCatalog(line, "SG_", "multiplexer " + sig.name + " must be an integer signal");
            }
            msg.mux.multiplexer = static_cast<int>(i);
        }
    }

    for (size_t i = 0; i < msg.signals.size(); ++i) {
        const Signal& sig = msg.signals[i];
        if (sig.mux_role != MuxRole::Multiplexed)
            continue;
        if (!msg.mux.is_multiplexed()) {
            throw MalformedCatalog(pm.signal_lines[i], "SG_",
                "multiplexed signal " + sig.name + " has no multiplexer in message " + msg.name);
        }
        msg.mux.groups[sig.mux_value].push_back(i);
    }

    // Overlaps: base signals among themselves, then each group against the base
    std::vector<int> base(n_bits, -1);
    for (size_t i = 0; i < msg.signals.size(); ++i) {
        if (msg.signals[i].mux_role != MuxRole::Multiplexed)
            mark_bits(pm, i, base);
    }
    for (const auto& group : msg.mux.groups) {
        std::vector<int> owner = base;
        for (size_t idx : group.second)
            mark_bits(pm, idx, owner);
    }
}

} // namespace

Catalog DbcParser::parse(const std::string& text) {
    const std::vector<Statement> statements = split_statements(text);

    std::vector<PendingMessage> pending;
    std::unordered_set<uint32_t> seen_ids;
    std::set<std::string> nodes;
    PendingMessage* current = nullptr;
    bool in_symbols = false;

    for (const auto& st : statements) {
        const std::string t = trim(st.text);
        if (t.empty())
            continue;

        // NS_ lists bare keywords on indented lines until the next statement
        if (starts_with_keyword(t, "NS_")) {
            in_symbols = true;
            continue;
        }
        if (in_symbols) {
            if (std::isspace(static_cast<unsigned char>(st.text[0])))
                continue;
            in_symbols = false;
        }

        if (starts_with_keyword(t, "SG_")) {
            if (!current) {
                throw MalformedCatalog(st.line, "SG_", "signal outside of a message definition");
            }
            if (current->dropped)
                continue;
            Signal sig = parse_signal(st);
            if (current->msg.find_signal(sig.name)) {
                throw MalformedCatalog(st.line, "SG_",
                    "duplicate signal " + sig.name + " in message " + current->msg.name);
            }
            current->msg.signals.push_back(std::move(sig));
            current->signal_lines.push_back(st.line);
            continue;
        }

        // Any other top-level statement closes the current message
        current = nullptr;

        if (starts_with_keyword(t, "BO_")) {
            PendingMessage pm = parse_message(st);
            if (!pm.dropped && !seen_ids.insert(message_key(pm.msg.id, pm.msg.extended)).second) {
                throw MalformedCatalog(st.line, "BO_", "duplicate message identifier " + std::to_string(pm.msg.id) +
                                       (pm.msg.extended ? " (extended)" : ""));
            }
            pending.push_back(std::move(pm));
            current = &pending.back();
        } else if (starts_with_keyword(t, "BU_")) {
            const size_t colon = t.find(':');
            std::istringstream names(colon == std::string::npos ? std::string() : t.substr(colon + 1));
            std::string name;
            while (names >> name)
                nodes.insert(node_or_unknown(name));
        } else if (starts_with_keyword(t, "SIG_VALTYPE_")) {
            apply_value_type(st, pending);
        }
        // CM_, BA_*, VAL_*, NS_ ... carry nothing the decoder needs
    }

    Catalog catalog;
    for (auto& pm : pending) {
        if (pm.dropped) {
            LOG_DEBUG("[DbcParser] Skipping %s (%zu orphan signals)",
                      pm.msg.name.c_str(), pm.msg.signals.size());
            continue;
        }
        validate_message(pm);

        nodes.insert(pm.msg.transmitter);
        for (const auto& sig : pm.msg.signals)
            nodes.insert(sig.receivers.begin(), sig.receivers.end());

        catalog.add(std::move(pm.msg));
    }
    catalog.nodes.assign(nodes.begin(), nodes.end());

    LOG_DEBUG("[DbcParser] Parsed %zu messages, %zu signals, %zu nodes",
              catalog.size(), catalog.signal_count(), catalog.nodes.size());
    return catalog;
}

Catalog DbcParser::load(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        throw config::ConfigurationError("[DbcParser] Cannot open DBC file: " + path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    LOG_INFO("[DbcParser] Loading DBC: %s", path.c_str());
    Catalog catalog = parse(buffer.str());
    LOG_INFO("[DbcParser] Loaded %zu messages with %zu signals",
             catalog.size(), catalog.signal_count());
    return catalog;
}

} // namespace dbc
