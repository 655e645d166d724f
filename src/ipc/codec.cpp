#include "codec.hpp"

#include <array>
#include <utility>

namespace mcpmux::ipc
{

// ─── Big-endian helpers ──────────────────────────────────────────────────────

static void write_u32_be(std::vector<uint8_t>& buf, uint32_t v)
{
    buf.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint32_t read_frame_length(const uint8_t* p)
{
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

// ─── Type names ──────────────────────────────────────────────────────────────

static constexpr std::array<std::string_view, 7> TYPE_NAMES = {
    "mcp",
    "hello",
    "helloAck",
    "heartbeat",
    "ownerChanged",
    "goodbye",
    "error",
};

std::string_view envelope_type_name(EnvelopeType type)
{
    auto idx = static_cast<size_t>(type);
    if (idx < TYPE_NAMES.size())
        return TYPE_NAMES[idx];
    return "unknown";
}

std::optional<EnvelopeType> parse_envelope_type(std::string_view name)
{
    for (size_t i = 0; i < TYPE_NAMES.size(); ++i)
    {
        if (TYPE_NAMES[i] == name)
            return static_cast<EnvelopeType>(i);
    }
    return std::nullopt;
}

// ─── Envelope -> JSON ────────────────────────────────────────────────────────

namespace
{

void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& v)
{
    if (v)
        j[key] = *v;
}

struct ToJson
{
    nlohmann::json& j;

    void operator()(const McpPayload& p) const { j["payload"] = p.message; }

    void operator()(const HelloPayload& p) const
    {
        put_optional(j, "clientId", p.client_id);
        put_optional(j, "sharedSecret", p.shared_secret);
    }

    void operator()(const HelloAckPayload& p) const
    {
        j["sessionId"] = p.session_id;
        j["isOwner"]   = p.is_owner;
    }

    void operator()(const HeartbeatPayload& p) const { put_optional(j, "sessionId", p.session_id); }

    void operator()(const OwnerChangedPayload& p) const { j["ownerSessionId"] = p.owner_session_id; }

    void operator()(const GoodbyePayload& p) const { put_optional(j, "sessionId", p.session_id); }

    void operator()(const ErrorPayload& p) const { j["message"] = p.message; }
};

// Optional string field: absent or null -> nullopt, string -> value, anything
// else -> invalid.
bool get_optional(const nlohmann::json& j, const char* key, std::optional<std::string>& out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

bool get_required(const nlohmann::json& j, const char* key, std::string& out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

}   // namespace

nlohmann::json envelope_to_json(const Envelope& env)
{
    nlohmann::json j = nlohmann::json::object();
    j["type"]        = envelope_type_name(envelope_type(env));
    std::visit(ToJson{j}, env);
    return j;
}

// ─── JSON -> Envelope ────────────────────────────────────────────────────────

std::optional<Envelope> envelope_from_json(const nlohmann::json& j)
{
    if (!j.is_object())
        return std::nullopt;

    auto type_it = j.find("type");
    if (type_it == j.end() || !type_it->is_string())
        return std::nullopt;

    auto type = parse_envelope_type(type_it->get_ref<const std::string&>());
    if (!type)
        return std::nullopt;

    switch (*type)
    {
        case EnvelopeType::MCP:
        {
            auto it = j.find("payload");
            if (it == j.end())
                return std::nullopt;
            return McpPayload{*it};
        }
        case EnvelopeType::HELLO:
        {
            HelloPayload p;
            if (!get_optional(j, "clientId", p.client_id)
                || !get_optional(j, "sharedSecret", p.shared_secret))
                return std::nullopt;
            return p;
        }
        case EnvelopeType::HELLO_ACK:
        {
            HelloAckPayload p;
            if (!get_required(j, "sessionId", p.session_id))
                return std::nullopt;
            auto it = j.find("isOwner");
            if (it == j.end() || !it->is_boolean())
                return std::nullopt;
            p.is_owner = it->get<bool>();
            return p;
        }
        case EnvelopeType::HEARTBEAT:
        {
            HeartbeatPayload p;
            if (!get_optional(j, "sessionId", p.session_id))
                return std::nullopt;
            return p;
        }
        case EnvelopeType::OWNER_CHANGED:
        {
            OwnerChangedPayload p;
            if (!get_required(j, "ownerSessionId", p.owner_session_id))
                return std::nullopt;
            return p;
        }
        case EnvelopeType::GOODBYE:
        {
            GoodbyePayload p;
            if (!get_optional(j, "sessionId", p.session_id))
                return std::nullopt;
            return p;
        }
        case EnvelopeType::ERROR:
        {
            ErrorPayload p;
            if (!get_required(j, "message", p.message))
                return std::nullopt;
            return p;
        }
    }
    return std::nullopt;
}

// ─── Frame encode ────────────────────────────────────────────────────────────

void encode_frame(const Envelope& env, std::vector<uint8_t>& out)
{
    // Invalid UTF-8 in string values is replaced rather than thrown on.
    std::string body =
        envelope_to_json(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    out.reserve(out.size() + FRAME_HEADER_SIZE + body.size());
    write_u32_be(out, static_cast<uint32_t>(body.size()));
    out.insert(out.end(), body.begin(), body.end());
}

std::vector<uint8_t> encode_frame(const Envelope& env)
{
    std::vector<uint8_t> out;
    encode_frame(env, out);
    return out;
}

// ─── FrameDecoder ────────────────────────────────────────────────────────────

std::vector<Envelope> FrameDecoder::push(std::span<const uint8_t> chunk)
{
    std::vector<Envelope> out;
    if (failed_)
        return out;

    buf_.insert(buf_.end(), chunk.begin(), chunk.end());

    size_t pos = 0;
    while (buf_.size() - pos >= FRAME_HEADER_SIZE)
    {
        uint32_t len = read_frame_length(buf_.data() + pos);
        if (len > MAX_FRAME_SIZE)
        {
            failed_ = true;
            buf_.clear();
            return out;
        }
        if (buf_.size() - pos - FRAME_HEADER_SIZE < len)
            break;   // incomplete frame

        const uint8_t* body = buf_.data() + pos + FRAME_HEADER_SIZE;
        pos += FRAME_HEADER_SIZE + len;

        auto parsed = nlohmann::json::parse(body, body + len, nullptr, false);
        if (parsed.is_discarded())
        {
            ++dropped_;
            continue;
        }

        auto env = envelope_from_json(parsed);
        if (!env)
        {
            ++dropped_;
            continue;
        }
        out.push_back(std::move(*env));
    }

    if (pos > 0)
        buf_.erase(buf_.begin(), buf_.begin() + static_cast<std::ptrdiff_t>(pos));

    return out;
}

void FrameDecoder::reset()
{
    buf_.clear();
    dropped_ = 0;
    failed_  = false;
}

}   // namespace mcpmux::ipc
