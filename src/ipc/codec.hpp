#pragma once

#include "envelope.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace mcpmux::ipc
{

// ─── Envelope <-> JSON ───────────────────────────────────────────────────────

nlohmann::json envelope_to_json(const Envelope& env);

// Returns std::nullopt if the object has no known "type" or a required field
// is missing or has the wrong JSON type.
std::optional<Envelope> envelope_from_json(const nlohmann::json& j);

// ─── Frame serialization ─────────────────────────────────────────────────────

// Encode one envelope as [len BE][json] (appended to `out`).
void encode_frame(const Envelope& env, std::vector<uint8_t>& out);

// Encode one envelope into a fresh buffer.
std::vector<uint8_t> encode_frame(const Envelope& env);

// Read the 4-byte big-endian length prefix. Caller guarantees 4 bytes.
uint32_t read_frame_length(const uint8_t* p);

// ─── FrameDecoder ────────────────────────────────────────────────────────────
// Incremental decoder. Bytes may arrive split or merged arbitrarily; every
// complete frame is emitted in stream order. A frame whose JSON fails to
// parse (or is not a valid envelope) is dropped and decoding continues at
// the next frame boundary. A length prefix above MAX_FRAME_SIZE cannot be
// resynchronised and puts the decoder into the failed state.

class FrameDecoder
{
   public:
    FrameDecoder() = default;

    // Feed a chunk. Returns the envelopes completed by this chunk.
    std::vector<Envelope> push(std::span<const uint8_t> chunk);

    bool   failed() const { return failed_; }
    size_t buffered() const { return buf_.size(); }
    size_t dropped_frames() const { return dropped_; }

    void reset();

   private:
    std::vector<uint8_t> buf_;
    size_t               dropped_ = 0;
    bool                 failed_  = false;
};

}   // namespace mcpmux::ipc
