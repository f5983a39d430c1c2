// =============================================================================
// mirrorhub - Helper Stream Framing
// =============================================================================
// Splits the helper's socket byte streams into frames without altering a
// byte, so subscribers receive exactly what the helper sent.
//
// First socket:  [DEVICE_NAME(64, NUL padded)]
// Video socket:  [CODEC_ID(4)] [WIDTH(4)] [HEIGHT(4)]        codec meta
//                [PTS_FLAGS(8)] [LENGTH(4)] [PAYLOAD(LENGTH)] per packet
// Audio socket:  [CODEC_ID(4)]                              codec meta
//                [PTS_FLAGS(8)] [LENGTH(4)] [PAYLOAD(LENGTH)] per packet
// Control (device -> client): typed device messages
// All integers big endian. PTS_FLAGS bit 63 = config packet, bit 62 = key frame.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "mirrorhub_types.hpp"

namespace mirrorhub {

// One unit of fan-out. `data` is shared between all subscribers.
struct Frame {
    StreamKind kind = StreamKind::Video;
    std::shared_ptr<const std::vector<uint8_t>> data;
    uint64_t sequence = 0;      // per session and kind, assigned by the router
    uint64_t pts = 0;
    bool codec_meta = false;
    bool config = false;
    bool key_frame = false;

    size_t size() const { return data ? data->size() : 0; }
};

inline Frame makeFrame(StreamKind kind, std::vector<uint8_t> bytes) {
    Frame f;
    f.kind = kind;
    f.data = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    return f;
}

namespace protocol {

static constexpr size_t DEVICE_NAME_FIELD_LENGTH = 64;
static constexpr size_t VIDEO_CODEC_META_SIZE = 12;
static constexpr size_t AUDIO_CODEC_META_SIZE = 4;
static constexpr size_t FRAME_HEADER_SIZE = 12;
static constexpr uint32_t MAX_PACKET_SIZE = 32 * 1024 * 1024;

static constexpr uint64_t PACKET_FLAG_CONFIG    = 1ull << 63;
static constexpr uint64_t PACKET_FLAG_KEY_FRAME = 1ull << 62;
static constexpr uint64_t PACKET_PTS_MASK       = PACKET_FLAG_KEY_FRAME - 1;

// Audio codec id sent instead of a real codec
static constexpr uint32_t AUDIO_DISABLED_CODEC_ID = 0;
static constexpr uint32_t AUDIO_ERROR_CODEC_ID    = 1;

// Device -> client control messages
static constexpr uint8_t DEVICE_MSG_CLIPBOARD     = 0;
static constexpr uint8_t DEVICE_MSG_ACK_CLIPBOARD = 1;
static constexpr uint8_t DEVICE_MSG_UHID_OUTPUT   = 2;
static constexpr uint32_t MAX_CLIPBOARD_LENGTH    = 1 << 18;

inline uint32_t readBe32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
           (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline uint16_t readBe16(const uint8_t* p) {
    return static_cast<uint16_t>((uint16_t(p[0]) << 8) | uint16_t(p[1]));
}

inline uint64_t readBe64(const uint8_t* p) {
    return (uint64_t(readBe32(p)) << 32) | uint64_t(readBe32(p + 4));
}

inline void writeBe32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v >> 24));
    out.push_back(static_cast<uint8_t>(v >> 16));
    out.push_back(static_cast<uint8_t>(v >> 8));
    out.push_back(static_cast<uint8_t>(v));
}

inline void writeBe64(std::vector<uint8_t>& out, uint64_t v) {
    writeBe32(out, static_cast<uint32_t>(v >> 32));
    writeBe32(out, static_cast<uint32_t>(v));
}

// Device name from the 64-byte meta field (stops at the first NUL)
inline std::string parseDeviceName(const uint8_t* data, size_t len) {
    size_t n = 0;
    while (n < len && n < DEVICE_NAME_FIELD_LENGTH && data[n] != 0) n++;
    return std::string(reinterpret_cast<const char*>(data), n);
}

// "h264" -> 0x68323634
inline std::string codecIdString(uint32_t id) {
    std::string s;
    for (int shift = 24; shift >= 0; shift -= 8) {
        char c = static_cast<char>((id >> shift) & 0xFF);
        if (c != 0) s += c;
    }
    return s;
}

struct ParseResult {
    std::vector<Frame> frames;
    bool protocol_error = false;
    std::string error;
    bool stream_disabled = false;   // audio: device reported no capture
};

// Video/audio stream splitter. The first frame out is the codec meta.
class MediaStreamParser {
public:
    explicit MediaStreamParser(StreamKind kind) : kind_(kind) {}

    ParseResult feed(const uint8_t* data, size_t len) {
        ParseResult result;
        if (failed_) {
            result.protocol_error = true;
            result.error = error_;
            return result;
        }
        buffer_.insert(buffer_.end(), data, data + len);

        size_t pos = 0;
        if (!meta_seen_) {
            size_t meta_size = kind_ == StreamKind::Video ? VIDEO_CODEC_META_SIZE
                                                          : AUDIO_CODEC_META_SIZE;
            if (buffer_.size() < meta_size) return result;

            codec_id_ = readBe32(buffer_.data());
            if (kind_ == StreamKind::Video) {
                width_ = readBe32(buffer_.data() + 4);
                height_ = readBe32(buffer_.data() + 8);
            } else if (codec_id_ == AUDIO_DISABLED_CODEC_ID || codec_id_ == AUDIO_ERROR_CODEC_ID) {
                result.stream_disabled = true;
            }
            Frame meta = makeFrame(kind_, std::vector<uint8_t>(buffer_.begin(),
                                                               buffer_.begin() + meta_size));
            meta.codec_meta = true;
            result.frames.push_back(std::move(meta));
            meta_seen_ = true;
            pos = meta_size;
        }

        while (pos + FRAME_HEADER_SIZE <= buffer_.size()) {
            uint64_t pts_flags = readBe64(buffer_.data() + pos);
            uint32_t pkt_len = readBe32(buffer_.data() + pos + 8);
            if (pkt_len > MAX_PACKET_SIZE) {
                failed_ = true;
                error_ = "packet length " + std::to_string(pkt_len) + " exceeds limit";
                result.protocol_error = true;
                result.error = error_;
                buffer_.clear();
                return result;
            }
            size_t total = FRAME_HEADER_SIZE + pkt_len;
            if (pos + total > buffer_.size()) break;  // Need more data

            Frame f = makeFrame(kind_, std::vector<uint8_t>(buffer_.begin() + pos,
                                                            buffer_.begin() + pos + total));
            f.config = (pts_flags & PACKET_FLAG_CONFIG) != 0;
            f.key_frame = (pts_flags & PACKET_FLAG_KEY_FRAME) != 0;
            f.pts = f.config ? 0 : (pts_flags & PACKET_PTS_MASK);
            result.frames.push_back(std::move(f));
            pos += total;
        }

        if (pos > 0) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + pos);
        }
        return result;
    }

    bool codecMetaSeen() const { return meta_seen_; }
    uint32_t codecId() const { return codec_id_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    size_t buffered() const { return buffer_.size(); }

private:
    StreamKind kind_;
    std::vector<uint8_t> buffer_;
    bool meta_seen_ = false;
    bool failed_ = false;
    std::string error_;
    uint32_t codec_id_ = 0;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
};

// Device -> client control message splitter.
// Unknown message types cannot be delimited; the buffered bytes are passed
// through as one frame and counted as a resync.
class ControlMessageParser {
public:
    ParseResult feed(const uint8_t* data, size_t len) {
        ParseResult result;
        buffer_.insert(buffer_.end(), data, data + len);

        size_t pos = 0;
        while (pos < buffer_.size()) {
            size_t msg_len = 0;
            uint8_t type = buffer_[pos];
            size_t avail = buffer_.size() - pos;
            if (type == DEVICE_MSG_CLIPBOARD) {
                if (avail < 5) break;
                uint32_t text_len = readBe32(buffer_.data() + pos + 1);
                if (text_len > MAX_CLIPBOARD_LENGTH) {
                    msg_len = avail;
                    resyncs_++;
                } else {
                    msg_len = 5 + text_len;
                }
            } else if (type == DEVICE_MSG_ACK_CLIPBOARD) {
                msg_len = 9;
            } else if (type == DEVICE_MSG_UHID_OUTPUT) {
                if (avail < 5) break;
                msg_len = 5 + readBe16(buffer_.data() + pos + 3);
            } else {
                msg_len = avail;
                resyncs_++;
            }
            if (msg_len > avail) break;  // Need more data

            result.frames.push_back(makeFrame(StreamKind::Control,
                std::vector<uint8_t>(buffer_.begin() + pos, buffer_.begin() + pos + msg_len)));
            pos += msg_len;
        }

        if (pos > 0) {
            buffer_.erase(buffer_.begin(), buffer_.begin() + pos);
        }
        return result;
    }

    int resyncs() const { return resyncs_; }
    size_t buffered() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
    int resyncs_ = 0;
};

} // namespace protocol
} // namespace mirrorhub
