//
//  tonie_header.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tonie_header.hpp"

#include <string>

#include "byte_io.hpp"
#include "logging.hpp"

namespace tonieforge {

namespace {

enum WireType : uint8_t {
    kWireVarint = 0,
    kWireFixed64 = 1,
    kWireLengthDelimited = 2,
    kWireFixed32 = 5,
};

enum FieldNumber : uint32_t {
    kFieldHash = 1,
    kFieldAudioLength = 2,
    kFieldAudioId = 3,
    kFieldAudioChapters = 4,
    kFieldPadding = 5,
};

void write_tag(std::vector<uint8_t> &p, uint32_t field, WireType type) {
    write_varint(p, (uint64_t(field) << 3) | type);
}

// Varint stretched to `width` bytes with continuation bits; decoders read it unchanged.
void write_varint_width(std::vector<uint8_t> &p, uint64_t v, size_t width) {
    for (size_t i = 0; i + 1 < width; ++i) {
        p.push_back(static_cast<uint8_t>((v & 0x7F) | 0x80));
        v >>= 7;
    }
    p.push_back(static_cast<uint8_t>(v & 0x7F));
}

TonieStatus corrupt(const std::string &msg) {
    TF_LOG("error", "corrupt header: " << msg);
    return make_error(ErrorKind::CorruptHeader, "corrupt header: " + msg);
}

}  // namespace

TonieResult<std::vector<uint8_t>> encode_tonie_header(const std::vector<uint8_t> &hash,
                                                      int32_t audio_length, uint32_t audio_id,
                                                      const std::vector<uint32_t> &chapters) {
    if (hash.size() != kHashSize) {
        TF_LOG("error", "header hash must be " << kHashSize << " bytes, got " << hash.size());
        return make_error(ErrorKind::InvalidArgument,
                          "header hash must be 20 bytes, got " + std::to_string(hash.size()));
    }
    if (audio_length < 0) {
        TF_LOG("error", "negative audio length " << audio_length);
        return make_error(ErrorKind::InvalidArgument, "negative audio length");
    }
    for (size_t i = 1; i < chapters.size(); ++i) {
        if (chapters[i] <= chapters[i - 1]) {
            TF_LOG("error", "chapter " << i << " (" << chapters[i]
                                       << ") does not follow " << chapters[i - 1]);
            return make_error(ErrorKind::InvalidArgument,
                              "chapters must be strictly increasing");
        }
    }

    std::vector<uint8_t> msg;
    write_tag(msg, kFieldHash, kWireLengthDelimited);
    write_varint(msg, hash.size());
    msg.insert(msg.end(), hash.begin(), hash.end());

    write_tag(msg, kFieldAudioLength, kWireVarint);
    write_varint(msg, static_cast<uint64_t>(audio_length));

    write_tag(msg, kFieldAudioId, kWireVarint);
    write_varint(msg, audio_id);

    if (!chapters.empty()) {
        std::vector<uint8_t> packed;
        for (uint32_t c : chapters) {
            write_varint(packed, c);
        }
        write_tag(msg, kFieldAudioChapters, kWireLengthDelimited);
        write_varint(msg, packed.size());
        msg.insert(msg.end(), packed.begin(), packed.end());
    }

    // Padding field: tag byte, length varint, zero bytes. Fills the message to 0xFFC.
    const size_t tag_size = 1;
    if (msg.size() + tag_size + 1 > kHeaderPayloadSize) {
        TF_LOG("error", "header message of " << msg.size() << " bytes does not fit");
        return make_error(ErrorKind::InvalidArgument, "header fields exceed 0xFFC bytes");
    }
    const size_t remaining = kHeaderPayloadSize - msg.size() - tag_size;
    const size_t len_width = varint_size(remaining);
    if (remaining < len_width) {
        return make_error(ErrorKind::InvalidArgument, "header fields exceed 0xFFC bytes");
    }
    const size_t padding = remaining - len_width;
    write_tag(msg, kFieldPadding, kWireLengthDelimited);
    write_varint_width(msg, padding, len_width);
    msg.insert(msg.end(), padding, 0);
    TF_ENSURE(msg.size() == kHeaderPayloadSize, "header message is " << msg.size() << " bytes");

    std::vector<uint8_t> out;
    out.reserve(kHeaderRegionSize);
    write_u32_be(out, kHeaderPayloadSize);
    out.insert(out.end(), msg.begin(), msg.end());
    TF_LOG("header", "encoded header: audio id 0x" << std::hex << audio_id << std::dec << ", "
                                                    << chapters.size() << " chapters, "
                                                    << audio_length << " audio bytes, hash "
                                                    << hex_prefix(hash));
    return out;
}

TonieResult<std::vector<uint8_t>> encode_tonie_header(const TonieHeader &header) {
    return encode_tonie_header(header.hash, header.audio_length, header.audio_id,
                               header.audio_chapters);
}

TonieResult<TonieHeader> decode_tonie_header(const std::vector<uint8_t> &bytes) {
    if (bytes.size() < kHeaderRegionSize) {
        return corrupt("header region is " + std::to_string(bytes.size()) + " bytes");
    }
    const uint32_t declared = read_u32_be(bytes.data());
    if (declared != kHeaderPayloadSize) {
        return corrupt("declared header length " + std::to_string(declared) + ", expected " +
                       std::to_string(kHeaderPayloadSize));
    }

    TonieHeader header;
    bool have_hash = false;
    size_t pos = 4;
    const size_t end = 4 + kHeaderPayloadSize;
    while (pos < end) {
        auto key = read_varint(bytes, pos, end);
        if (!key) {
            return corrupt("truncated field key");
        }
        const uint64_t field = *key >> 3;
        const uint8_t type = static_cast<uint8_t>(*key & 0x7);

        if (type == kWireVarint) {
            auto v = read_varint(bytes, pos, end);
            if (!v) {
                return corrupt("truncated varint in field " + std::to_string(field));
            }
            if (field == kFieldAudioLength) {
                header.audio_length = static_cast<int32_t>(*v);
            } else if (field == kFieldAudioId) {
                header.audio_id = static_cast<uint32_t>(*v);
            } else if (field == kFieldAudioChapters) {
                header.audio_chapters.push_back(static_cast<uint32_t>(*v));
            }
        } else if (type == kWireLengthDelimited) {
            auto len = read_varint(bytes, pos, end);
            if (!len || *len > end - pos) {
                return corrupt("field " + std::to_string(field) + " overruns the header");
            }
            const size_t field_end = pos + static_cast<size_t>(*len);
            if (field == kFieldHash) {
                header.hash.assign(bytes.begin() + pos, bytes.begin() + field_end);
                have_hash = true;
            } else if (field == kFieldPadding) {
                header.padding.assign(bytes.begin() + pos, bytes.begin() + field_end);
            } else if (field == kFieldAudioChapters) {
                size_t cpos = pos;
                while (cpos < field_end) {
                    auto c = read_varint(bytes, cpos, field_end);
                    if (!c) {
                        return corrupt("truncated packed chapter list");
                    }
                    header.audio_chapters.push_back(static_cast<uint32_t>(*c));
                }
            }
            pos = field_end;
        } else if (type == kWireFixed64 || type == kWireFixed32) {
            const size_t width = type == kWireFixed64 ? 8 : 4;
            if (width > end - pos) {
                return corrupt("fixed field " + std::to_string(field) + " overruns the header");
            }
            pos += width;
        } else {
            return corrupt("unsupported wire type " + std::to_string(type));
        }
    }

    if (!have_hash || header.hash.size() != kHashSize) {
        return corrupt("missing or malformed hash");
    }
    TF_LOG("header", "decoded header: audio id 0x" << std::hex << header.audio_id << std::dec
                                                    << ", " << header.audio_chapters.size()
                                                    << " chapters, " << header.audio_length
                                                    << " audio bytes");
    return header;
}

}  // namespace tonieforge
