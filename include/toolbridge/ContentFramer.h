//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ContentFramer.h
// Purpose: Interface for message framing on byte-stream channels (newline or Content-Length)
//========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <memory>

namespace toolbridge {

// 4 MiB per frame; larger frames close the channel
constexpr std::size_t kDefaultMaxFrameBytes = 4u * 1024u * 1024u;

enum class FramingMode {
    Newline,        // one JSON document per '\n'-terminated line
    ContentLength   // "Content-Length: N\r\n\r\n" header followed by N bytes
};

const char* toString(FramingMode mode);
std::optional<FramingMode> parseFramingMode(const std::string& s);

class IContentFramer {
public:
    virtual ~IContentFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        InvalidHeader,
        BodyTooLarge
    };
    // bytesConsumed is always the number of leading bytes the caller should drop from its buffer,
    // whatever the status (for example blank keep-alive lines on an Incomplete result).
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

std::unique_ptr<IContentFramer> MakeContentLengthFramer(std::size_t maxContentLength = kDefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength = kDefaultMaxFrameBytes);
std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes = kDefaultMaxFrameBytes);

} // namespace toolbridge
