//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Newline-delimited JSON framer (default stdio framing for MCP servers)
//========================================================================================================

#include <optional>
#include <string>

#include "logging/Logger.h"
#include "toolbridge/ContentFramer.h"

namespace toolbridge {

namespace {
class LineFramer : public IContentFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLineLength(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame; frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t start = 0;
        while (true) {
            std::size_t eol = buffer.find('\n', start);
            if (eol == std::string::npos) {
                if (buffer.size() - start > maxLineLength) {
                    LOG_WARN("Line framer: pending line exceeds {} bytes", maxLineLength);
                    return { DecodeStatus::BodyTooLarge, std::nullopt, buffer.size() };
                }
                // Blank lines seen so far can be dropped even though no frame is ready
                return { DecodeStatus::Incomplete, std::nullopt, start };
            }
            std::size_t end = eol;
            if (end > start && buffer[end - 1] == '\r') {
                --end;
            }
            if (end - start > maxLineLength) {
                LOG_WARN("Line framer: line of {} bytes exceeds {} bytes", end - start, maxLineLength);
                return { DecodeStatus::BodyTooLarge, std::nullopt, eol + 1 };
            }
            bool blank = true;
            for (std::size_t k = start; k < end; ++k) {
                char c = buffer[k];
                if (c != ' ' && c != '\t' && c != '\r') { blank = false; break; }
            }
            if (blank) {
                start = eol + 1;
                continue;
            }
            return { DecodeStatus::Ok, buffer.substr(start, end - start), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineLength;
};
} // namespace

std::unique_ptr<IContentFramer> MakeLineFramer(std::size_t maxLineLength) {
    return std::make_unique<LineFramer>(maxLineLength);
}

std::unique_ptr<IContentFramer> MakeFramer(FramingMode mode, std::size_t maxFrameBytes) {
    switch (mode) {
        case FramingMode::ContentLength: return MakeContentLengthFramer(maxFrameBytes);
        case FramingMode::Newline: break;
    }
    return MakeLineFramer(maxFrameBytes);
}

const char* toString(FramingMode mode) {
    return mode == FramingMode::ContentLength ? "content-length" : "newline";
}

std::optional<FramingMode> parseFramingMode(const std::string& s) {
    if (s.empty() || s == "newline" || s == "ndjson" || s == "line") return FramingMode::Newline;
    if (s == "content-length" || s == "Content-Length" || s == "lsp") return FramingMode::ContentLength;
    return std::nullopt;
}

} // namespace toolbridge
