#include <pictura/serialization.h>
#include <pictura/picture.h>
#include <ytrace/ytrace.hpp>
#include <charconv>
#include <chrono>

namespace pictura {

namespace {

constexpr std::string_view PICTURE_TAG = "picture";
constexpr std::string_view BUFFER_TAG = "buffer";
constexpr std::string_view METADATA_TAG = "metadata";

bool parseInt(std::string_view token, int& out) {
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
    return ec == std::errc() && ptr == token.data() + token.size();
}

bool parseFlag(std::string_view token, bool& out) {
    if (token == "0" || token == "1") {
        out = token == "1";
        return true;
    }
    return false;
}

bool parseChannel(std::string_view token, uint8_t& out) {
    int v = 0;
    if (!parseInt(token, v) || v < 0 || v > 255) return false;
    out = static_cast<uint8_t>(v);
    return true;
}

struct BufferHeader {
    int id = 0;
    Rgba clearColor;
    bool hasUndoStates = false;
    bool hasAlpha = false;
    int insertionPoint = 0;
};

bool parseBufferHeader(const std::vector<std::string_view>& tokens, BufferHeader& header) {
    return tokens.size() == 9 &&
           parseInt(tokens[1], header.id) &&
           parseChannel(tokens[2], header.clearColor.r) &&
           parseChannel(tokens[3], header.clearColor.g) &&
           parseChannel(tokens[4], header.clearColor.b) &&
           parseChannel(tokens[5], header.clearColor.a) &&
           parseFlag(tokens[6], header.hasUndoStates) &&
           parseFlag(tokens[7], header.hasAlpha) &&
           parseInt(tokens[8], header.insertionPoint) &&
           header.insertionPoint >= 0;
}

std::string malformed(size_t lineNumber, std::string_view what) {
    return "line " + std::to_string(lineNumber) + ": " + std::string(what);
}

} // namespace

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (true) {
        size_t end = text.find('\n', start);
        std::string_view line = text.substr(start, end == std::string_view::npos ? end : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (end == std::string_view::npos) break;
        start = end + 1;
    }
    return lines;
}

std::vector<std::string_view> splitTokens(std::string_view line) {
    std::vector<std::string_view> tokens;
    size_t start = 0;
    while (start <= line.size()) {
        size_t end = line.find(' ', start);
        if (end == std::string_view::npos) end = line.size();
        if (end > start) {
            tokens.push_back(line.substr(start, end - start));
        }
        start = end + 1;
    }
    return tokens;
}

std::string serializePicture(const Picture& picture) {
    std::string out = std::string(PICTURE_TAG) + " " + std::to_string(picture.width()) + " " +
                      std::to_string(picture.height());
    for (size_t i = 0; i < picture.bufferCount(); i++) {
        const auto& buffer = picture.buffer(i);
        Rgba c = buffer.clearColor();
        out += "\n";
        out += std::string(BUFFER_TAG) + " " + std::to_string(buffer.id()) + " " +
               std::to_string(c.r) + " " + std::to_string(c.g) + " " + std::to_string(c.b) + " " +
               std::to_string(c.a) + " " + (buffer.hasUndoStates() ? "1" : "0") + " " +
               (buffer.hasAlpha() ? "1" : "0") + " " + std::to_string(buffer.insertionPoint());
        for (const auto& ev : buffer.events()) {
            out += "\n";
            out += ev->serialize();
        }
    }
    return out;
}

Result<ParsedPicture> parsePicture(int id, std::string_view serialization, float bitmapScale,
                                   const std::vector<BackendMode>& modesToTry,
                                   int currentBufferAttachment, const PictureOptions& options) {
    auto startTime = std::chrono::steady_clock::now();
    auto lines = splitLines(serialization);

    auto header = splitTokens(lines.front());
    int width = 0;
    int height = 0;
    if (header.size() != 3 || header[0] != PICTURE_TAG || !parseInt(header[1], width) ||
        !parseInt(header[2], height)) {
        return Err<ParsedPicture>("Picture::parse: " + malformed(1, "expected 'picture <width> <height>'"),
                                  Error::Code::MalformedSerialization);
    }

    auto created = Picture::create(id, width, height, bitmapScale, modesToTry, currentBufferAttachment, options);
    if (!created) {
        return Err<ParsedPicture>("Picture::parse", created);
    }
    auto picture = *created;

    PictureBuffer* target = nullptr;
    size_t pendingInsertionPoint = 0;
    size_t i = 1;
    for (; i < lines.size(); i++) {
        std::string_view line = lines[i];
        if (line == METADATA_TAG) break;
        auto tokens = splitTokens(line);
        if (tokens.empty()) continue;

        if (tokens[0] == BUFFER_TAG) {
            if (target) target->setInsertionPoint(pendingInsertionPoint);
            BufferHeader bufferHeader;
            if (!parseBufferHeader(tokens, bufferHeader)) {
                return Err<ParsedPicture>("Picture::parse: " + malformed(i + 1, "bad buffer line"),
                                          Error::Code::MalformedSerialization);
            }
            auto buffer = picture->addBuffer(bufferHeader.id, bufferHeader.clearColor,
                                             bufferHeader.hasUndoStates, bufferHeader.hasAlpha);
            if (!buffer) {
                return Err<ParsedPicture>("Picture::parse", buffer);
            }
            target = *buffer;
            pendingInsertionPoint = static_cast<size_t>(bufferHeader.insertionPoint);
            continue;
        }

        if (!target) {
            return Err<ParsedPicture>("Picture::parse: " + malformed(i + 1, "event before any buffer"),
                                      Error::Code::MalformedSerialization);
        }
        auto ev = PictureEvent::parse(tokens);
        if (!ev) {
            return Err<ParsedPicture>("Picture::parse: " + malformed(i + 1, "bad event"),
                                      Error::Code::MalformedSerialization, ev);
        }
        if (auto res = picture->pushEvent(*target, *ev); !res) {
            return Err<ParsedPicture>("Picture::parse: " + malformed(i + 1, "event failed to draw"), res);
        }
    }
    if (target) target->setInsertionPoint(pendingInsertionPoint);

    ParsedPicture parsed;
    parsed.picture = picture;
    for (; i < lines.size(); i++) {
        parsed.metadata.emplace_back(lines[i]);
    }

    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - startTime;
    picture->setGenerationTime(elapsed.count());
    ydebug("Picture {}: parsed {} buffers in {:.1f} ms", id, picture->bufferCount(), elapsed.count());
    return Ok(std::move(parsed));
}

} // namespace pictura
