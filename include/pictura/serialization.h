#pragma once

#include <pictura/backend.h>
#include <pictura/result.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace pictura {

class Picture;
struct ParsedPicture;
struct PictureOptions;

/**
 * Line based picture text form:
 *
 *   picture <width> <height>
 *   buffer <id> <r> <g> <b> <a> <hasUndoStates> <hasAlpha> <insertionPoint>
 *   <event line>*
 *   ...
 *   metadata
 *   <trailer lines>
 *
 * Lines are separated by "\n"; "\r\n" is accepted on input.
 */
std::string serializePicture(const Picture& picture);

/**
 * Build a picture from serializePicture output. Events are pushed with the
 * picture's bitmap scale. The "metadata" line and every line after it are
 * returned verbatim.
 *
 * @return MalformedSerialization for a bad header, buffer or event line
 */
Result<ParsedPicture> parsePicture(int id, std::string_view serialization, float bitmapScale,
                                   const std::vector<BackendMode>& modesToTry,
                                   int currentBufferAttachment, const PictureOptions& options);

// Split on "\n", dropping a trailing "\r" from each line
std::vector<std::string_view> splitLines(std::string_view text);

// Split on single spaces; empty tokens are dropped
std::vector<std::string_view> splitTokens(std::string_view line);

} // namespace pictura
