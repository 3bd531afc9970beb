// hedl/syntax/preprocess.hpp - Input validation and normalization before parsing
//
#pragma once

#include <string_view>

#include "hedl/basic/error.hpp"
#include "hedl/basic/limits.hpp"
#include "hedl/basic/source_text.hpp"

namespace hedl::syntax
{

/**
 * Validate raw input bytes and build a line table.
 *
 * - Rejects input larger than `max_file_size` before looking at it
 * - Requires valid UTF-8 and strips a leading BOM
 * - Rejects control characters other than TAB, and bare CR
 * - Normalizes CRLF to LF
 * - Rejects lines longer than `max_line_length`
 */
[[nodiscard]] Result<SourceText> preprocess(std::string_view bytes, const Limits & limits);

/// Length of the valid UTF-8 prefix of `bytes`
[[nodiscard]] size_t valid_utf8_prefix(std::string_view bytes) noexcept;

}  // namespace hedl::syntax
