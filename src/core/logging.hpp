#pragma once

#include <string>

/// Install the default spdlog logger: coloured stderr plus, when file_path
/// is non-empty, an append-mode file sink. Unknown level names fall back to info.
/// Returns false when the file sink could not be opened (console logging
/// still works in that case).
bool setup_logging(const std::string& level, const std::string& file_path = "");
