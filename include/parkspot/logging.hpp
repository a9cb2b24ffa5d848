#pragma once
// Qt message handler: "time - LEVEL - message" to stderr and, once configured, to the log file.

#include <QtGlobal>
#include <string>

namespace parkspot {
namespace logging {

// stderr only, INFO and above
void installDefault();

// Adds the log file and applies the level. Returns false (stderr logging stays active)
// when the file cannot be opened.
bool install(const std::string& level, const std::string& file_path, std::string* err = nullptr);

// Flushes and closes the log file, restores stderr-only logging.
void uninstall();

// "DEBUG" / "INFO" / "WARNING" / "ERROR"; false for anything else
bool parseLevel(const std::string& level, QtMsgType& out);

} // namespace logging
} // namespace parkspot
