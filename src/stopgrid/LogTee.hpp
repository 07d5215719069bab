#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace stopgrid {

// RAII helper that copies std::cout / std::cerr output into a log file.
//
// The CLI reports everything through stdout/stderr; --log keeps a timestamped
// copy for batch runs. Console output is unchanged unless mirrorStdout is off.
//
// Rotation: <log> -> <log>.1 -> <log>.2 ... up to keepFiles.

struct LogTeeOptions {
  std::filesystem::path path;

  // Rotated backups to keep. 0 truncates the existing file instead.
  int keepFiles = 3;

  bool teeStdout = true;
  bool teeStderr = true;

  // When false, stdout goes to the log file only (stderr always reaches the console).
  bool mirrorStdout = true;

  // Prefix each log-file line with a UTC timestamp and a stream tag:
  //   2026-03-02T08:15:00.123Z [OUT] nearest stop: 103.2 m
  bool prefixLines = true;
};

class LogTee {
public:
  LogTee();
  ~LogTee();

  LogTee(const LogTee&) = delete;
  LogTee& operator=(const LogTee&) = delete;

  // Start logging (stops a previous session first).
  bool start(const LogTeeOptions& opt, std::string& outError);

  // Restore the original stream buffers and close the file.
  void stop();

  bool active() const { return m_impl != nullptr; }
  const std::filesystem::path& path() const;

  static bool Rotate(const std::filesystem::path& basePath, int keepFiles, std::string& outError);

  // "YYYY-MM-DDTHH:MM:SS.mmmZ"
  static std::string TimestampUtcNow();

private:
  struct Impl;
  std::unique_ptr<Impl> m_impl;
};

} // namespace stopgrid
