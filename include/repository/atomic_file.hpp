#ifndef FEEDSTORE_ATOMIC_FILE_HPP
#define FEEDSTORE_ATOMIC_FILE_HPP

#include <filesystem>
#include <fstream>
#include <string>
#include "repository/byte_stream.hpp"

namespace feedstore::repository {

// Write-to-temp-then-publish helper.
//
// Content is streamed into a temporary file beside the target,
// ".tmp-<16 hex chars>", and renamed onto the target by commit().
// Readers of the target see either the old file or the complete new one.
// Destroying an uncommitted AtomicFile discards the temporary and leaves
// the target untouched.
class AtomicFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates the temporary file; the target's directory must exist
  explicit AtomicFile(const std::filesystem::path& target);
  ~AtomicFile();

  AtomicFile(const AtomicFile&) = delete;
  AtomicFile& operator=(const AtomicFile&) = delete;


  // ---- WRITE OPERATIONS ----
  void append(const Bytes& chunk);
  // Closes the temporary and renames it onto the target
  void commit();


  // ---- QUERY OPERATIONS ----
  bool committed() const { return committed_; }
  const std::filesystem::path& target() const { return target_; }
  const std::filesystem::path& temporary_path() const { return temp_path_; }

  // True for names produced by temporary_path_for()
  static bool is_temporary_name(const std::string& name);
  static std::filesystem::path temporary_path_for(const std::filesystem::path& target);

private:
  // ---- PARAMETERS ----
  std::filesystem::path target_;
  std::filesystem::path temp_path_;
  std::ofstream file_;
  bool committed_;

  void discard();
};

} // namespace feedstore::repository

#endif // FEEDSTORE_ATOMIC_FILE_HPP
