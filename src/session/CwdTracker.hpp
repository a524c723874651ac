#ifndef __TT_CWD_TRACKER__
#define __TT_CWD_TRACKER__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Watches a shell's output for working-directory reports.
 *
 * Shells announce their cwd with `ESC ] 7 ; file://host/path` terminated by
 * BEL or `ESC \`. A sequence may be split across any number of chunks.
 */
class CwdTracker {
 public:
  CwdTracker();

  /**
   * @brief Feeds one chunk of output.
   * @return The last directory completed inside the chunk, if any.
   */
  optional<string> scan(const string& chunk);

  /** @brief Drops any partially received sequence. */
  void reset();

  /**
   * @brief Extracts the path from an OSC body such as
   * `7;file://host/home/user`. Returns nullopt for other OSC commands.
   */
  static optional<string> parsePayload(const string& payload);

  /** @brief Decodes `%XX` escapes, leaving malformed ones as they are. */
  static string percentDecode(const string& s);

 protected:
  enum class ScanState { GROUND, ESCAPE, OSC, OSC_ESCAPE };

  ScanState state;
  /** @brief Body of the OSC sequence being received. */
  string payload;
};
}  // namespace tt

#endif  // __TT_CWD_TRACKER__
