#ifndef __MUXCORE_MUX_ERRORS__
#define __MUXCORE_MUX_ERRORS__

#include "Headers.hpp"

namespace muxcore {
/**
 * @brief Thrown when a window, tab, pane, domain or color scheme id does not
 * exist at the time of the call.
 *
 * Callers are expected to recover from this (e.g. by re-querying the mux).
 */
class NotFoundError : public std::runtime_error {
 public:
  NotFoundError(const string& _kind, const string& _id)
      : std::runtime_error(_kind + " not found: " + _id),
        kind(_kind),
        id(_id) {}

  /** @brief The kind of object that was looked up ("window", "tab", ...). */
  inline const string& getKind() const { return kind; }
  /** @brief The id or name that could not be resolved. */
  inline const string& getId() const { return id; }

 protected:
  string kind;
  string id;
};
}  // namespace muxcore

#endif  // __MUXCORE_MUX_ERRORS__
