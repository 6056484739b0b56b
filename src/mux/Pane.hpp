#ifndef __MUXCORE_PANE_HPP__
#define __MUXCORE_PANE_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace muxcore {
typedef string WindowId;
typedef string TabId;
typedef string PaneId;
typedef int DomainId;

/**
 * @brief Leaf content unit of a tab.
 *
 * The terminal session behind a pane is owned elsewhere; the mux only tracks
 * its identity, the domain that spawned it and how it was spawned.  Panes are
 * immutable once created, so they can be shared freely between threads.
 */
class Pane {
 public:
  Pane(const PaneId& _id, DomainId _domainId, const string& _description,
       const map<string, string>& _environment = {},
       const string& _title = "");

  inline const PaneId& getId() const { return id; }
  inline DomainId getDomainId() const { return domainId; }
  /** @brief Human readable summary such as `"bash" in domain "local"`. */
  inline const string& getDescription() const { return description; }
  /** @brief Short label for tab bars, usually the program name. */
  inline const string& getTitle() const { return title; }
  /** @brief Environment the pane's command was started with. */
  inline const map<string, string>& getEnvironment() const {
    return environment;
  }

  json toJson() const;

 protected:
  PaneId id;
  DomainId domainId;
  string description;
  map<string, string> environment;
  string title;
};
}  // namespace muxcore

#endif  // __MUXCORE_PANE_HPP__
