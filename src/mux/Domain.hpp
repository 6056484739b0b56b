#ifndef __MUXCORE_DOMAIN_HPP__
#define __MUXCORE_DOMAIN_HPP__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "Pane.hpp"

namespace muxcore {
enum class DomainState { DETACHED, ATTACHED };

/** @brief What to run in a newly spawned pane.  Empty args means the shell. */
struct SpawnCommand {
  vector<string> args;
  string cwd;
  map<string, string> environment;

  /** @brief Joins the arguments, quoting the ones containing spaces. */
  string commandLine() const;
};

/**
 * @brief A source of panes.
 *
 * The gui has its own domain, and a mux server reached over ssh or living in
 * a container would be another one.  Every pane remembers the domain that
 * spawned it.
 */
class Domain {
 public:
  explicit Domain(const string& _name);
  virtual ~Domain() {}

  /** @brief Creates a new pane running `command` inside this domain. */
  virtual shared_ptr<Pane> spawnPane(const SpawnCommand& command) = 0;

  /**
   * @brief Returns false if `spawnPane` will never succeed, e.g. for
   * placeholder domains that should not show up in launchers.
   */
  virtual bool spawnable() { return true; }

  inline DomainId domainId() const { return id; }
  /** @brief Short identifier for the domain. */
  inline const string& domainName() const { return name; }
  /** @brief Label describing the domain. */
  virtual string domainLabel() { return name; }

  /** @brief Re-attach to any tabs that might be pre-existing. */
  virtual void attach(const optional<WindowId>& windowId) = 0;
  /** @brief Detach all tabs. */
  virtual void detach() = 0;
  virtual DomainState state() = 0;

  /**
   * @brief Advises the domain that a local window is closing so it can
   * detach or hide its tabs instead of killing them.
   */
  virtual void localWindowIsClosing(const WindowId& windowId) {}

  json toJson();

  static DomainId allocDomainId();

 protected:
  DomainId id;
  string name;
};

/** @brief Spawns panes on the local machine. */
class LocalDomain : public Domain {
 public:
  explicit LocalDomain(const string& _name);

  virtual shared_ptr<Pane> spawnPane(const SpawnCommand& command);
  virtual void attach(const optional<WindowId>& windowId) {}
  virtual void detach();
  virtual DomainState state() { return DomainState::ATTACHED; }
};
}  // namespace muxcore

#endif  // __MUXCORE_DOMAIN_HPP__
