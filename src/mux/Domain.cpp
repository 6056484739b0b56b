#include "Domain.hpp"

namespace muxcore {
namespace {
std::atomic<DomainId> nextDomainId(0);

string defaultShell() {
  const char* shell = ::getenv("SHELL");
  if (shell != NULL && shell[0] != '\0') {
    return string(shell);
  }
#ifndef WIN32
  struct passwd* pwd = ::getpwuid(::getuid());
  if (pwd != NULL && pwd->pw_shell != NULL) {
    return string(pwd->pw_shell);
  }
#endif
  return "/bin/sh";
}
}  // namespace

string SpawnCommand::commandLine() const {
  string line;
  for (const auto& arg : args) {
    if (!line.empty()) {
      line.append(" ");
    }
    if (arg.find(' ') != string::npos) {
      line.append("\"" + arg + "\"");
    } else {
      line.append(arg);
    }
  }
  return line;
}

Domain::Domain(const string& _name) : id(allocDomainId()), name(_name) {}

DomainId Domain::allocDomainId() { return nextDomainId.fetch_add(1); }

json Domain::toJson() {
  json domain;
  domain["id"] = id;
  domain["name"] = name;
  domain["label"] = domainLabel();
  domain["spawnable"] = spawnable();
  domain["state"] = state() == DomainState::ATTACHED ? "attached" : "detached";
  return domain;
}

LocalDomain::LocalDomain(const string& _name) : Domain(_name) {}

shared_ptr<Pane> LocalDomain::spawnPane(const SpawnCommand& command) {
  PaneId paneId = newUuid();
  string commandLine = command.commandLine();
  string program = command.args.empty() ? "" : command.args.front();
  if (commandLine.empty()) {
    commandLine = defaultShell();
    program = commandLine;
  }
  string title = fs::path(program).filename().string();
  string description = "\"" + commandLine + "\" in domain \"" + name + "\"";

  map<string, string> environment = command.environment;
  environment["MUXCORE_PANE"] = paneId;
  if (!command.cwd.empty()) {
    std::error_code ec;
    if (!fs::is_directory(command.cwd, ec)) {
      LOG(WARNING) << "Directory " << command.cwd
                   << " is not readable and will not be used for the command "
                      "we are spawning";
    } else {
      environment["PWD"] = command.cwd;
    }
  }

  VLOG(1) << "spawned: " << description;
  return make_shared<Pane>(paneId, id, description, environment, title);
}

void LocalDomain::detach() {
  throw std::runtime_error("detach not implemented for LocalDomain");
}

}  // namespace muxcore
