#include "Pane.hpp"

namespace muxcore {
Pane::Pane(const PaneId& _id, DomainId _domainId, const string& _description,
           const map<string, string>& _environment, const string& _title)
    : id(_id),
      domainId(_domainId),
      description(_description),
      environment(_environment),
      title(_title) {}

json Pane::toJson() const {
  json pane;
  pane["id"] = id;
  pane["domain"] = domainId;
  pane["description"] = description;
  pane["title"] = title;
  return pane;
}
}  // namespace muxcore
