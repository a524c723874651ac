#include "PaneNode.hpp"

namespace tt {
string orientationToString(SplitOrientation orientation) {
  return orientation == SplitOrientation::HORIZONTAL ? "horizontal"
                                                     : "vertical";
}

optional<SplitOrientation> orientationFromString(const string& s) {
  if (s == "horizontal" || s == "h") {
    return SplitOrientation::HORIZONTAL;
  }
  if (s == "vertical" || s == "v") {
    return SplitOrientation::VERTICAL;
  }
  return nullopt;
}

PaneNode::PaneNode()
    : type(Type::TERMINAL),
      reattach(false),
      orientation(SplitOrientation::VERTICAL) {}

PaneNodePtr PaneNode::makeTerminal(const string& id, const string& shell,
                                   const optional<string>& distro,
                                   const optional<string>& cwd,
                                   bool reattach) {
  shared_ptr<PaneNode> node(new PaneNode());
  node->id = id;
  node->type = Type::TERMINAL;
  node->shell = shell;
  node->distro = distro;
  node->cwd = cwd;
  node->reattach = reattach;
  return node;
}

PaneNodePtr PaneNode::makeSplit(const string& id, SplitOrientation orientation,
                                const vector<PaneNodePtr>& children,
                                const vector<float>& sizes) {
  if (children.size() < 2 || children.size() != sizes.size()) {
    STFATAL << "Split " << id << " needs matching children and sizes, got "
            << children.size() << " and " << sizes.size();
  }
  shared_ptr<PaneNode> node(new PaneNode());
  node->id = id;
  node->type = Type::SPLIT;
  node->orientation = orientation;
  node->children = children;
  node->sizes = sizes;
  return node;
}

PaneNodePtr PaneNode::withCwd(const string& newCwd) const {
  shared_ptr<PaneNode> node(new PaneNode(*this));
  node->cwd = newCwd;
  return node;
}

PaneNodePtr PaneNode::withChildren(const vector<PaneNodePtr>& newChildren,
                                   const vector<float>& newSizes) const {
  return makeSplit(id, orientation, newChildren, newSizes);
}

json PaneNode::toJson() const {
  json node;
  node["id"] = id;
  if (isTerminal()) {
    node["type"] = "terminal";
    node["shell"] = shell;
    node["distro"] = distro ? json(*distro) : json(nullptr);
    node["cwd"] = cwd ? json(*cwd) : json(nullptr);
    if (reattach) {
      node["reattach"] = true;
    }
    return node;
  }
  node["type"] = "split";
  node["orientation"] = orientationToString(orientation);
  node["sizes"] = sizes;
  node["children"] = json::array();
  for (const auto& child : children) {
    node["children"].push_back(child->toJson());
  }
  return node;
}

PaneNodePtr PaneNode::fromJson(const json& j) {
  string id = j.at("id").get<string>();
  string type = j.at("type").get<string>();
  if (type == "terminal") {
    optional<string> distro;
    optional<string> cwd;
    if (j.contains("distro") && j["distro"].is_string()) {
      distro = j["distro"].get<string>();
    }
    if (j.contains("cwd") && j["cwd"].is_string()) {
      cwd = j["cwd"].get<string>();
    }
    return makeTerminal(id, j.at("shell").get<string>(), distro, cwd,
                        j.value("reattach", false));
  }
  if (type != "split") {
    throw std::runtime_error("Unknown pane node type: " + type);
  }
  auto orientation = orientationFromString(j.at("orientation").get<string>());
  if (!orientation) {
    throw std::runtime_error("Invalid orientation on split " + id);
  }
  vector<PaneNodePtr> children;
  for (const auto& child : j.at("children")) {
    children.push_back(fromJson(child));
  }
  vector<float> sizes = j.at("sizes").get<vector<float>>();
  if (children.size() < 2 || children.size() != sizes.size()) {
    throw std::runtime_error("Split " + id +
                             " needs two or more children with sizes");
  }
  return makeSplit(id, *orientation, children, sizes);
}

}  // namespace tt
