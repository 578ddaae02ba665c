#include "scrubline/document/locator.hpp"

#include "scrubline/common/json_util.hpp"

#include <type_traits>

namespace scrubline::document {

namespace {

class MessageListFinder final : public INodeVisitor {
public:
  explicit MessageListFinder(const std::string &key) : key_(key) {}

  bool visit_object(const Json::Value &node, const NodePath &path) override {
    if (!has_object_list(node, key_)) {
      return false;
    }
    found_ = MessageList{.messages = &node[key_], .path = path.child(key_)};
    return true;
  }

  [[nodiscard]] const std::optional<MessageList> &found() const { return found_; }

private:
  const std::string &key_;
  std::optional<MessageList> found_;
};

bool walk_node(const Json::Value &node, const NodePath &path, INodeVisitor &visitor) {
  if (node.isObject()) {
    if (visitor.visit_object(node, path)) {
      return true;
    }
    for (const auto &name : common::json_member_names(node)) {
      const Json::Value &child = node[name];
      if ((child.isObject() || child.isArray()) && walk_node(child, path.child(name), visitor)) {
        return true;
      }
    }
    return false;
  }
  if (node.isArray()) {
    for (Json::ArrayIndex i = 0; i < node.size(); ++i) {
      const Json::Value &child = node[i];
      if ((child.isObject() || child.isArray()) && walk_node(child, path.child(i), visitor)) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

NodePath NodePath::child(PathStep step) const {
  NodePath next = *this;
  next.steps.push_back(std::move(step));
  return next;
}

std::string NodePath::to_string() const {
  std::string out = "$";
  for (const auto &step : steps) {
    std::visit(
        [&out](const auto &value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::string>) {
            out += ".";
            out += value;
          } else {
            out += "[" + std::to_string(value) + "]";
          }
        },
        step);
  }
  return out;
}

bool walk_objects(const Json::Value &root, INodeVisitor &visitor) {
  return walk_node(root, NodePath{}, visitor);
}

bool has_object_list(const Json::Value &node, const std::string &key) {
  if (!node.isObject() || !node.isMember(key)) {
    return false;
  }
  const Json::Value &list = node[key];
  if (!list.isArray()) {
    return false;
  }
  for (const auto &element : list) {
    if (!element.isObject()) {
      return false;
    }
  }
  return true;
}

std::optional<MessageList> locate_messages(const Json::Value &document,
                                           const LocatorOptions &options) {
  MessageListFinder finder(options.messages_key);
  walk_objects(document, finder);
  return finder.found();
}

Json::Value *resolve_path(Json::Value &root, const NodePath &path) {
  Json::Value *node = &root;
  for (const auto &step : path.steps) {
    if (const auto *key = std::get_if<std::string>(&step)) {
      if (!node->isObject() || !node->isMember(*key)) {
        return nullptr;
      }
      node = &(*node)[*key];
    } else {
      const Json::ArrayIndex index = std::get<Json::ArrayIndex>(step);
      if (!node->isArray() || index >= node->size()) {
        return nullptr;
      }
      node = &(*node)[index];
    }
  }
  return node;
}

} // namespace scrubline::document
