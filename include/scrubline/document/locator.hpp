#pragma once

#include <json/json.h>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scrubline::document {

/// One step from a parent node to a child: an object key or an array index.
using PathStep = std::variant<std::string, Json::ArrayIndex>;

struct NodePath {
  std::vector<PathStep> steps;

  [[nodiscard]] NodePath child(PathStep step) const;
  /// `$.requestBody.messages`, `$[0].messages`, ...
  [[nodiscard]] std::string to_string() const;
};

/// Receives every object node of a document.
class INodeVisitor {
public:
  virtual ~INodeVisitor() = default;

  /// Return true to stop the walk.
  virtual bool visit_object(const Json::Value &node, const NodePath &path) = 0;
};

/// Depth-first, left-to-right walk over the object nodes of `root`, descending
/// through object members in source order and array elements by index.
/// Returns true if a visitor call stopped the walk.
bool walk_objects(const Json::Value &root, INodeVisitor &visitor);

/// True when `node[key]` is an array whose elements are all objects.
[[nodiscard]] bool has_object_list(const Json::Value &node, const std::string &key);

struct LocatorOptions {
  std::string messages_key = "messages";
};

struct MessageList {
  // Non-owning; points into the searched document.
  const Json::Value *messages = nullptr;
  NodePath path;

  [[nodiscard]] std::size_t size() const { return messages == nullptr ? 0 : messages->size(); }
};

/// First list of message objects in `document`, or nullopt.
[[nodiscard]] std::optional<MessageList> locate_messages(const Json::Value &document,
                                                         const LocatorOptions &options = {});

/// The node at `path`, or nullptr when the document does not have it.
[[nodiscard]] Json::Value *resolve_path(Json::Value &root, const NodePath &path);

} // namespace scrubline::document
