#include "Plotline/graph/graph_types.hpp"

namespace Plotline::graph {

const char* toString(NodeType type) {
  switch (type) {
  case NodeType::Chapter:
    return "chapter";
  case NodeType::Scene:
    return "scene";
  case NodeType::Beat:
    return "beat";
  case NodeType::Dialogue:
    return "dialogue";
  case NodeType::Manga:
    return "manga";
  }
  return "scene";
}

const char* toString(EdgeType type) {
  switch (type) {
  case EdgeType::Causal:
    return "causal";
  case EdgeType::Temporal:
    return "temporal";
  case EdgeType::Parallel:
    return "parallel";
  }
  return "causal";
}

const char* toString(LineStyle style) {
  switch (style) {
  case LineStyle::Solid:
    return "solid";
  case LineStyle::Dashed:
    return "dashed";
  case LineStyle::Dotted:
    return "dotted";
  }
  return "solid";
}

std::optional<NodeType> parseNodeType(std::string_view name) {
  if (name == "chapter")
    return NodeType::Chapter;
  if (name == "scene")
    return NodeType::Scene;
  if (name == "beat")
    return NodeType::Beat;
  if (name == "dialogue")
    return NodeType::Dialogue;
  if (name == "manga")
    return NodeType::Manga;
  return std::nullopt;
}

std::optional<EdgeType> parseEdgeType(std::string_view name) {
  if (name == "causal")
    return EdgeType::Causal;
  if (name == "temporal")
    return EdgeType::Temporal;
  if (name == "parallel")
    return EdgeType::Parallel;
  return std::nullopt;
}

std::optional<LineStyle> parseLineStyle(std::string_view name) {
  if (name == "solid")
    return LineStyle::Solid;
  if (name == "dashed")
    return LineStyle::Dashed;
  if (name == "dotted")
    return LineStyle::Dotted;
  return std::nullopt;
}

} // namespace Plotline::graph
