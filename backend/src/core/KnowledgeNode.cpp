#include "KnowledgeNode.hpp"

KnowledgeNode::KnowledgeNode(const std::string& id, const std::string& label)
    : node_id(id), display_label(label)
{
}
