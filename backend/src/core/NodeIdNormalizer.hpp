#pragma once
#include <string>
#include <vector>

struct NamespaceBinding {
    std::string prefix;   // "srs-kg"
    std::string base;     // "http://srs4autism.com/schema/"
};

/*
  Brings node identifiers from the telemetry source and the knowledge
  graph into one canonical "prefix:local" form:
    http://srs4autism.com/schema/word-cat   -> srs-kg:word-cat
    http://srs4autism.com/instance/gp-A1-1  -> srs-inst:gp-A1-1
    word-cat                                -> srs-kg:word-cat
    srs-inst:gp-A1-1                        -> unchanged
  Local names are percent-decoded unless the escapes do not spell valid
  UTF-8, in which case the name is kept as written. IRIs outside the
  known namespaces pass through unchanged.
*/
class NodeIdNormalizer {
public:
    NodeIdNormalizer();
    explicit NodeIdNormalizer(std::vector<NamespaceBinding> namespaces);

    std::string normalize(const std::string& raw) const;

    const std::vector<NamespaceBinding>& namespaces() const { return bindings; }

    static std::vector<NamespaceBinding> defaultNamespaces();
    static std::string percentDecode(const std::string& text);
    static bool isValidUtf8(const std::string& text);

private:
    std::vector<NamespaceBinding> bindings;   // first entry is the default for bare names
};
